#include "ResourceStateTracker.h"
#include "DiagnosticLogger.h"
#include "../Core/RenderErrors.h"
#include <string>

namespace TriangleLab::Renderer
{
    namespace
    {
        const char* NameOf(const char* debugName)
        {
            return debugName ? debugName : "unnamed";
        }
    }

    void ResourceStateTracker::Track(ID3D12Resource* resource, D3D12_RESOURCE_STATES state, const char* debugName, bool external)
    {
        if (!resource)
            throw OrderingViolation("StateTracker: cannot track a null resource");

        Entry& entry = m_entries[resource];
        entry.state = state;
        entry.debugName = debugName;
        entry.external = external;
    }

    ResourceStateTracker::Entry& ResourceStateTracker::Find(ID3D12Resource* resource, const char* operation)
    {
        auto it = m_entries.find(resource);
        if (!resource || it == m_entries.end())
            throw OrderingViolation(std::string("StateTracker: ") + operation + " on an untracked resource");
        return it->second;
    }

    void ResourceStateTracker::Register(ID3D12Resource* resource, D3D12_RESOURCE_STATES initialState, const char* debugName)
    {
        Track(resource, initialState, debugName, false);
        DiagnosticLogger::Log("StateTracker: Register %s state=0x%X\n",
            NameOf(debugName), static_cast<unsigned>(initialState));
    }

    void ResourceStateTracker::AssumeState(ID3D12Resource* resource, D3D12_RESOURCE_STATES state, const char* debugName)
    {
        // Back buffers are re-assumed every frame: keep this one quiet
        Track(resource, state, debugName, true);
    }

    void ResourceStateTracker::Unregister(ID3D12Resource* resource)
    {
        m_entries.erase(resource);

        // A queued barrier must not outlive its resource
        for (auto it = m_pending.begin(); it != m_pending.end();)
        {
            if (it->Transition.pResource == resource)
                it = m_pending.erase(it);
            else
                ++it;
        }
    }

    void ResourceStateTracker::Transition(ID3D12Resource* resource, D3D12_RESOURCE_STATES targetState)
    {
        Entry& entry = Find(resource, "Transition");
        if (entry.state == targetState)
            return;

        D3D12_RESOURCE_BARRIER barrier = {};
        barrier.Type = D3D12_RESOURCE_BARRIER_TYPE_TRANSITION;
        barrier.Flags = D3D12_RESOURCE_BARRIER_FLAG_NONE;
        barrier.Transition.pResource = resource;
        barrier.Transition.Subresource = D3D12_RESOURCE_BARRIER_ALL_SUBRESOURCES;
        barrier.Transition.StateBefore = entry.state;
        barrier.Transition.StateAfter = targetState;
        m_pending.push_back(barrier);

        entry.state = targetState;
    }

    void ResourceStateTracker::FlushBarriers(ID3D12GraphicsCommandList* cmdList)
    {
        if (m_pending.empty())
            return;

        if (!cmdList)
            throw OrderingViolation("StateTracker: flush without a command list");

        cmdList->ResourceBarrier(static_cast<UINT>(m_pending.size()), m_pending.data());

        if (m_historyEnabled)
        {
            for (const D3D12_RESOURCE_BARRIER& barrier : m_pending)
            {
                m_history.push_back(TransitionRecord{
                    barrier.Transition.pResource,
                    barrier.Transition.StateBefore,
                    barrier.Transition.StateAfter });
            }
        }

        m_pending.clear();
    }

    void ResourceStateTracker::DiscardPendingBarriers()
    {
        // Newest first, so a chain A->B->C ends back at A
        for (auto barrier = m_pending.rbegin(); barrier != m_pending.rend(); ++barrier)
        {
            auto it = m_entries.find(barrier->Transition.pResource);
            if (it != m_entries.end())
                it->second.state = barrier->Transition.StateBefore;
        }

        if (!m_pending.empty())
        {
            DiagnosticLogger::LogError("StateTracker: discarded %u queued barrier(s)\n",
                static_cast<unsigned>(m_pending.size()));
        }
        m_pending.clear();
    }

    D3D12_RESOURCE_STATES ResourceStateTracker::GetState(ID3D12Resource* resource) const
    {
        auto it = m_entries.find(resource);
        if (it == m_entries.end())
            throw OrderingViolation("StateTracker: state query on an untracked resource");
        return it->second.state;
    }

    bool ResourceStateTracker::IsExternal(ID3D12Resource* resource) const
    {
        auto it = m_entries.find(resource);
        return it != m_entries.end() && it->second.external;
    }

    bool ResourceStateTracker::IsHistoryBalanced() const
    {
        // Open transitions per resource, innermost last
        std::unordered_map<ID3D12Resource*, std::vector<TransitionRecord>> open;

        for (const TransitionRecord& record : m_history)
        {
            std::vector<TransitionRecord>& stack = open[record.resource];
            if (!stack.empty() && stack.back().before == record.after && stack.back().after == record.before)
                stack.pop_back();
            else
                stack.push_back(record);
        }

        for (const auto& entry : open)
        {
            if (!entry.second.empty())
                return false;
        }
        return true;
    }

} // namespace TriangleLab::Renderer
