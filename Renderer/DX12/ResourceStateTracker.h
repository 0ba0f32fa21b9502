#pragma once

#include <d3d12.h>
#include <unordered_map>
#include <vector>
#include <cstdint>

namespace TriangleLab::Renderer
{
    // One emitted transition barrier
    struct TransitionRecord
    {
        ID3D12Resource* resource = nullptr;
        D3D12_RESOURCE_STATES before = D3D12_RESOURCE_STATE_COMMON;
        D3D12_RESOURCE_STATES after = D3D12_RESOURCE_STATE_COMMON;
    };

    // ResourceStateTracker: SOLE authority for resource state tracking.
    // Every barrier goes through Transition() + FlushBarriers(); the tracker
    // knows the state each resource will be in once the recorded work runs.
    //
    // Whole-resource tracking only (no per-subresource states).
    // Untracked resources are an OrderingViolation, never a silent default.
    class ResourceStateTracker
    {
    public:
        ResourceStateTracker() = default;
        ~ResourceStateTracker() = default;

        ResourceStateTracker(const ResourceStateTracker&) = delete;
        ResourceStateTracker& operator=(const ResourceStateTracker&) = delete;

        // Resources this code created, with their creation state
        void Register(ID3D12Resource* resource, D3D12_RESOURCE_STATES initialState, const char* debugName = nullptr);

        // Resources owned elsewhere (swap chain back buffers): (re)states what
        // the resource is in right now
        void AssumeState(ID3D12Resource* resource, D3D12_RESOURCE_STATES state, const char* debugName = nullptr);

        void Unregister(ID3D12Resource* resource);

        // Queues a barrier from the tracked state; no-op if already in targetState
        void Transition(ID3D12Resource* resource, D3D12_RESOURCE_STATES targetState);

        // Emits the queued barriers as one ResourceBarrier call
        void FlushBarriers(ID3D12GraphicsCommandList* cmdList);

        bool HasPendingBarriers() const { return !m_pending.empty(); }

        // A recording that threw: forget queued barriers, roll their states back
        void DiscardPendingBarriers();

        D3D12_RESOURCE_STATES GetState(ID3D12Resource* resource) const;
        bool IsTracked(ID3D12Resource* resource) const { return m_entries.count(resource) != 0; }
        bool IsExternal(ID3D12Resource* resource) const;
        size_t GetTrackedCount() const { return m_entries.size(); }

        // Emitted-barrier log (off by default)
        void SetHistoryEnabled(bool enabled) { m_historyEnabled = enabled; }
        const std::vector<TransitionRecord>& GetHistory() const { return m_history; }

        // True if every logged transition A->B is closed by a later B->A on the
        // same resource
        bool IsHistoryBalanced() const;

    private:
        struct Entry
        {
            D3D12_RESOURCE_STATES state;
            const char* debugName;
            bool external;
        };

        void Track(ID3D12Resource* resource, D3D12_RESOURCE_STATES state, const char* debugName, bool external);
        Entry& Find(ID3D12Resource* resource, const char* operation);

        std::unordered_map<ID3D12Resource*, Entry> m_entries;
        std::vector<D3D12_RESOURCE_BARRIER> m_pending;
        std::vector<TransitionRecord> m_history;
        bool m_historyEnabled = false;
    };

} // namespace TriangleLab::Renderer
