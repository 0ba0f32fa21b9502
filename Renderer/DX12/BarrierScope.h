#pragma once

#include <d3d12.h>
#include "ResourceStateTracker.h"
#include "../Core/RenderErrors.h"

namespace TriangleLab::Renderer
{
    // RAII helper for symmetric resource state transitions through the tracker.
    // The closing barrier is emitted even on early return/exception, so every
    // opening transition in a list has exactly one matching restore.
    class BarrierScope
    {
    public:
        // Transition from the tracked state to targetState
        BarrierScope(ResourceStateTracker& tracker,
                     ID3D12GraphicsCommandList* cmd,
                     ID3D12Resource* resource,
                     D3D12_RESOURCE_STATES targetState)
            : m_tracker(tracker)
            , m_cmd(cmd)
            , m_resource(resource)
            , m_restoreState(tracker.GetState(resource))
        {
            m_tracker.Transition(m_resource, targetState);
            m_tracker.FlushBarriers(m_cmd);
        }

        // Non-copyable, non-movable
        BarrierScope(const BarrierScope&) = delete;
        BarrierScope& operator=(const BarrierScope&) = delete;
        BarrierScope(BarrierScope&&) = delete;
        BarrierScope& operator=(BarrierScope&&) = delete;

        // Restore to the state seen at construction. A resource unregistered
        // inside the scope has no state left to restore and is skipped.
        ~BarrierScope()
        {
            if (!m_tracker.IsTracked(m_resource))
                return;

            m_tracker.Transition(m_resource, m_restoreState);
            m_tracker.FlushBarriers(m_cmd);
        }

    private:
        ResourceStateTracker& m_tracker;
        ID3D12GraphicsCommandList* m_cmd;
        ID3D12Resource* m_resource;
        D3D12_RESOURCE_STATES m_restoreState;
    };

    // Back buffer PRESENT <-> RENDER_TARGET bracket.
    // Throws OrderingViolation unless the back buffer is tracked in PRESENT.
    class BackbufferScope : public BarrierScope
    {
    public:
        BackbufferScope(ResourceStateTracker& tracker, ID3D12GraphicsCommandList* cmd, ID3D12Resource* backbuffer)
            : BarrierScope(tracker, cmd, RequirePresent(tracker, backbuffer), D3D12_RESOURCE_STATE_RENDER_TARGET)
        {
        }

    private:
        static ID3D12Resource* RequirePresent(ResourceStateTracker& tracker, ID3D12Resource* backbuffer)
        {
            if (tracker.GetState(backbuffer) != D3D12_RESOURCE_STATE_PRESENT)
                throw OrderingViolation("back buffer is not in the PRESENT state at frame start");
            return backbuffer;
        }
    };

} // namespace TriangleLab::Renderer
