#pragma once

#include <d3d12.h>
#include <wrl/client.h>
#include <cstdint>
#include "../Core/CommandListStateMachine.h"

namespace TriangleLab::Renderer
{
    // The single allocator + direct command list pair reused every frame.
    // Every state-changing call goes through the state machine first, so an
    // out-of-order call throws OrderingViolation before it reaches the runtime.
    class CommandContext
    {
    public:
        CommandContext() = default;
        ~CommandContext() = default;

        CommandContext(const CommandContext&) = delete;
        CommandContext& operator=(const CommandContext&) = delete;

        // Creates allocator + list. The list starts open, bound to initialPipeline.
        void Initialize(ID3D12Device* device, ID3D12PipelineState* initialPipeline);
        void Shutdown();

        bool IsInitialized() const { return m_commandList != nullptr; }

        // Allocator reset (requires completedFence to cover the last submission),
        // then list reset bound to pipeline
        void Reset(ID3D12PipelineState* pipeline, uint64_t completedFence);

        // The open list for the named operation; throws unless Recording
        ID3D12GraphicsCommandList* Recording(const char* operation);

        void Close();
        void Submit(ID3D12CommandQueue* queue);
        void OnFenceSignaled(uint64_t fenceValue) { m_state.OnFenceSignaled(fenceValue); }

        // Closes a list left open by a failed recording. Returns true if it did.
        bool RecoverAbandoned();

        CommandListState GetState() const { return m_state.GetState(); }

    private:
        Microsoft::WRL::ComPtr<ID3D12CommandAllocator> m_allocator;
        Microsoft::WRL::ComPtr<ID3D12GraphicsCommandList> m_commandList;
        CommandListStateMachine m_state;
    };
}
