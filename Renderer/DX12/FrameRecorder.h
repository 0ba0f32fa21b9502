#pragma once

#include <d3d12.h>
#include <cstdint>
#include "CommandContext.h"
#include "ResourceStateTracker.h"

namespace TriangleLab::Renderer
{
    // Everything one frame binds. Pointers are non-owning and must stay valid
    // for the duration of Record().
    struct FrameBindings
    {
        ID3D12PipelineState* pipelineState = nullptr;
        ID3D12RootSignature* rootSignature = nullptr;
        D3D12_VIEWPORT viewport = {};
        D3D12_RECT scissorRect = {};
        D3D12_CPU_DESCRIPTOR_HANDLE rtvHandle = {};
        ID3D12Resource* renderTarget = nullptr;     // tracked in PRESENT at frame start
        D3D12_VERTEX_BUFFER_VIEW vertexBufferView = {};
        float clearColor[4] = { 0.0f, 0.2f, 0.4f, 1.0f };
        uint32_t vertexCount = 3;
        uint32_t instanceCount = 1;
    };

    // Records the per-frame command list:
    //   reset -> root sig/viewport/scissor -> PRESENT->RENDER_TARGET
    //   -> clear -> bind RTV/topology/VB -> draw -> RENDER_TARGET->PRESENT -> close
    class FrameRecorder
    {
    public:
        FrameRecorder() = default;

        FrameRecorder(const FrameRecorder&) = delete;
        FrameRecorder& operator=(const FrameRecorder&) = delete;

        void Initialize(CommandContext* commandContext, ResourceStateTracker* stateTracker);

        // completedFence: GPU progress, gates the allocator reset.
        // On return the list is Closed with matching barrier pairs.
        void Record(uint64_t completedFence, const FrameBindings& bindings);

    private:
        void RecordDraw(ID3D12GraphicsCommandList* cmd, const FrameBindings& bindings);

        CommandContext* m_commandContext = nullptr;     // Non-owning
        ResourceStateTracker* m_stateTracker = nullptr; // Non-owning
    };
}
