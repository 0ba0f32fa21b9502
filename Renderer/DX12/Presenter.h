#pragma once

#include <d3d12.h>
#include <dxgi1_6.h>
#include <cstdint>
#include "../Core/FramePhaseTracker.h"
#include "CommandContext.h"
#include "FrameRecorder.h"
#include "FrameSynchronizer.h"
#include "RenderTargetView.h"
#include "ResourceStateTracker.h"

namespace TriangleLab::Renderer
{
    // All non-owning; Dx12Context owns the objects and outlives the Presenter
    struct PresenterDesc
    {
        ID3D12Device* device = nullptr;
        ID3D12CommandQueue* commandQueue = nullptr;
        IDXGISwapChain3* swapChain = nullptr;
        CommandContext* commandContext = nullptr;
        FrameRecorder* recorder = nullptr;
        FrameSynchronizer* synchronizer = nullptr;
        RenderTargetView* renderTarget = nullptr;
        ResourceStateTracker* stateTracker = nullptr;

        // Per-frame constant bindings; render target + RTV handle are filled each frame
        FrameBindings bindings;
        uint32_t syncInterval = 1;
    };

    // Frame orchestration:
    //   record -> submit -> present -> advance back buffer + rebuild RTV -> signal/wait
    // Frames are strictly sequential. A frame that throws faults the tracker and
    // every later RenderFrame() throws until the presenter is initialized again.
    class Presenter
    {
    public:
        Presenter() = default;

        Presenter(const Presenter&) = delete;
        Presenter& operator=(const Presenter&) = delete;

        void Initialize(const PresenterDesc& desc);
        void Shutdown();

        bool IsInitialized() const { return m_desc.swapChain != nullptr; }

        void RenderFrame();

        FramePhase GetPhase() const { return m_phases.GetPhase(); }
        uint64_t GetCompletedFrames() const { return m_phases.GetCompletedFrames(); }

    private:
        void AdvanceBackBuffer();

        PresenterDesc m_desc;
        FramePhaseTracker m_phases;
        uint32_t m_backBufferIndex = 0;
    };
}
