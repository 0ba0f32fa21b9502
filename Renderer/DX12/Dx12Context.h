#pragma once

#include <Windows.h>
#include <d3d12.h>
#include <dxgi1_6.h>
#include <wrl/client.h>
#include <cstdint>
#include "../../Config/RenderSettings.h"
#include "DeviceFactory.h"
#include "ShaderLibrary.h"
#include "PipelineBuilder.h"
#include "ResourceUploader.h"
#include "ResourceStateTracker.h"
#include "RenderTargetView.h"
#include "CommandContext.h"
#include "FrameRecorder.h"
#include "FrameSynchronizer.h"
#include "Presenter.h"

namespace TriangleLab::Renderer
{
    class Dx12Context
    {
    public:
        Dx12Context() = default;
        ~Dx12Context();

        Dx12Context(const Dx12Context&) = delete;
        Dx12Context& operator=(const Dx12Context&) = delete;

        // Full bring-up; throws a RenderError on failure with everything
        // created so far already released
        void Initialize(HWND hwnd, uint32_t width, uint32_t height, const Config::RenderSettings& settings);

        // Per-frame logic hook (nothing animates yet)
        void Update();

        void RenderFrame();

        // Waits for the GPU, then releases in reverse creation order. Idempotent.
        void Shutdown();

        bool IsInitialized() const { return m_initialized; }

        uint64_t GetFrameCount() const { return m_presenter.GetCompletedFrames(); }
        FramePhase GetFramePhase() const { return m_presenter.GetPhase(); }
        uint64_t GetLastFenceValue() const { return m_synchronizer.GetLastSignaledValue(); }
        uint32_t GetBackBufferIndex() const { return m_renderTarget.GetBackBufferIndex(); }
        DriverType GetDriverType() const { return m_devices.driverType; }
        size_t GetTrackedResourceCount() const { return m_stateTracker.GetTrackedCount(); }

        ID3D12Device* GetDevice() const { return m_devices.device.Get(); }
        IDXGISwapChain3* GetSwapChain() const { return m_devices.swapChain.Get(); }
        ID3D12Resource* GetBackBuffer() const { return m_renderTarget.GetResource(); }

        // Barrier bookkeeping for the back buffer; frames fail if it is not
        // tracked in PRESENT when recording starts
        ResourceStateTracker& GetStateTracker() { return m_stateTracker; }

    private:
        void InitDevice();
        void InitPipeline();
        void InitFrameResources();
        void InitGeometry();
        void FlushInitialCommands();
        void InitPresenter();

        void ReleaseAll();

        HWND m_hwnd = nullptr;
        uint32_t m_width = 0;
        uint32_t m_height = 0;
        Config::RenderSettings m_settings;

        DeviceBundle m_devices;
        ShaderLibrary m_shaderLibrary;
        PipelineObjects m_pipeline;

        ResourceStateTracker m_stateTracker;
        RenderTargetView m_renderTarget;
        CommandContext m_commandContext;
        FrameRecorder m_recorder;
        FrameSynchronizer m_synchronizer;
        Presenter m_presenter;

        VertexBufferResult m_vertexBuffer;

        D3D12_VIEWPORT m_viewport = {};
        D3D12_RECT m_scissorRect = {};

        bool m_initialized = false;
    };
}
