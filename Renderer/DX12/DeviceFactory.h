#pragma once

#include <Windows.h>
#include <d3d12.h>
#include <dxgi1_6.h>
#include <wrl/client.h>
#include <cstdint>
#include <functional>
#include "../Core/DriverFallback.h"
#include "../../Config/RenderSettings.h"

namespace TriangleLab::Renderer
{
    // Presentation target supplied by the window collaborator
    struct SwapChainDescription
    {
        HWND hwnd = nullptr;
        uint32_t width = 0;
        uint32_t height = 0;
    };

    // Everything one successful driver attempt produces.
    // The swapchain is bound to commandQueue from the same attempt.
    struct DeviceBundle
    {
        Microsoft::WRL::ComPtr<IDXGIFactory4> factory;
        Microsoft::WRL::ComPtr<IDXGIAdapter1> adapter;
        Microsoft::WRL::ComPtr<ID3D12Device> device;
        Microsoft::WRL::ComPtr<ID3D12CommandQueue> commandQueue;
        Microsoft::WRL::ComPtr<IDXGISwapChain3> swapChain;
        DriverType driverType = DriverType::Hardware;
        bool debugLayer = false;
    };

    // Signature of D3D12CreateDevice; replaceable so tests can force failures
    using DeviceCreateFn = std::function<HRESULT(IUnknown* adapter, D3D_FEATURE_LEVEL featureLevel, REFIID riid, void** device)>;

    D3D_FEATURE_LEVEL ToD3DFeatureLevel(Config::FeatureLevel level);

    class DeviceFactory
    {
    public:
        DeviceFactory();
        explicit DeviceFactory(DeviceCreateFn createDevice);

        // Hardware first (debug layer if requested), then WARP without debug flags.
        // Throws DeviceCreationError when every attempt fails.
        DeviceBundle Create(DriverType preferred, bool debugLayer, D3D_FEATURE_LEVEL featureLevel,
                            const SwapChainDescription& swapChainDesc);

    private:
        DeviceBundle CreateForAttempt(const DriverAttempt& attempt, D3D_FEATURE_LEVEL featureLevel,
                                      const SwapChainDescription& swapChainDesc);

        // Non-software adapter that supports featureLevel with the most dedicated VRAM, or null
        Microsoft::WRL::ComPtr<IDXGIAdapter1> SelectHardwareAdapter(IDXGIFactory4* factory, D3D_FEATURE_LEVEL featureLevel) const;

        static void CreateSwapChain(DeviceBundle& bundle, const SwapChainDescription& swapChainDesc);

        DeviceCreateFn m_createDevice;
    };
}
