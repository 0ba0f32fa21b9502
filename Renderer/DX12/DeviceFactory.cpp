#include "DeviceFactory.h"
#include "Dx12Check.h"
#include "Dx12Debug.h"
#include "DiagnosticLogger.h"
#include "RenderConfig.h"

using Microsoft::WRL::ComPtr;

namespace TriangleLab::Renderer
{
    D3D_FEATURE_LEVEL ToD3DFeatureLevel(Config::FeatureLevel level)
    {
        switch (level)
        {
        case Config::FeatureLevel::Level11_0: return D3D_FEATURE_LEVEL_11_0;
        case Config::FeatureLevel::Level11_1: return D3D_FEATURE_LEVEL_11_1;
        case Config::FeatureLevel::Level12_0: return D3D_FEATURE_LEVEL_12_0;
        case Config::FeatureLevel::Level12_1: return D3D_FEATURE_LEVEL_12_1;
        }
        return D3D_FEATURE_LEVEL_11_0;
    }

    DeviceFactory::DeviceFactory()
        : m_createDevice([](IUnknown* adapter, D3D_FEATURE_LEVEL level, REFIID riid, void** device)
          {
              return D3D12CreateDevice(adapter, level, riid, device);
          })
    {
    }

    DeviceFactory::DeviceFactory(DeviceCreateFn createDevice)
        : m_createDevice(std::move(createDevice))
    {
    }

    DeviceBundle DeviceFactory::Create(DriverType preferred, bool debugLayer, D3D_FEATURE_LEVEL featureLevel,
                                       const SwapChainDescription& swapChainDesc)
    {
        if (!swapChainDesc.hwnd || swapChainDesc.width == 0 || swapChainDesc.height == 0)
            throw DeviceCreationError("swapchain description needs a window and a non-empty client area");

        const std::vector<DriverAttempt> attempts = BuildAttemptOrder(preferred, debugLayer);

        return CreateWithFallback(attempts,
            [&](const DriverAttempt& attempt)
            {
                return CreateForAttempt(attempt, featureLevel, swapChainDesc);
            },
            [](const DriverAttempt& attempt, const RenderError& e)
            {
                DiagnosticLogger::LogError("DeviceFactory: %s attempt failed: %s\n",
                    DriverTypeName(attempt.driver), e.what());
            });
    }

    DeviceBundle DeviceFactory::CreateForAttempt(const DriverAttempt& attempt, D3D_FEATURE_LEVEL featureLevel,
                                                 const SwapChainDescription& swapChainDesc)
    {
        DeviceBundle bundle;
        bundle.driverType = attempt.driver;

        // 1. Adapter, chosen on a release factory. The debug layer is process-wide
        // and cannot be turned off again, so it is only enabled once a hardware
        // adapter has passed the feature-level check.
        ThrowIfFailed(CreateDXGIFactory2(0, IID_PPV_ARGS(&bundle.factory)),
            ErrorKind::DeviceCreation, "CreateDXGIFactory2");

        if (attempt.driver == DriverType::Hardware)
        {
            bundle.adapter = SelectHardwareAdapter(bundle.factory.Get(), featureLevel);
            if (!bundle.adapter)
                throw DeviceCreationError("no hardware adapter supports the requested feature level");
        }
        else
        {
            ThrowIfFailed(bundle.factory->EnumWarpAdapter(IID_PPV_ARGS(&bundle.adapter)),
                ErrorKind::DeviceCreation, "EnumWarpAdapter");
        }

        bundle.debugLayer = attempt.debugLayer && EnableDebugLayer();

        // 2. Debug DXGI factory when the debug layer is live; the adapter is
        // looked up again by LUID so it belongs to that factory
        if (bundle.debugLayer)
        {
            EnableDRED();

            DXGI_ADAPTER_DESC1 chosen = {};
            ComPtr<IDXGIFactory4> debugFactory;
            ComPtr<IDXGIAdapter1> debugAdapter;
            if (SUCCEEDED(bundle.adapter->GetDesc1(&chosen)) &&
                SUCCEEDED(CreateDXGIFactory2(DXGI_CREATE_FACTORY_DEBUG, IID_PPV_ARGS(&debugFactory))) &&
                SUCCEEDED(debugFactory->EnumAdapterByLuid(chosen.AdapterLuid, IID_PPV_ARGS(&debugAdapter))))
            {
                bundle.factory = debugFactory;
                bundle.adapter = debugAdapter;
            }
            else
            {
                DiagnosticLogger::Log("DeviceFactory: debug DXGI factory unavailable, using release factory\n");
            }
        }

        // 3. Device
        ThrowIfFailed(m_createDevice(bundle.adapter.Get(), featureLevel, IID_PPV_ARGS(&bundle.device)),
            ErrorKind::DeviceCreation, "D3D12CreateDevice");

        if (bundle.debugLayer)
            SetupInfoQueue(bundle.device.Get());

        // 4. Direct command queue
        {
            D3D12_COMMAND_QUEUE_DESC queueDesc = {};
            queueDesc.Type = D3D12_COMMAND_LIST_TYPE_DIRECT;
            queueDesc.Flags = D3D12_COMMAND_QUEUE_FLAG_NONE;

            ThrowIfFailed(bundle.device->CreateCommandQueue(&queueDesc, IID_PPV_ARGS(&bundle.commandQueue)),
                ErrorKind::DeviceCreation, "CreateCommandQueue");
        }

        // 5. Swapchain bound to that queue
        CreateSwapChain(bundle, swapChainDesc);

        DXGI_ADAPTER_DESC1 desc = {};
        if (SUCCEEDED(bundle.adapter->GetDesc1(&desc)))
        {
            DiagnosticLogger::Log("DeviceFactory: created %s device on '%ls' (debug=%d)\n",
                DriverTypeName(bundle.driverType), desc.Description, bundle.debugLayer ? 1 : 0);
        }

        return bundle;
    }

    ComPtr<IDXGIAdapter1> DeviceFactory::SelectHardwareAdapter(IDXGIFactory4* factory, D3D_FEATURE_LEVEL featureLevel) const
    {
        ComPtr<IDXGIAdapter1> bestAdapter;
        SIZE_T bestVram = 0;

        for (UINT i = 0; ; ++i)
        {
            ComPtr<IDXGIAdapter1> adapter;
            if (FAILED(factory->EnumAdapters1(i, &adapter)))
                break;

            DXGI_ADAPTER_DESC1 desc = {};
            if (FAILED(adapter->GetDesc1(&desc)))
                continue;

            // Skip software adapters (WARP is the explicit fallback)
            if (desc.Flags & DXGI_ADAPTER_FLAG_SOFTWARE)
                continue;

            // Capability check only: a null output creates no device
            if (FAILED(m_createDevice(adapter.Get(), featureLevel, __uuidof(ID3D12Device), nullptr)))
                continue;

            if (!bestAdapter || desc.DedicatedVideoMemory > bestVram)
            {
                bestVram = desc.DedicatedVideoMemory;
                bestAdapter = adapter;
            }
        }

        return bestAdapter;
    }

    void DeviceFactory::CreateSwapChain(DeviceBundle& bundle, const SwapChainDescription& swapChainDesc)
    {
        DXGI_SWAP_CHAIN_DESC1 swapDesc = {};
        swapDesc.Width = swapChainDesc.width;
        swapDesc.Height = swapChainDesc.height;
        swapDesc.Format = BackBufferFormat;
        swapDesc.BufferCount = BackBufferCount;
        swapDesc.BufferUsage = DXGI_USAGE_RENDER_TARGET_OUTPUT;
        swapDesc.SwapEffect = DXGI_SWAP_EFFECT_FLIP_SEQUENTIAL;
        swapDesc.SampleDesc.Count = 1;
        swapDesc.SampleDesc.Quality = 0;

        // No fullscreen desc: windowed
        ComPtr<IDXGISwapChain1> swapChain1;
        ThrowIfFailed(bundle.factory->CreateSwapChainForHwnd(
            bundle.commandQueue.Get(),
            swapChainDesc.hwnd,
            &swapDesc,
            nullptr,
            nullptr,
            &swapChain1),
            ErrorKind::DeviceCreation, "CreateSwapChainForHwnd");

        ThrowIfFailed(bundle.factory->MakeWindowAssociation(swapChainDesc.hwnd, DXGI_MWA_NO_ALT_ENTER),
            ErrorKind::DeviceCreation, "MakeWindowAssociation");

        ThrowIfFailed(swapChain1.As(&bundle.swapChain),
            ErrorKind::DeviceCreation, "Query IDXGISwapChain3");
    }
}
