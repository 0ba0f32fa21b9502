#include <gtest/gtest.h>
#include "TestWindow.h"
#include "Renderer/DX12/DeviceFactory.h"
#include "Renderer/DX12/RenderConfig.h"

using namespace TriangleLab;
using namespace TriangleLab::Renderer;
using TriangleLab::Tests::TestWindow;

namespace
{
    SwapChainDescription DescribeWindow(const TestWindow& window)
    {
        SwapChainDescription desc;
        desc.hwnd = window.GetHandle();
        desc.width = window.GetWidth();
        desc.height = window.GetHeight();
        return desc;
    }

    bool IsSoftwareAdapter(IUnknown* adapter)
    {
        Microsoft::WRL::ComPtr<IDXGIAdapter1> dxgiAdapter;
        if (!adapter || FAILED(adapter->QueryInterface(IID_PPV_ARGS(&dxgiAdapter))))
            return false;

        DXGI_ADAPTER_DESC1 desc = {};
        return SUCCEEDED(dxgiAdapter->GetDesc1(&desc)) && (desc.Flags & DXGI_ADAPTER_FLAG_SOFTWARE) != 0;
    }
}

TEST(DeviceFactory, SoftwareDriverCreatesCompleteBundle)
{
    TestWindow window(320, 240);
    DeviceBundle bundle = Tests::CreateWarpDevice(window);

    EXPECT_EQ(bundle.driverType, DriverType::Software);
    EXPECT_FALSE(bundle.debugLayer);
    ASSERT_NE(bundle.device, nullptr);
    ASSERT_NE(bundle.commandQueue, nullptr);
    ASSERT_NE(bundle.swapChain, nullptr);

    DXGI_SWAP_CHAIN_DESC1 desc = {};
    ASSERT_TRUE(SUCCEEDED(bundle.swapChain->GetDesc1(&desc)));
    EXPECT_EQ(desc.BufferCount, BackBufferCount);
    EXPECT_EQ(desc.Format, BackBufferFormat);
    EXPECT_EQ(desc.Width, 320u);
    EXPECT_EQ(desc.Height, 240u);
    EXPECT_EQ(desc.SampleDesc.Count, 1u);
}

TEST(DeviceFactory, ForcedHardwareFailureFallsBackToSoftware)
{
    TestWindow window(320, 240);

    // Device creation fails on every adapter except WARP
    int refusedCreations = 0;
    DeviceFactory factory([&](IUnknown* adapter, D3D_FEATURE_LEVEL level, REFIID riid, void** device) -> HRESULT
    {
        if (!IsSoftwareAdapter(adapter))
        {
            if (device)
                ++refusedCreations;
            return DXGI_ERROR_UNSUPPORTED;
        }
        return D3D12CreateDevice(adapter, level, riid, device);
    });

    DeviceBundle bundle = factory.Create(DriverType::Hardware, false, D3D_FEATURE_LEVEL_11_0, DescribeWindow(window));

    EXPECT_EQ(bundle.driverType, DriverType::Software);
    EXPECT_FALSE(bundle.debugLayer);
    EXPECT_NE(bundle.device, nullptr);
    EXPECT_NE(bundle.swapChain, nullptr);

    // Unsupported adapters are rejected by the capability check, never by a real creation
    EXPECT_EQ(refusedCreations, 0);
}

TEST(DeviceFactory, DebugLayerIsNotEnabledWithoutUsableHardware)
{
    TestWindow window(320, 240);

    int hardwareCreations = 0;
    DeviceFactory factory([&](IUnknown* adapter, D3D_FEATURE_LEVEL level, REFIID riid, void** device) -> HRESULT
    {
        if (!IsSoftwareAdapter(adapter))
        {
            if (device)
                ++hardwareCreations;
            return DXGI_ERROR_UNSUPPORTED;
        }
        return D3D12CreateDevice(adapter, level, riid, device);
    });

    // Debug requested, but no hardware adapter passes: WARP comes up without it
    DeviceBundle bundle = factory.Create(DriverType::Hardware, true, D3D_FEATURE_LEVEL_11_0, DescribeWindow(window));

    EXPECT_EQ(bundle.driverType, DriverType::Software);
    EXPECT_FALSE(bundle.debugLayer);
    EXPECT_EQ(hardwareCreations, 0);

    Microsoft::WRL::ComPtr<ID3D12InfoQueue> infoQueue;
    EXPECT_TRUE(FAILED(bundle.device.As(&infoQueue)));
}

TEST(DeviceFactory, BothAttemptsFailingIsDeviceCreationError)
{
    TestWindow window(320, 240);
    DeviceFactory factory([](IUnknown*, D3D_FEATURE_LEVEL, REFIID, void**) -> HRESULT
    {
        return E_FAIL;
    });

    try
    {
        factory.Create(DriverType::Hardware, false, D3D_FEATURE_LEVEL_11_0, DescribeWindow(window));
        FAIL() << "expected DeviceCreationError";
    }
    catch (const DeviceCreationError& e)
    {
        EXPECT_EQ(e.GetKind(), ErrorKind::DeviceCreation);
        EXPECT_EQ(e.GetResult(), static_cast<int32_t>(E_FAIL));
    }
}

TEST(DeviceFactory, MissingWindowIsDeviceCreationError)
{
    DeviceFactory factory;
    SwapChainDescription desc;
    desc.width = 800;
    desc.height = 600;
    EXPECT_THROW(factory.Create(DriverType::Software, false, D3D_FEATURE_LEVEL_11_0, desc), DeviceCreationError);
}

TEST(DeviceFactory, FeatureLevelMapping)
{
    EXPECT_EQ(ToD3DFeatureLevel(Config::FeatureLevel::Level11_0), D3D_FEATURE_LEVEL_11_0);
    EXPECT_EQ(ToD3DFeatureLevel(Config::FeatureLevel::Level12_1), D3D_FEATURE_LEVEL_12_1);
}
