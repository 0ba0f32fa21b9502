#include "TestWindow.h"
#include "Renderer/DX12/RenderConfig.h"
#include <stdexcept>

namespace TriangleLab::Tests
{
    namespace
    {
        const wchar_t* TestWindowClass = L"TriangleLabTestWindow";

        void RegisterTestWindowClass()
        {
            static bool registered = false;
            if (registered)
                return;

            WNDCLASSEXW wcex = {};
            wcex.cbSize = sizeof(WNDCLASSEX);
            wcex.lpfnWndProc = DefWindowProcW;
            wcex.hInstance = GetModuleHandleW(nullptr);
            wcex.lpszClassName = TestWindowClass;
            RegisterClassExW(&wcex);
            registered = true;
        }
    }

    TestWindow::TestWindow(uint32_t width, uint32_t height)
        : m_width(width)
        , m_height(height)
    {
        RegisterTestWindowClass();

        // Not shown: WS_VISIBLE is left out
        m_hwnd = CreateWindowW(TestWindowClass, L"TriangleLab test", WS_OVERLAPPEDWINDOW,
            0, 0, static_cast<int>(width), static_cast<int>(height),
            nullptr, nullptr, GetModuleHandleW(nullptr), nullptr);

        if (!m_hwnd)
            throw std::runtime_error("test window creation failed");
    }

    TestWindow::~TestWindow()
    {
        if (m_hwnd)
            DestroyWindow(m_hwnd);
    }

    Renderer::DeviceBundle CreateWarpDevice(const TestWindow& window)
    {
        Renderer::SwapChainDescription desc;
        desc.hwnd = window.GetHandle();
        desc.width = window.GetWidth();
        desc.height = window.GetHeight();

        Renderer::DeviceFactory factory;
        return factory.Create(Renderer::DriverType::Software, false, D3D_FEATURE_LEVEL_11_0, desc);
    }

    Microsoft::WRL::ComPtr<ID3D12Resource> CreateRenderTexture(ID3D12Device* device, uint32_t width, uint32_t height)
    {
        D3D12_HEAP_PROPERTIES heapProps = {};
        heapProps.Type = D3D12_HEAP_TYPE_DEFAULT;
        heapProps.CreationNodeMask = 1;
        heapProps.VisibleNodeMask = 1;

        D3D12_RESOURCE_DESC desc = {};
        desc.Dimension = D3D12_RESOURCE_DIMENSION_TEXTURE2D;
        desc.Width = width;
        desc.Height = height;
        desc.DepthOrArraySize = 1;
        desc.MipLevels = 1;
        desc.Format = Renderer::BackBufferFormat;
        desc.SampleDesc.Count = 1;
        desc.Layout = D3D12_TEXTURE_LAYOUT_UNKNOWN;
        desc.Flags = D3D12_RESOURCE_FLAG_ALLOW_RENDER_TARGET;

        Microsoft::WRL::ComPtr<ID3D12Resource> texture;
        HRESULT hr = device->CreateCommittedResource(&heapProps, D3D12_HEAP_FLAG_NONE, &desc,
            D3D12_RESOURCE_STATE_COMMON, nullptr, IID_PPV_ARGS(&texture));
        if (FAILED(hr))
            throw std::runtime_error("render texture creation failed");

        return texture;
    }

    const char* ShaderSourcePath()
    {
        return TRIANGLELAB_SHADER_PATH;
    }
}
