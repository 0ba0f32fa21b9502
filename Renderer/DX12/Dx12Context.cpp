#include "Dx12Context.h"
#include "RenderConfig.h"
#include "Vertex.h"
#include "Dx12Check.h"
#include "Dx12Debug.h"
#include "DiagnosticLogger.h"

namespace TriangleLab::Renderer
{
    Dx12Context::~Dx12Context()
    {
        try
        {
            Shutdown();
        }
        catch (const std::exception& e)
        {
            DiagnosticLogger::LogError("Dx12Context: shutdown in destructor failed: %s\n", e.what());
        }
    }

    void Dx12Context::Initialize(HWND hwnd, uint32_t width, uint32_t height, const Config::RenderSettings& settings)
    {
        if (m_initialized)
            throw OrderingViolation("Dx12Context initialized twice");

        m_hwnd = hwnd;
        m_width = width;
        m_height = height;
        m_settings = settings;

        try
        {
            InitDevice();
            InitPipeline();
            InitFrameResources();
            InitGeometry();
            FlushInitialCommands();
            InitPresenter();
        }
        catch (const std::exception& e)
        {
            DiagnosticLogger::LogError("Dx12Context: initialization failed: %s\n", e.what());
            ReleaseAll();
            throw;
        }

        m_initialized = true;
        DiagnosticLogger::Log("Dx12Context initialized successfully (%ux%u, %s)\n",
            m_width, m_height, DriverTypeName(m_devices.driverType));
    }

    void Dx12Context::InitDevice()
    {
        SwapChainDescription swapChainDesc;
        swapChainDesc.hwnd = m_hwnd;
        swapChainDesc.width = m_width;
        swapChainDesc.height = m_height;

        DeviceFactory factory;
        m_devices = factory.Create(m_settings.driver, m_settings.debugLayer,
            ToD3DFeatureLevel(m_settings.featureLevel), swapChainDesc);
    }

    void Dx12Context::InitPipeline()
    {
        const std::string shaderPath = Config::ResolvePath(m_settings.shaderPath.c_str());
        m_shaderLibrary.LoadFromFile(shaderPath, m_devices.debugLayer);

        m_pipeline = PipelineBuilder::Build(m_devices.device.Get(),
            m_shaderLibrary.GetVertexShader().Get(),
            m_shaderLibrary.GetPixelShader().Get(),
            GetVertexInputLayout(),
            BackBufferFormat);

        DiagnosticLogger::Log("Dx12Context: pipeline built from %s\n", shaderPath.c_str());
    }

    void Dx12Context::InitFrameResources()
    {
        m_renderTarget.Initialize(m_devices.device.Get());
        m_commandContext.Initialize(m_devices.device.Get(), m_pipeline.pipelineState.Get());
        m_recorder.Initialize(&m_commandContext, &m_stateTracker);
        m_synchronizer.Initialize(m_devices.device.Get());

        m_renderTarget.Acquire(m_devices.swapChain.Get(),
            m_devices.swapChain->GetCurrentBackBufferIndex(), m_stateTracker);

        m_viewport.TopLeftX = 0.0f;
        m_viewport.TopLeftY = 0.0f;
        m_viewport.Width = static_cast<float>(m_width);
        m_viewport.Height = static_cast<float>(m_height);
        m_viewport.MinDepth = D3D12_MIN_DEPTH;
        m_viewport.MaxDepth = D3D12_MAX_DEPTH;

        m_scissorRect.left = 0;
        m_scissorRect.top = 0;
        m_scissorRect.right = static_cast<LONG>(m_width);
        m_scissorRect.bottom = static_cast<LONG>(m_height);
    }

    void Dx12Context::InitGeometry()
    {
        const auto vertices = MakeTriangleVertices();
        m_vertexBuffer = ResourceUploader::UploadVertices(m_devices.device.Get(), vertices);
    }

    void Dx12Context::FlushInitialCommands()
    {
        // The list is created open; run it once so the first frame starts from a fenced submission
        m_commandContext.Close();
        m_commandContext.Submit(m_devices.commandQueue.Get());
        m_commandContext.OnFenceSignaled(m_synchronizer.SignalAndWait(m_devices.commandQueue.Get()));
    }

    void Dx12Context::InitPresenter()
    {
        PresenterDesc desc;
        desc.device = m_devices.device.Get();
        desc.commandQueue = m_devices.commandQueue.Get();
        desc.swapChain = m_devices.swapChain.Get();
        desc.commandContext = &m_commandContext;
        desc.recorder = &m_recorder;
        desc.synchronizer = &m_synchronizer;
        desc.renderTarget = &m_renderTarget;
        desc.stateTracker = &m_stateTracker;
        desc.syncInterval = m_settings.syncInterval;

        desc.bindings.pipelineState = m_pipeline.pipelineState.Get();
        desc.bindings.rootSignature = m_pipeline.rootSignature.Get();
        desc.bindings.viewport = m_viewport;
        desc.bindings.scissorRect = m_scissorRect;
        desc.bindings.vertexBufferView = m_vertexBuffer.view;
        for (int i = 0; i < 4; ++i)
            desc.bindings.clearColor[i] = m_settings.clearColor[i];
        desc.bindings.vertexCount = TriangleVertexCount;
        desc.bindings.instanceCount = TriangleInstanceCount;

        m_presenter.Initialize(desc);
    }

    void Dx12Context::Update()
    {
    }

    void Dx12Context::RenderFrame()
    {
        if (!m_initialized)
            throw OrderingViolation("RenderFrame called before Initialize");

        m_presenter.RenderFrame();
    }

    void Dx12Context::Shutdown()
    {
        if (!m_initialized && !m_devices.device)
            return;

        ReleaseAll();
        DiagnosticLogger::Log("Dx12Context shutdown complete\n");
    }

    void Dx12Context::ReleaseAll()
    {
        // Nothing may be released while the GPU can still reference it
        if (m_synchronizer.IsInitialized() && m_devices.commandQueue)
        {
            try
            {
                m_commandContext.OnFenceSignaled(m_synchronizer.SignalAndWait(m_devices.commandQueue.Get()));
            }
            catch (const GpuCommandError& e)
            {
                DiagnosticLogger::LogError("Dx12Context: final GPU wait failed, releasing anyway: %s\n", e.what());
            }
        }

        // A swap chain must not be released in fullscreen mode
        if (m_devices.swapChain)
            m_devices.swapChain->SetFullscreenState(FALSE, nullptr);

        m_presenter.Shutdown();
        m_synchronizer.Shutdown();

        // Asset objects
        m_vertexBuffer = VertexBufferResult{};
        m_renderTarget.Shutdown(&m_stateTracker);
        m_commandContext.Shutdown();

        // Pipeline objects
        m_pipeline = PipelineObjects{};
        m_shaderLibrary.Shutdown();

        const bool debugLayer = m_devices.debugLayer;
        m_devices = DeviceBundle{};

        m_hwnd = nullptr;
        m_initialized = false;

        if (debugLayer)
            ReportLiveObjectsIfDebug();
    }
}
