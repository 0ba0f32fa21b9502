/******************************************************************************
 * FILE CONTRACT - App.cpp
 *
 * SCOPE
 *   Owns settings and the renderer; drives one frame per Tick.
 *   The swap chain takes the window's client area, not the WINDOW setting:
 *   the OS may clamp or rescale the requested size.
 *
 * TICK CONTRACT
 *   1. Dx12Context::Update
 *   2. Dx12Context::RenderFrame (record -> submit -> present -> wait)
 *   A RenderError or OrderingViolation stops the loop: it is logged once,
 *   Tick returns false from then on and the caller tears the window down.
 ******************************************************************************/

#include "App.h"
#include "../Renderer/DX12/DiagnosticLogger.h"

using TriangleLab::Renderer::DiagnosticLogger;

namespace TriangleLab::Engine
{
    bool App::LoadSettings(const char* path)
    {
        Config::RenderSettings loaded;
        Config::LoadResult result = Config::LoadRenderSettingsFromFile(path, loaded);

        switch (result.status)
        {
        case Config::LoadStatus::OK:
            m_settings = loaded;
            DiagnosticLogger::Log("App: settings loaded from %s\n", path);
            return true;

        case Config::LoadStatus::FILE_NOT_FOUND:
            m_settings = Config::RenderSettings{};
            DiagnosticLogger::Log("App: %s not found, using defaults\n", path);
            return true;

        case Config::LoadStatus::PARSE_ERROR:
        default:
            m_settings = Config::RenderSettings{};
            DiagnosticLogger::LogError("App: %s line %d: %s (using defaults)\n",
                path, result.errorLine, result.errorMessage.c_str());
            return false;
        }
    }

    bool App::Initialize(HWND hwnd)
    {
        if (m_initialized)
            return false;

        uint32_t width = 0;
        uint32_t height = 0;
        if (!GetClientSize(hwnd, width, height))
        {
            DiagnosticLogger::LogError("App: window has no usable client area\n");
            return false;
        }

        if (width != m_settings.width || height != m_settings.height)
        {
            DiagnosticLogger::Log("App: client area is %ux%u, settings asked for %ux%u\n",
                width, height, m_settings.width, m_settings.height);
        }

        m_hwnd = hwnd;

        try
        {
            m_renderer.Initialize(hwnd, width, height, m_settings);
        }
        catch (const RenderError& e)
        {
            DiagnosticLogger::LogError("App: renderer initialization failed: %s\n", e.what());
            return false;
        }
        catch (const OrderingViolation& e)
        {
            DiagnosticLogger::LogError("App: renderer initialization misuse: %s\n", e.what());
            return false;
        }

        m_initialized = true;
        m_running = true;
        return true;
    }

    bool App::GetClientSize(HWND hwnd, uint32_t& width, uint32_t& height)
    {
        RECT rect = {};
        if (!hwnd || !GetClientRect(hwnd, &rect))
            return false;

        width = static_cast<uint32_t>(rect.right - rect.left);
        height = static_cast<uint32_t>(rect.bottom - rect.top);
        return width != 0 && height != 0;
    }

    bool App::Tick()
    {
        if (!m_running)
            return false;

        try
        {
            m_renderer.Update();
            m_renderer.RenderFrame();
        }
        catch (const RenderError& e)
        {
            DiagnosticLogger::LogError("App: frame %llu failed, stopping: %s\n",
                static_cast<unsigned long long>(m_renderer.GetFrameCount()), e.what());
            m_running = false;
        }
        catch (const OrderingViolation& e)
        {
            DiagnosticLogger::LogError("App: ordering violation in frame %llu, stopping: %s\n",
                static_cast<unsigned long long>(m_renderer.GetFrameCount()), e.what());
            m_running = false;
        }

        return m_running;
    }

    void App::Shutdown()
    {
        if (!m_initialized)
            return;

        m_renderer.Shutdown();

        m_hwnd = nullptr;
        m_running = false;
        m_initialized = false;
    }
}
