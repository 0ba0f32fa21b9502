#pragma once

#include <Windows.h>
#include <cstdint>
#include <string>
#include "../Config/RenderSettings.h"
#include "../Renderer/DX12/Dx12Context.h"

namespace TriangleLab::Engine
{
    class App
    {
    public:
        App() = default;
        ~App() = default;

        App(const App&) = delete;
        App& operator=(const App&) = delete;

        // Reads the settings file. A missing file keeps defaults; a malformed one
        // is logged and also keeps defaults. Returns false on parse errors.
        bool LoadSettings(const char* path);

        bool Initialize(HWND hwnd);

        // One frame. Returns false once the frame loop has stopped.
        bool Tick();

        void Shutdown();

        const Config::RenderSettings& GetSettings() const { return m_settings; }
        bool IsRunning() const { return m_running; }

        Renderer::Dx12Context& GetRenderer() { return m_renderer; }

    private:
        // False for a null window or an empty (minimized) client area
        static bool GetClientSize(HWND hwnd, uint32_t& width, uint32_t& height);

        HWND m_hwnd = nullptr;
        Config::RenderSettings m_settings;
        Renderer::Dx12Context m_renderer;
        bool m_initialized = false;
        bool m_running = false;
    };
}
