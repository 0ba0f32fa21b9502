// TriangleLab.cpp : Defines the entry point for the application.
//

#include <Windows.h>
#include "Engine/App.h"
#include "Renderer/DX12/DiagnosticLogger.h"

/******************************************************************************
 * FILE CONTRACT - TriangleLab.cpp
 *
 * THREAD MODEL
 *   Single UI thread owns window, message pump, WndProc, and App::Tick.
 *
 * PUMP MODEL
 *   PeekMessage (non-blocking) -> TranslateMessage -> DispatchMessage.
 *   When queue is empty, App::Tick renders one frame. A false return from
 *   Tick means the renderer stopped; the window is closed.
 *
 * SHUTDOWN
 *   WM_CLOSE shuts the renderer down BEFORE DestroyWindow so the swap chain
 *   never outlives its window. The second Shutdown after the loop is a no-op.
 ******************************************************************************/

namespace
{
    const wchar_t* WindowClassName = L"TriangleLabWindowClass";
    const wchar_t* WindowTitle = L"TriangleLab";
    const char* SettingsFileName = "triangle.cfg";

    TriangleLab::Engine::App g_app;

    LRESULT CALLBACK WndProc(HWND hWnd, UINT message, WPARAM wParam, LPARAM lParam)
    {
        switch (message)
        {
        case WM_KEYDOWN:
            if (wParam == VK_ESCAPE)
            {
                PostMessage(hWnd, WM_CLOSE, 0, 0);
                return 0;
            }
            break;

        case WM_CLOSE:
            g_app.Shutdown();
            DestroyWindow(hWnd);
            return 0;

        case WM_DESTROY:
            PostQuitMessage(0);
            return 0;
        }

        return DefWindowProc(hWnd, message, wParam, lParam);
    }

    HWND CreateMainWindow(HINSTANCE hInstance, uint32_t clientWidth, uint32_t clientHeight)
    {
        WNDCLASSEXW wcex = {};
        wcex.cbSize = sizeof(WNDCLASSEX);
        wcex.style = CS_HREDRAW | CS_VREDRAW;
        wcex.lpfnWndProc = WndProc;
        wcex.hInstance = hInstance;
        wcex.hCursor = LoadCursor(nullptr, IDC_ARROW);
        wcex.lpszClassName = WindowClassName;

        if (!RegisterClassExW(&wcex))
            return nullptr;

        // Only a request: the swap chain is sized from the client area the window really gets
        RECT rect = { 0, 0, static_cast<LONG>(clientWidth), static_cast<LONG>(clientHeight) };
        AdjustWindowRect(&rect, WS_OVERLAPPEDWINDOW, FALSE);

        return CreateWindowW(WindowClassName, WindowTitle, WS_OVERLAPPEDWINDOW,
            CW_USEDEFAULT, CW_USEDEFAULT, rect.right - rect.left, rect.bottom - rect.top,
            nullptr, nullptr, hInstance, nullptr);
    }
}

int APIENTRY wWinMain(_In_ HINSTANCE hInstance,
                     _In_opt_ HINSTANCE hPrevInstance,
                     _In_ LPWSTR    lpCmdLine,
                     _In_ int       nCmdShow)
{
    UNREFERENCED_PARAMETER(hPrevInstance);
    UNREFERENCED_PARAMETER(lpCmdLine);

    g_app.LoadSettings(SettingsFileName);
    const auto& settings = g_app.GetSettings();

    HWND hWnd = CreateMainWindow(hInstance, settings.width, settings.height);
    if (!hWnd)
    {
        TriangleLab::Renderer::DiagnosticLogger::LogError("CreateWindow failed (%lu)\n", GetLastError());
        return 1;
    }

    if (!g_app.Initialize(hWnd))
    {
        DestroyWindow(hWnd);
        return 1;
    }

    ShowWindow(hWnd, nCmdShow);
    UpdateWindow(hWnd);

    MSG msg = {};
    bool running = true;
    bool closeRequested = false;
    while (running)
    {
        while (PeekMessage(&msg, nullptr, 0, 0, PM_REMOVE))
        {
            if (msg.message == WM_QUIT)
            {
                running = false;
                break;
            }

            TranslateMessage(&msg);
            DispatchMessage(&msg);
        }

        if (running && !closeRequested && !g_app.Tick())
        {
            // Renderer stopped: close through WM_CLOSE so teardown order is the same
            PostMessage(hWnd, WM_CLOSE, 0, 0);
            closeRequested = true;
        }
    }

    g_app.Shutdown();

    return static_cast<int>(msg.wParam);
}
