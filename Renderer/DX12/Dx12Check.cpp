#include "Dx12Check.h"
#include "DiagnosticLogger.h"
#include <dxgi.h>
#include <string>

namespace TriangleLab::Renderer
{
    void ThrowIfFailed(HRESULT hr, ErrorKind kind, const char* what)
    {
        if (SUCCEEDED(hr))
            return;

        DiagnosticLogger::LogError("%s: %s (hr=0x%08X)\n", ErrorKindName(kind), what, static_cast<unsigned>(hr));
        ThrowRenderError(kind, what, static_cast<int32_t>(hr));
    }

    void ThrowIfDeviceLost(HRESULT hr, ID3D12Device* device, const char* what)
    {
        if (SUCCEEDED(hr))
            return;

        if ((hr == DXGI_ERROR_DEVICE_REMOVED || hr == DXGI_ERROR_DEVICE_RESET) && device)
        {
            HRESULT reason = device->GetDeviceRemovedReason();
            std::string msg = std::string(what) + ": device removed, reason " + FormatResult(static_cast<int32_t>(reason));
            ThrowIfFailed(hr, ErrorKind::GpuCommand, msg.c_str());
        }

        ThrowIfFailed(hr, ErrorKind::GpuCommand, what);
    }
}
