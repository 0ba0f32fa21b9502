#pragma once

#include <Windows.h>
#include <d3d12.h>
#include "../Core/RenderErrors.h"

namespace TriangleLab::Renderer
{
    // Logs and throws the RenderError subclass for kind when hr is a failure code
    void ThrowIfFailed(HRESULT hr, ErrorKind kind, const char* what);

    // Present/Signal failures: adds the device-removed reason when the device is gone
    void ThrowIfDeviceLost(HRESULT hr, ID3D12Device* device, const char* what);
}
