#pragma once

#include <d3d12.h>

namespace TriangleLab::Renderer
{
    // Call before device creation. Returns false if the SDK layers are not installed.
    bool EnableDebugLayer();

    // Configure the info queue after device creation. Breaks on corruption/error
    // only while a debugger is attached.
    void SetupInfoQueue(ID3D12Device* device);

    // Device Removed Extended Data: auto-breadcrumbs + page fault reporting
    void EnableDRED();

    // Dumps live DXGI/D3D12 objects to the debug output (debug builds only)
    void ReportLiveObjectsIfDebug();
}
