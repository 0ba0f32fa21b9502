#include "Dx12Debug.h"
#include "DiagnosticLogger.h"
#include <dxgi1_6.h>
#include <dxgidebug.h>
#include <wrl/client.h>

using Microsoft::WRL::ComPtr;

namespace TriangleLab::Renderer
{
    bool EnableDebugLayer()
    {
        ComPtr<ID3D12Debug> debugController;
        if (FAILED(D3D12GetDebugInterface(IID_PPV_ARGS(&debugController))))
        {
            DiagnosticLogger::Log("Dx12Debug: debug layer unavailable\n");
            return false;
        }

        debugController->EnableDebugLayer();

        // GPU-based validation stays off (too slow for the frame loop)
        ComPtr<ID3D12Debug1> debugController1;
        if (SUCCEEDED(debugController.As(&debugController1)))
        {
            debugController1->SetEnableGPUBasedValidation(FALSE);
        }

        DiagnosticLogger::Log("Dx12Debug: debug layer enabled\n");
        return true;
    }

    void SetupInfoQueue(ID3D12Device* device)
    {
        if (!device)
            return;

        ComPtr<ID3D12InfoQueue> infoQueue;
        if (FAILED(device->QueryInterface(IID_PPV_ARGS(&infoQueue))))
            return;

        const BOOL breakOnError = IsDebuggerPresent() ? TRUE : FALSE;
        infoQueue->SetBreakOnSeverity(D3D12_MESSAGE_SEVERITY_CORRUPTION, breakOnError);
        infoQueue->SetBreakOnSeverity(D3D12_MESSAGE_SEVERITY_ERROR, breakOnError);
    }

    void EnableDRED()
    {
        ComPtr<ID3D12DeviceRemovedExtendedDataSettings> dredSettings;
        if (SUCCEEDED(D3D12GetDebugInterface(IID_PPV_ARGS(&dredSettings))))
        {
            dredSettings->SetAutoBreadcrumbsEnablement(D3D12_DRED_ENABLEMENT_FORCED_ON);
            dredSettings->SetPageFaultEnablement(D3D12_DRED_ENABLEMENT_FORCED_ON);
        }
    }

    void ReportLiveObjectsIfDebug()
    {
#if defined(_DEBUG)
        ComPtr<IDXGIDebug1> dxgiDebug;
        if (SUCCEEDED(DXGIGetDebugInterface1(0, IID_PPV_ARGS(&dxgiDebug))))
        {
            dxgiDebug->ReportLiveObjects(DXGI_DEBUG_ALL,
                static_cast<DXGI_DEBUG_RLO_FLAGS>(DXGI_DEBUG_RLO_SUMMARY | DXGI_DEBUG_RLO_IGNORE_INTERNAL));
        }
#endif
    }
}
