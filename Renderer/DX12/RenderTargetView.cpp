#include "RenderTargetView.h"
#include "RenderConfig.h"
#include "Dx12Check.h"

using Microsoft::WRL::ComPtr;

namespace TriangleLab::Renderer
{
    void RenderTargetView::Initialize(ID3D12Device* device)
    {
        if (!device)
            throw ResourceCreationError("render target view: no device");

        m_device = device;

        D3D12_DESCRIPTOR_HEAP_DESC heapDesc = {};
        heapDesc.NumDescriptors = RtvHeapCapacity;
        heapDesc.Type = D3D12_DESCRIPTOR_HEAP_TYPE_RTV;
        heapDesc.Flags = D3D12_DESCRIPTOR_HEAP_FLAG_NONE;
        ThrowIfFailed(device->CreateDescriptorHeap(&heapDesc, IID_PPV_ARGS(&m_heap)),
            ErrorKind::ResourceCreation, "CreateDescriptorHeap (RTV)");

        m_handle = m_heap->GetCPUDescriptorHandleForHeapStart();
    }

    void RenderTargetView::Shutdown(ResourceStateTracker* tracker)
    {
        Release(tracker);
        m_heap.Reset();
        m_handle = {};
        m_device = nullptr;
    }

    void RenderTargetView::Acquire(IDXGISwapChain3* swapChain, uint32_t index, ResourceStateTracker& tracker)
    {
        if (!swapChain || !m_heap)
            throw OrderingViolation("render target view used before Initialize");
        if (index >= BackBufferCount)
            throw OrderingViolation("back buffer index out of range");

        Release(&tracker);

        m_backBuffer.Replace(index, [swapChain](uint32_t bufferIndex)
        {
            ComPtr<ID3D12Resource> buffer;
            ThrowIfFailed(swapChain->GetBuffer(bufferIndex, IID_PPV_ARGS(&buffer)),
                ErrorKind::ResourceCreation, "IDXGISwapChain::GetBuffer");
            return buffer;
        });

        ID3D12Resource* resource = m_backBuffer.Get().Get();
        m_device->CreateRenderTargetView(resource, nullptr, m_handle);
        tracker.AssumeState(resource, D3D12_RESOURCE_STATE_PRESENT, index == 0 ? "BackBuffer0" : "BackBuffer1");
    }

    void RenderTargetView::Release(ResourceStateTracker* tracker)
    {
        if (tracker && !m_backBuffer.IsEmpty())
            tracker->Unregister(m_backBuffer.Get().Get());

        m_backBuffer.Release();
    }
}
