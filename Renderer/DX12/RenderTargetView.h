#pragma once

#include <d3d12.h>
#include <dxgi1_6.h>
#include <wrl/client.h>
#include <cstdint>
#include "../Core/BackBufferSlot.h"
#include "ResourceStateTracker.h"

namespace TriangleLab::Renderer
{
    // One RTV descriptor re-pointed at the current back buffer every frame.
    // The back buffer reference lives in a BackBufferSlot, so the previous
    // buffer is released before the next one is fetched.
    class RenderTargetView
    {
    public:
        RenderTargetView() = default;

        RenderTargetView(const RenderTargetView&) = delete;
        RenderTargetView& operator=(const RenderTargetView&) = delete;

        void Initialize(ID3D12Device* device);
        void Shutdown(ResourceStateTracker* tracker);

        // Fetches back buffer index from the swap chain, writes the RTV and
        // tracks the buffer as PRESENT
        void Acquire(IDXGISwapChain3* swapChain, uint32_t index, ResourceStateTracker& tracker);

        // Drops the held back buffer (swap chain teardown / resize)
        void Release(ResourceStateTracker* tracker);

        ID3D12Resource* GetResource() const { return m_backBuffer.Get().Get(); }
        D3D12_CPU_DESCRIPTOR_HANDLE GetHandle() const { return m_handle; }
        uint32_t GetBackBufferIndex() const { return m_backBuffer.GetIndex(); }

    private:
        ID3D12Device* m_device = nullptr; // Non-owning
        Microsoft::WRL::ComPtr<ID3D12DescriptorHeap> m_heap;
        D3D12_CPU_DESCRIPTOR_HANDLE m_handle = {};
        BackBufferSlot<Microsoft::WRL::ComPtr<ID3D12Resource>> m_backBuffer;
    };
}
