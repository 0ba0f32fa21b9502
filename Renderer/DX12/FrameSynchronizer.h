#pragma once

#include <Windows.h>
#include <d3d12.h>
#include <wrl/client.h>
#include <cstdint>
#include "../Core/FenceCounter.h"

namespace TriangleLab::Renderer
{
    // Full-stop CPU/GPU rendezvous.
    // SignalAndWait() signals the next fence value on the queue and blocks the
    // calling thread (no timeout) until the GPU reaches it, so every prior
    // submission on that queue has retired when it returns.
    class FrameSynchronizer
    {
    public:
        FrameSynchronizer() = default;
        ~FrameSynchronizer();

        FrameSynchronizer(const FrameSynchronizer&) = delete;
        FrameSynchronizer& operator=(const FrameSynchronizer&) = delete;

        // Fence created at 0, counter at 1
        void Initialize(ID3D12Device* device);

        // Closes the event and releases the fence. Does NOT wait: callers
        // SignalAndWait() first while the queue is still alive.
        void Shutdown();

        bool IsInitialized() const { return m_fence != nullptr; }

        // Returns the value that was signaled and waited on
        uint64_t SignalAndWait(ID3D12CommandQueue* queue);

        // GPU-side progress; throws GpuCommandError if the device was removed
        uint64_t GetCompletedValue() const;

        uint64_t GetNextFenceValue() const { return m_counter.Peek(); }
        uint64_t GetLastSignaledValue() const { return m_counter.LastSignaled(); }

    private:
        void WaitForFence(uint64_t value);

        Microsoft::WRL::ComPtr<ID3D12Fence> m_fence;
        HANDLE m_fenceEvent = nullptr;
        FenceCounter m_counter;
    };
}
