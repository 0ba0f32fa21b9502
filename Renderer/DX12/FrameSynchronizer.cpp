#include "FrameSynchronizer.h"
#include "Dx12Check.h"
#include "DiagnosticLogger.h"

namespace TriangleLab::Renderer
{
    FrameSynchronizer::~FrameSynchronizer()
    {
        if (m_fenceEvent)
            CloseHandle(m_fenceEvent);
    }

    void FrameSynchronizer::Initialize(ID3D12Device* device)
    {
        if (!device)
            throw ResourceCreationError("frame synchronizer: no device");

        ThrowIfFailed(device->CreateFence(0, D3D12_FENCE_FLAG_NONE, IID_PPV_ARGS(&m_fence)),
            ErrorKind::ResourceCreation, "CreateFence");

        // Auto-reset event
        m_fenceEvent = CreateEvent(nullptr, FALSE, FALSE, nullptr);
        if (!m_fenceEvent)
        {
            ThrowIfFailed(HRESULT_FROM_WIN32(GetLastError()), ErrorKind::ResourceCreation, "CreateEvent (fence)");
        }

        m_counter.Reset();
    }

    void FrameSynchronizer::Shutdown()
    {
        if (m_fenceEvent)
        {
            CloseHandle(m_fenceEvent);
            m_fenceEvent = nullptr;
        }

        m_fence.Reset();
    }

    uint64_t FrameSynchronizer::SignalAndWait(ID3D12CommandQueue* queue)
    {
        if (!m_fence || !queue)
            throw OrderingViolation("frame synchronizer used before Initialize");

        const uint64_t value = m_counter.Next();
        ThrowIfFailed(queue->Signal(m_fence.Get(), value), ErrorKind::GpuCommand, "ID3D12CommandQueue::Signal");

        WaitForFence(value);
        return value;
    }

    uint64_t FrameSynchronizer::GetCompletedValue() const
    {
        if (!m_fence)
            return 0;

        const uint64_t completed = m_fence->GetCompletedValue();

        // UINT64_MAX is what a removed device reports
        if (completed == UINT64_MAX)
            throw GpuCommandError("fence reports device removed");

        return completed;
    }

    void FrameSynchronizer::WaitForFence(uint64_t value)
    {
        if (GetCompletedValue() >= value)
            return;

        ThrowIfFailed(m_fence->SetEventOnCompletion(value, m_fenceEvent),
            ErrorKind::GpuCommand, "ID3D12Fence::SetEventOnCompletion");

        const DWORD waitResult = WaitForSingleObject(m_fenceEvent, INFINITE);
        if (waitResult != WAIT_OBJECT_0)
        {
            ThrowIfFailed(HRESULT_FROM_WIN32(GetLastError()), ErrorKind::GpuCommand, "WaitForSingleObject (fence)");
        }

        DiagnosticLogger::LogThrottled("FENCE_WAIT", "FrameSynchronizer: fence %llu reached\n",
            static_cast<unsigned long long>(value));
    }
}
