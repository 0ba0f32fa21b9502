#include "Presenter.h"
#include "RenderConfig.h"
#include "Dx12Check.h"
#include "DiagnosticLogger.h"

namespace TriangleLab::Renderer
{
    void Presenter::Initialize(const PresenterDesc& desc)
    {
        if (!desc.device || !desc.commandQueue || !desc.swapChain || !desc.commandContext ||
            !desc.recorder || !desc.synchronizer || !desc.renderTarget || !desc.stateTracker)
        {
            throw OrderingViolation("presenter: incomplete description");
        }

        m_desc = desc;
        m_backBufferIndex = desc.renderTarget->GetBackBufferIndex();

        // New session: phase and frame count both start over
        m_phases = FramePhaseTracker{};
    }

    void Presenter::Shutdown()
    {
        m_desc = PresenterDesc{};
        m_backBufferIndex = 0;
    }

    void Presenter::RenderFrame()
    {
        if (!IsInitialized())
            throw OrderingViolation("RenderFrame called before Initialize");

        try
        {
            // Idle -> Recording
            m_phases.Advance(FramePhase::Recording);

            FrameBindings bindings = m_desc.bindings;
            bindings.renderTarget = m_desc.renderTarget->GetResource();
            bindings.rtvHandle = m_desc.renderTarget->GetHandle();
            m_desc.recorder->Record(m_desc.synchronizer->GetCompletedValue(), bindings);

            // Recording -> Submitted
            m_desc.commandContext->Submit(m_desc.commandQueue);
            m_phases.Advance(FramePhase::Submitted);

            // Submitted -> Presented
            ThrowIfDeviceLost(m_desc.swapChain->Present(m_desc.syncInterval, 0), m_desc.device, "IDXGISwapChain::Present");
            m_phases.Advance(FramePhase::Presented);

            AdvanceBackBuffer();

            // Presented -> Synchronized -> Idle
            const uint64_t fenceValue = m_desc.synchronizer->SignalAndWait(m_desc.commandQueue);
            m_desc.commandContext->OnFenceSignaled(fenceValue);
            m_phases.Advance(FramePhase::Synchronized);
            m_phases.Advance(FramePhase::Idle);
        }
        catch (...)
        {
            m_phases.MarkFaulted();
            throw;
        }

        DiagnosticLogger::LogThrottled("PRESENT", "Presenter: frame %llu presented (fence %llu)\n",
            static_cast<unsigned long long>(m_phases.GetCompletedFrames()),
            static_cast<unsigned long long>(m_desc.synchronizer->GetLastSignaledValue()));
    }

    void Presenter::AdvanceBackBuffer()
    {
        m_backBufferIndex = (m_backBufferIndex + 1) % BackBufferCount;

        // Flip-sequential rotates in order; a mismatch means someone else presented
        const uint32_t swapChainIndex = m_desc.swapChain->GetCurrentBackBufferIndex();
        if (swapChainIndex != m_backBufferIndex)
        {
            DiagnosticLogger::LogError("Presenter: back buffer index %u, swap chain reports %u\n",
                m_backBufferIndex, swapChainIndex);
            m_backBufferIndex = swapChainIndex;
        }

        m_desc.renderTarget->Acquire(m_desc.swapChain, m_backBufferIndex, *m_desc.stateTracker);
    }
}
