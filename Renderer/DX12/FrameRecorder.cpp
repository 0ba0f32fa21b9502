#include "FrameRecorder.h"
#include "BarrierScope.h"
#include "DiagnosticLogger.h"

namespace TriangleLab::Renderer
{
    void FrameRecorder::Initialize(CommandContext* commandContext, ResourceStateTracker* stateTracker)
    {
        m_commandContext = commandContext;
        m_stateTracker = stateTracker;
    }

    void FrameRecorder::Record(uint64_t completedFence, const FrameBindings& bindings)
    {
        if (!m_commandContext || !m_stateTracker)
            throw OrderingViolation("frame recorder used before Initialize");
        if (!bindings.pipelineState || !bindings.rootSignature || !bindings.renderTarget)
            throw OrderingViolation("frame recorder: incomplete frame bindings");

        // A previous frame that threw mid-recording left the list open
        if (m_commandContext->RecoverAbandoned())
            DiagnosticLogger::LogError("FrameRecorder: recovered abandoned command list\n");

        m_commandContext->Reset(bindings.pipelineState, completedFence);

        try
        {
            ID3D12GraphicsCommandList* cmd = m_commandContext->Recording("SetGraphicsRootSignature");
            cmd->SetGraphicsRootSignature(bindings.rootSignature);
            cmd->RSSetViewports(1, &bindings.viewport);
            cmd->RSSetScissorRects(1, &bindings.scissorRect);

            {
                BackbufferScope backbuffer(*m_stateTracker, cmd, bindings.renderTarget);
                RecordDraw(cmd, bindings);
            }

            m_commandContext->Close();
        }
        catch (...)
        {
            m_stateTracker->DiscardPendingBarriers();
            throw;
        }
    }

    void FrameRecorder::RecordDraw(ID3D12GraphicsCommandList* cmd, const FrameBindings& bindings)
    {
        m_commandContext->Recording("ClearRenderTargetView");
        cmd->ClearRenderTargetView(bindings.rtvHandle, bindings.clearColor, 0, nullptr);

        cmd->OMSetRenderTargets(1, &bindings.rtvHandle, FALSE, nullptr);
        cmd->IASetPrimitiveTopology(D3D_PRIMITIVE_TOPOLOGY_TRIANGLELIST);
        cmd->IASetVertexBuffers(0, 1, &bindings.vertexBufferView);

        m_commandContext->Recording("DrawInstanced");
        cmd->DrawInstanced(bindings.vertexCount, bindings.instanceCount, 0, 0);
    }
}
