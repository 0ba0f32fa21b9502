#include "CommandContext.h"
#include "Dx12Check.h"
#include "DiagnosticLogger.h"

namespace TriangleLab::Renderer
{
    void CommandContext::Initialize(ID3D12Device* device, ID3D12PipelineState* initialPipeline)
    {
        if (!device)
            throw ResourceCreationError("command context: no device");

        ThrowIfFailed(device->CreateCommandAllocator(
            D3D12_COMMAND_LIST_TYPE_DIRECT,
            IID_PPV_ARGS(&m_allocator)),
            ErrorKind::ResourceCreation, "CreateCommandAllocator");

        ThrowIfFailed(device->CreateCommandList(
            0,
            D3D12_COMMAND_LIST_TYPE_DIRECT,
            m_allocator.Get(),
            initialPipeline,
            IID_PPV_ARGS(&m_commandList)),
            ErrorKind::ResourceCreation, "CreateCommandList");

        m_state = CommandListStateMachine(CommandListState::Recording);
    }

    void CommandContext::Shutdown()
    {
        m_commandList.Reset();
        m_allocator.Reset();
        m_state = CommandListStateMachine(CommandListState::Closed);
    }

    void CommandContext::Reset(ID3D12PipelineState* pipeline, uint64_t completedFence)
    {
        if (!m_commandList)
            throw OrderingViolation("command context used before Initialize");

        // Allocator memory may only be recycled once the GPU retired every list built from it
        m_state.OnAllocatorReset(completedFence);
        ThrowIfFailed(m_allocator->Reset(), ErrorKind::GpuCommand, "ID3D12CommandAllocator::Reset");

        m_state.OnListReset();
        HRESULT hr = m_commandList->Reset(m_allocator.Get(), pipeline);
        if (FAILED(hr))
        {
            m_state.RecoverAbandoned();
            ThrowIfFailed(hr, ErrorKind::GpuCommand, "ID3D12GraphicsCommandList::Reset");
        }
    }

    ID3D12GraphicsCommandList* CommandContext::Recording(const char* operation)
    {
        m_state.RequireRecording(operation);
        return m_commandList.Get();
    }

    void CommandContext::Close()
    {
        m_state.OnClose();
        ThrowIfFailed(m_commandList->Close(), ErrorKind::GpuCommand, "ID3D12GraphicsCommandList::Close");
    }

    void CommandContext::Submit(ID3D12CommandQueue* queue)
    {
        if (!queue)
            throw OrderingViolation("command list submitted without a queue");

        m_state.OnSubmit();

        ID3D12CommandList* commandLists[] = { m_commandList.Get() };
        queue->ExecuteCommandLists(1, commandLists);
    }

    bool CommandContext::RecoverAbandoned()
    {
        if (!m_state.RecoverAbandoned())
            return false;

        // Close() on a list with recording errors reports them; the content is discarded anyway
        HRESULT hr = m_commandList->Close();
        DiagnosticLogger::Log("CommandContext: closed abandoned command list (hr=0x%08X)\n", static_cast<unsigned>(hr));
        return true;
    }
}
