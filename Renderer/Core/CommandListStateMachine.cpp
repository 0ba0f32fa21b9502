#include "CommandListStateMachine.h"
#include "RenderErrors.h"
#include <string>

namespace TriangleLab::Renderer
{
    const char* CommandListStateName(CommandListState state)
    {
        switch (state)
        {
        case CommandListState::Recording: return "Recording";
        case CommandListState::Closed:    return "Closed";
        case CommandListState::Submitted: return "Submitted";
        }
        return "Unknown";
    }

    void CommandListStateMachine::OnAllocatorReset(uint64_t completedFence)
    {
        if (m_state == CommandListState::Recording)
            throw OrderingViolation("command allocator reset while its command list is still recording");

        if (m_awaitingSignal)
            throw OrderingViolation("command allocator reset after a submission that was never fenced");

        if (m_pendingFence > completedFence)
        {
            throw OrderingViolation("command allocator reset while GPU work is in flight (waiting for fence "
                + std::to_string(m_pendingFence) + ", completed " + std::to_string(completedFence) + ")");
        }
    }

    void CommandListStateMachine::OnListReset()
    {
        if (m_state == CommandListState::Recording)
            throw OrderingViolation("command list reset while it is still recording");

        m_state = CommandListState::Recording;
    }

    void CommandListStateMachine::RequireRecording(const char* operation) const
    {
        if (m_state != CommandListState::Recording)
        {
            throw OrderingViolation(std::string(operation ? operation : "command")
                + " recorded into a command list in state " + CommandListStateName(m_state));
        }
    }

    void CommandListStateMachine::OnClose()
    {
        RequireRecording("Close");
        m_state = CommandListState::Closed;
    }

    void CommandListStateMachine::OnSubmit()
    {
        if (m_state != CommandListState::Closed)
        {
            throw OrderingViolation(std::string("command list submitted in state ")
                + CommandListStateName(m_state));
        }

        m_state = CommandListState::Submitted;
        m_awaitingSignal = true;
    }

    void CommandListStateMachine::OnFenceSignaled(uint64_t fenceValue)
    {
        if (!m_awaitingSignal)
            return;

        m_pendingFence = fenceValue;
        m_awaitingSignal = false;
    }

    bool CommandListStateMachine::RecoverAbandoned()
    {
        if (m_state != CommandListState::Recording)
            return false;

        m_state = CommandListState::Closed;
        return true;
    }
}
