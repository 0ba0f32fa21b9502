#pragma once

#include <cstdint>

namespace TriangleLab::Renderer
{
    enum class CommandListState : uint32_t
    {
        Recording,  // open: commands may be emitted
        Closed,     // ready for submission
        Submitted   // handed to the queue, GPU may still be reading it
    };

    const char* CommandListStateName(CommandListState state);

    // CPU-side bookkeeping for one allocator + command list pair.
    // The D3D12 runtime does not validate these rules in release builds, so
    // every violation throws OrderingViolation here instead.
    //
    // Allocator rule: reset only once the fence value covering its last
    // submission has completed. A submission without a recorded fence value
    // is treated as in flight.
    class CommandListStateMachine
    {
    public:
        // Command lists are created open
        explicit CommandListStateMachine(CommandListState initial = CommandListState::Recording)
            : m_state(initial)
        {
        }

        CommandListState GetState() const { return m_state; }
        bool IsRecording() const { return m_state == CommandListState::Recording; }

        // Fence value covering the last submission (0 if nothing was fenced yet)
        uint64_t GetPendingFence() const { return m_pendingFence; }
        bool IsAwaitingSignal() const { return m_awaitingSignal; }

        void OnAllocatorReset(uint64_t completedFence);
        void OnListReset();
        void RequireRecording(const char* operation) const;
        void OnClose();
        void OnSubmit();

        // Binds the last submission to the fence value that will retire it
        void OnFenceSignaled(uint64_t fenceValue);

        // A recording aborted by an exception leaves the list open.
        // Returns true if the list was open and is now considered closed.
        bool RecoverAbandoned();

    private:
        CommandListState m_state;
        uint64_t m_pendingFence = 0;
        bool m_awaitingSignal = false;
    };
}
