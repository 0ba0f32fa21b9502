#pragma once

#include <cstdint>

namespace TriangleLab::Renderer
{
    // Per-frame orchestration phases.
    // Idle -> Recording -> Submitted -> Presented -> Synchronized -> Idle
    enum class FramePhase : uint32_t
    {
        Idle,
        Recording,
        Submitted,
        Presented,
        Synchronized,
        Faulted     // a frame threw; the loop must not continue
    };

    const char* FramePhaseName(FramePhase phase);

    class FramePhaseTracker
    {
    public:
        FramePhase GetPhase() const { return m_phase; }
        bool IsFaulted() const { return m_phase == FramePhase::Faulted; }

        // Frames that made it back to Idle
        uint64_t GetCompletedFrames() const { return m_completedFrames; }

        // Throws OrderingViolation on anything but the next legal phase
        void Advance(FramePhase next);

        void MarkFaulted() { m_phase = FramePhase::Faulted; }

        // Back to Idle, keeps the completed frame count
        void Reset() { m_phase = FramePhase::Idle; }

    private:
        FramePhase m_phase = FramePhase::Idle;
        uint64_t m_completedFrames = 0;
    };
}
