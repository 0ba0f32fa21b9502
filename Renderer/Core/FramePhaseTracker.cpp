#include "FramePhaseTracker.h"
#include "RenderErrors.h"
#include <string>

namespace TriangleLab::Renderer
{
    namespace
    {
        FramePhase Successor(FramePhase phase)
        {
            switch (phase)
            {
            case FramePhase::Idle:         return FramePhase::Recording;
            case FramePhase::Recording:    return FramePhase::Submitted;
            case FramePhase::Submitted:    return FramePhase::Presented;
            case FramePhase::Presented:    return FramePhase::Synchronized;
            case FramePhase::Synchronized: return FramePhase::Idle;
            case FramePhase::Faulted:      return FramePhase::Faulted;
            }
            return FramePhase::Faulted;
        }
    }

    const char* FramePhaseName(FramePhase phase)
    {
        switch (phase)
        {
        case FramePhase::Idle:         return "Idle";
        case FramePhase::Recording:    return "Recording";
        case FramePhase::Submitted:    return "Submitted";
        case FramePhase::Presented:    return "Presented";
        case FramePhase::Synchronized: return "Synchronized";
        case FramePhase::Faulted:      return "Faulted";
        }
        return "Unknown";
    }

    void FramePhaseTracker::Advance(FramePhase next)
    {
        if (m_phase == FramePhase::Faulted)
            throw OrderingViolation("frame loop stopped: a previous frame failed");

        if (Successor(m_phase) != next)
        {
            throw OrderingViolation(std::string("illegal frame phase transition ")
                + FramePhaseName(m_phase) + " -> " + FramePhaseName(next));
        }

        m_phase = next;
        if (m_phase == FramePhase::Idle)
            ++m_completedFrames;
    }
}
