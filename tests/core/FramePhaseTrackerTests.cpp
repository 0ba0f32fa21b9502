#include <gtest/gtest.h>
#include "Renderer/Core/FramePhaseTracker.h"
#include "Renderer/Core/RenderErrors.h"

using namespace TriangleLab;
using namespace TriangleLab::Renderer;

namespace
{
    void RunFrame(FramePhaseTracker& tracker)
    {
        tracker.Advance(FramePhase::Recording);
        tracker.Advance(FramePhase::Submitted);
        tracker.Advance(FramePhase::Presented);
        tracker.Advance(FramePhase::Synchronized);
        tracker.Advance(FramePhase::Idle);
    }
}

TEST(FramePhaseTracker, StartsIdle)
{
    FramePhaseTracker tracker;
    EXPECT_EQ(tracker.GetPhase(), FramePhase::Idle);
    EXPECT_EQ(tracker.GetCompletedFrames(), 0u);
}

TEST(FramePhaseTracker, CountsCompletedFrames)
{
    FramePhaseTracker tracker;
    for (int i = 0; i < 10; ++i)
        RunFrame(tracker);

    EXPECT_EQ(tracker.GetPhase(), FramePhase::Idle);
    EXPECT_EQ(tracker.GetCompletedFrames(), 10u);
}

TEST(FramePhaseTracker, SkippingPresentIsOrderingViolation)
{
    FramePhaseTracker tracker;
    tracker.Advance(FramePhase::Recording);
    tracker.Advance(FramePhase::Submitted);
    EXPECT_THROW(tracker.Advance(FramePhase::Synchronized), OrderingViolation);
}

TEST(FramePhaseTracker, ReenteringRecordingIsOrderingViolation)
{
    FramePhaseTracker tracker;
    tracker.Advance(FramePhase::Recording);
    EXPECT_THROW(tracker.Advance(FramePhase::Recording), OrderingViolation);
}

TEST(FramePhaseTracker, FaultedStopsTheLoopUntilReset)
{
    FramePhaseTracker tracker;
    tracker.Advance(FramePhase::Recording);
    tracker.MarkFaulted();
    EXPECT_TRUE(tracker.IsFaulted());
    EXPECT_THROW(tracker.Advance(FramePhase::Recording), OrderingViolation);
    EXPECT_THROW(tracker.Advance(FramePhase::Submitted), OrderingViolation);

    tracker.Reset();
    EXPECT_NO_THROW(RunFrame(tracker));
    EXPECT_EQ(tracker.GetCompletedFrames(), 1u);
}
