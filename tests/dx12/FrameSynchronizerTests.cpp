#include <gtest/gtest.h>
#include "TestWindow.h"
#include "Renderer/DX12/FrameSynchronizer.h"

using namespace TriangleLab;
using namespace TriangleLab::Renderer;
using TriangleLab::Tests::TestWindow;

TEST(FrameSynchronizer, FenceValuesStrictlyIncrease)
{
    TestWindow window(64, 64);
    DeviceBundle devices = Tests::CreateWarpDevice(window);

    FrameSynchronizer sync;
    sync.Initialize(devices.device.Get());
    EXPECT_EQ(sync.GetNextFenceValue(), 1u);
    EXPECT_EQ(sync.GetCompletedValue(), 0u);

    uint64_t previous = 0;
    for (int i = 0; i < 100; ++i)
    {
        const uint64_t value = sync.SignalAndWait(devices.commandQueue.Get());
        ASSERT_GT(value, previous);
        ASSERT_GE(sync.GetCompletedValue(), value);
        previous = value;
    }

    EXPECT_EQ(sync.GetLastSignaledValue(), 100u);
    EXPECT_EQ(sync.GetNextFenceValue(), 101u);

    sync.Shutdown();
    EXPECT_FALSE(sync.IsInitialized());
}

TEST(FrameSynchronizer, WaitBeforeInitializeIsOrderingViolation)
{
    TestWindow window(64, 64);
    DeviceBundle devices = Tests::CreateWarpDevice(window);

    FrameSynchronizer sync;
    EXPECT_THROW(sync.SignalAndWait(devices.commandQueue.Get()), OrderingViolation);
}
