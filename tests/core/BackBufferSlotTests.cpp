#include <gtest/gtest.h>
#include <algorithm>
#include <memory>
#include <stdexcept>
#include "Renderer/Core/BackBufferSlot.h"

using namespace TriangleLab::Renderer;

namespace
{
    // Stand-in for a swap chain buffer: counts how many are alive
    struct FakeBuffer
    {
        FakeBuffer(uint32_t index, int& live) : index(index), live(live) { ++live; }
        ~FakeBuffer() { --live; }

        uint32_t index;
        int& live;
    };

    using FakeHandle = std::shared_ptr<FakeBuffer>;
}

TEST(BackBufferSlot, StartsEmpty)
{
    BackBufferSlot<FakeHandle> slot;
    EXPECT_TRUE(slot.IsEmpty());
    EXPECT_EQ(slot.GetIndex(), BackBufferSlot<FakeHandle>::InvalidIndex);
}

TEST(BackBufferSlot, ReleasesPreviousBeforeFetchingNext)
{
    int live = 0;
    int maxLiveDuringFetch = 0;
    BackBufferSlot<FakeHandle> slot;

    auto fetch = [&](uint32_t index)
    {
        maxLiveDuringFetch = (std::max)(maxLiveDuringFetch, live);
        return std::make_shared<FakeBuffer>(index, live);
    };

    for (uint32_t frame = 0; frame < 1000; ++frame)
    {
        slot.Replace(frame % 2, fetch);
        ASSERT_EQ(live, 1);
        ASSERT_EQ(slot.GetIndex(), frame % 2);
        ASSERT_EQ(slot.Get()->index, frame % 2);
    }

    // The old handle is gone by the time the swap chain is asked for the new one
    EXPECT_EQ(maxLiveDuringFetch, 0);

    slot.Release();
    EXPECT_EQ(live, 0);
    EXPECT_TRUE(slot.IsEmpty());
}

TEST(BackBufferSlot, FailedFetchLeavesSlotEmpty)
{
    int live = 0;
    BackBufferSlot<FakeHandle> slot;
    slot.Replace(0, [&](uint32_t index) { return std::make_shared<FakeBuffer>(index, live); });

    EXPECT_THROW(slot.Replace(1, [](uint32_t) -> FakeHandle { throw std::runtime_error("GetBuffer failed"); }),
        std::runtime_error);
    EXPECT_TRUE(slot.IsEmpty());
    EXPECT_EQ(live, 0);
}
