#include <gtest/gtest.h>
#include "Renderer/Core/FenceCounter.h"

using namespace TriangleLab;
using namespace TriangleLab::Renderer;

TEST(FenceCounter, StartsAtOneWithNothingSignaled)
{
    FenceCounter counter;
    EXPECT_EQ(counter.Peek(), 1u);
    EXPECT_EQ(counter.LastSignaled(), 0u);
}

TEST(FenceCounter, NextReturnsCurrentThenAdvances)
{
    FenceCounter counter;
    EXPECT_EQ(counter.Next(), 1u);
    EXPECT_EQ(counter.Peek(), 2u);
    EXPECT_EQ(counter.LastSignaled(), 1u);
}

TEST(FenceCounter, StrictlyIncreasingOverManySignals)
{
    FenceCounter counter;
    uint64_t previous = 0;
    for (int i = 0; i < 1000; ++i)
    {
        const uint64_t value = counter.Next();
        ASSERT_GT(value, previous);
        previous = value;
    }
    EXPECT_EQ(previous, 1000u);
}

TEST(FenceCounter, ResetReturnsToInitialValue)
{
    FenceCounter counter;
    counter.Next();
    counter.Next();
    counter.Reset();
    EXPECT_EQ(counter.Peek(), FenceCounter::InitialValue);
}
