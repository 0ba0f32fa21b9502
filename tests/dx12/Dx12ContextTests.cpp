#include <gtest/gtest.h>
#include <string>
#include <utility>
#include "TestWindow.h"
#include "Renderer/DX12/Dx12Context.h"

using namespace TriangleLab;
using namespace TriangleLab::Renderer;
using TriangleLab::Tests::TestWindow;

namespace
{
    Config::RenderSettings WarpSettings(uint32_t width, uint32_t height)
    {
        Config::RenderSettings settings;
        settings.width = width;
        settings.height = height;
        settings.shaderPath = Tests::ShaderSourcePath();
        settings.driver = DriverType::Software;
        settings.debugLayer = false;
        settings.syncInterval = 0;
        return settings;
    }

    class Dx12ContextSizeTest : public ::testing::TestWithParam<std::pair<uint32_t, uint32_t>>
    {
    };

    // Current reference count without changing it
    ULONG RefCount(IUnknown* object)
    {
        object->AddRef();
        return object->Release();
    }

    // Runs frames until one fails, then checks the loop stays stopped and
    // shutdown still drains the queue
    void ExpectFrameLoopStops(Dx12Context& context)
    {
        EXPECT_THROW(context.RenderFrame(), OrderingViolation);
        EXPECT_EQ(context.GetFramePhase(), FramePhase::Faulted);

        const uint64_t framesBefore = context.GetFrameCount();
        try
        {
            context.RenderFrame();
            FAIL() << "a faulted frame loop rendered again";
        }
        catch (const OrderingViolation& e)
        {
            EXPECT_NE(std::string(e.what()).find("previous frame failed"), std::string::npos) << e.what();
        }
        EXPECT_EQ(context.GetFrameCount(), framesBefore);

        const uint64_t lastFence = context.GetLastFenceValue();
        EXPECT_NO_THROW(context.Shutdown());
        EXPECT_FALSE(context.IsInitialized());

        // Shutdown signaled and waited once more
        EXPECT_EQ(context.GetLastFenceValue(), lastFence + 1);
    }
}

TEST_P(Dx12ContextSizeTest, InitializeThenShutdown)
{
    const auto [width, height] = GetParam();
    TestWindow window(width, height);

    Dx12Context context;
    ASSERT_NO_THROW(context.Initialize(window.GetHandle(), width, height, WarpSettings(width, height)));
    EXPECT_TRUE(context.IsInitialized());
    EXPECT_EQ(context.GetDriverType(), DriverType::Software);

    // One fenced submission at startup, nothing rendered yet
    EXPECT_EQ(context.GetLastFenceValue(), 1u);
    EXPECT_EQ(context.GetFrameCount(), 0u);

    EXPECT_NO_THROW(context.Shutdown());
    EXPECT_FALSE(context.IsInitialized());
}

INSTANTIATE_TEST_SUITE_P(WindowSizes, Dx12ContextSizeTest, ::testing::Values(
    std::make_pair(1u, 1u),
    std::make_pair(800u, 600u),
    std::make_pair(1920u, 1080u),
    std::make_pair(333u, 77u)));

TEST(Dx12Context, ThousandFramesKeepOneBackBufferAlive)
{
    TestWindow window(800, 600);
    Dx12Context context;
    context.Initialize(window.GetHandle(), 800, 600, WarpSettings(800, 600));

    // Back buffers alternate, so each index keeps its own reference count
    ULONG backBufferRefs[2] = {};
    backBufferRefs[context.GetBackBufferIndex()] = RefCount(context.GetBackBuffer());

    uint64_t previousFence = context.GetLastFenceValue();
    for (int frame = 0; frame < 1000; ++frame)
    {
        context.Update();
        context.RenderFrame();

        const uint64_t fence = context.GetLastFenceValue();
        ASSERT_GT(fence, previousFence);
        previousFence = fence;

        // The only tracked resource is the current back buffer
        ASSERT_EQ(context.GetTrackedResourceCount(), 1u);
        ASSERT_EQ(context.GetBackBufferIndex(), static_cast<uint32_t>((frame + 1) % 2));

        ULONG& expectedRefs = backBufferRefs[context.GetBackBufferIndex()];
        const ULONG refs = RefCount(context.GetBackBuffer());
        if (expectedRefs == 0)
            expectedRefs = refs;
        ASSERT_EQ(refs, expectedRefs) << "frame " << frame;
    }

    EXPECT_EQ(context.GetFrameCount(), 1000u);
    context.Shutdown();
}

TEST(Dx12Context, ShutdownIsIdempotent)
{
    TestWindow window(320, 240);
    Dx12Context context;
    context.Initialize(window.GetHandle(), 320, 240, WarpSettings(320, 240));
    context.RenderFrame();

    context.Shutdown();
    EXPECT_NO_THROW(context.Shutdown());
    EXPECT_FALSE(context.IsInitialized());
}

TEST(Dx12Context, ShutdownWithoutInitializeIsNoop)
{
    Dx12Context context;
    EXPECT_NO_THROW(context.Shutdown());
}

TEST(Dx12Context, RenderBeforeInitializeIsOrderingViolation)
{
    Dx12Context context;
    EXPECT_THROW(context.RenderFrame(), OrderingViolation);
}

TEST(Dx12Context, SecondInitializeIsOrderingViolation)
{
    TestWindow window(320, 240);
    Dx12Context context;
    context.Initialize(window.GetHandle(), 320, 240, WarpSettings(320, 240));
    EXPECT_THROW(context.Initialize(window.GetHandle(), 320, 240, WarpSettings(320, 240)), OrderingViolation);
    context.Shutdown();
}

TEST(Dx12Context, MissingShaderFailsInitializationCleanly)
{
    TestWindow window(320, 240);
    Config::RenderSettings settings = WarpSettings(320, 240);
    settings.shaderPath = "no_such_shader_file.hlsl";

    Dx12Context context;
    EXPECT_THROW(context.Initialize(window.GetHandle(), 320, 240, settings), ShaderCompileError);
    EXPECT_FALSE(context.IsInitialized());
    EXPECT_EQ(context.GetDevice(), nullptr);

    // Same window can host a fresh swap chain afterwards
    EXPECT_NO_THROW(context.Initialize(window.GetHandle(), 320, 240, WarpSettings(320, 240)));
    context.Shutdown();
}

TEST(Dx12Context, CanReinitializeAfterShutdown)
{
    TestWindow window(320, 240);
    Dx12Context context;

    for (int cycle = 0; cycle < 3; ++cycle)
    {
        context.Initialize(window.GetHandle(), 320, 240, WarpSettings(320, 240));
        EXPECT_EQ(context.GetFrameCount(), 0u) << "cycle " << cycle;
        EXPECT_EQ(context.GetFramePhase(), FramePhase::Idle);

        context.RenderFrame();
        context.RenderFrame();
        EXPECT_EQ(context.GetFrameCount(), 2u);
        context.Shutdown();
    }
}

TEST(Dx12Context, UntrackedBackBufferStopsTheFrameLoop)
{
    TestWindow window(320, 240);
    Dx12Context context;
    context.Initialize(window.GetHandle(), 320, 240, WarpSettings(320, 240));
    context.RenderFrame();

    context.GetStateTracker().Unregister(context.GetBackBuffer());
    ExpectFrameLoopStops(context);
}

TEST(Dx12Context, BackBufferOutOfPresentStopsTheFrameLoop)
{
    TestWindow window(320, 240);
    Dx12Context context;
    context.Initialize(window.GetHandle(), 320, 240, WarpSettings(320, 240));
    context.RenderFrame();

    context.GetStateTracker().AssumeState(context.GetBackBuffer(), D3D12_RESOURCE_STATE_RENDER_TARGET, "BackBuffer");
    ExpectFrameLoopStops(context);
}
