#include <gtest/gtest.h>
#include <cstring>
#include "TestWindow.h"
#include "Renderer/DX12/PipelineBuilder.h"
#include "Renderer/DX12/ShaderLibrary.h"
#include "Renderer/DX12/RenderConfig.h"
#include "Renderer/DX12/Vertex.h"

using namespace TriangleLab;
using namespace TriangleLab::Renderer;
using TriangleLab::Tests::TestWindow;

namespace
{
    const char* PassThroughSource =
        "struct PSInput { float4 position : SV_POSITION; float4 color : COLOR; };\n"
        "PSInput VShader(float3 position : POSITION, float4 color : COLOR)\n"
        "{ PSInput r; r.position = float4(position, 1.0f); r.color = color; return r; }\n"
        "float4 PShader(PSInput input) : SV_TARGET { return input.color; }\n";

    class PipelineBuilderTest : public ::testing::Test
    {
    protected:
        void SetUp() override
        {
            m_devices = Tests::CreateWarpDevice(m_window);
            m_shaders.LoadFromSource(PassThroughSource, std::strlen(PassThroughSource), "pass_through", false);
        }

        TestWindow m_window{ 64, 64 };
        DeviceBundle m_devices;
        ShaderLibrary m_shaders;
    };
}

TEST_F(PipelineBuilderTest, BuildsRootSignatureAndPipelineState)
{
    PipelineObjects pipeline = PipelineBuilder::Build(m_devices.device.Get(),
        m_shaders.GetVertexShader().Get(), m_shaders.GetPixelShader().Get(),
        GetVertexInputLayout(), BackBufferFormat);

    EXPECT_NE(pipeline.rootSignature, nullptr);
    EXPECT_NE(pipeline.pipelineState, nullptr);
}

TEST_F(PipelineBuilderTest, EmptyBytecodeIsPipelineCreationError)
{
    EXPECT_THROW(PipelineBuilder::Build(m_devices.device.Get(),
        D3D12_SHADER_BYTECODE{}, m_shaders.GetPixelShader().Get(),
        GetVertexInputLayout(), BackBufferFormat), PipelineCreationError);
}

TEST_F(PipelineBuilderTest, SwappedShaderStagesArePipelineCreationError)
{
    EXPECT_THROW(PipelineBuilder::Build(m_devices.device.Get(),
        m_shaders.GetPixelShader().Get(), m_shaders.GetVertexShader().Get(),
        GetVertexInputLayout(), BackBufferFormat), PipelineCreationError);
}

TEST_F(PipelineBuilderTest, GarbageBytecodeIsPipelineCreationError)
{
    const uint32_t garbage[16] = { 0xDEADBEEF, 0x01234567 };
    D3D12_SHADER_BYTECODE bogus = { garbage, sizeof(garbage) };

    EXPECT_THROW(PipelineBuilder::Build(m_devices.device.Get(),
        bogus, m_shaders.GetPixelShader().Get(),
        GetVertexInputLayout(), BackBufferFormat), PipelineCreationError);
}

TEST_F(PipelineBuilderTest, FixedFunctionDefaults)
{
    const D3D12_RASTERIZER_DESC raster = PipelineBuilder::DefaultRasterizerDesc();
    EXPECT_EQ(raster.FillMode, D3D12_FILL_MODE_SOLID);
    EXPECT_EQ(raster.CullMode, D3D12_CULL_MODE_BACK);
    EXPECT_FALSE(raster.FrontCounterClockwise);

    const D3D12_DEPTH_STENCIL_DESC depth = PipelineBuilder::DisabledDepthStencilDesc();
    EXPECT_FALSE(depth.DepthEnable);
    EXPECT_FALSE(depth.StencilEnable);

    const D3D12_BLEND_DESC blend = PipelineBuilder::DefaultBlendDesc();
    EXPECT_FALSE(blend.RenderTarget[0].BlendEnable);
    EXPECT_EQ(blend.RenderTarget[0].RenderTargetWriteMask, D3D12_COLOR_WRITE_ENABLE_ALL);
}

TEST(ShaderLibrary, InvalidSourceIsShaderCompileError)
{
    const char* broken = "float4 VShader( : POSITION";
    ShaderLibrary shaders;
    EXPECT_THROW(shaders.LoadFromSource(broken, std::strlen(broken), "broken", false), ShaderCompileError);
    EXPECT_FALSE(shaders.IsLoaded());
}

TEST(ShaderLibrary, CompilesProjectShaderFile)
{
    ShaderLibrary shaders;
    shaders.LoadFromFile(Tests::ShaderSourcePath(), false);
    EXPECT_TRUE(shaders.IsLoaded());
}

TEST(ShaderLibrary, MissingFileIsShaderCompileError)
{
    ShaderLibrary shaders;
    EXPECT_THROW(shaders.LoadFromFile("no_such_shader_file.hlsl", false), ShaderCompileError);
}

TEST(ShaderLibrary, MissingPrecompiledBlobIsShaderCompileError)
{
    ShaderLibrary shaders;
    EXPECT_THROW(shaders.LoadPrecompiled(L"no_such_vs.cso", L"no_such_ps.cso"), ShaderCompileError);
    EXPECT_FALSE(shaders.IsLoaded());
}
