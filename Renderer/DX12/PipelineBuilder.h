#pragma once

#include <d3d12.h>
#include <wrl/client.h>

namespace TriangleLab::Renderer
{
    // Immutable after Build(); shared read-only by every frame
    struct PipelineObjects
    {
        Microsoft::WRL::ComPtr<ID3D12RootSignature> rootSignature;
        Microsoft::WRL::ComPtr<ID3D12PipelineState> pipelineState;
    };

    // Fixed pipeline configuration for the triangle pass:
    //   - empty root signature (input assembler layout only)
    //   - default rasterizer + blend, depth/stencil disabled
    //   - triangle topology, one render target, no MSAA
    class PipelineBuilder
    {
    public:
        // Throws PipelineCreationError on any failure
        static PipelineObjects Build(ID3D12Device* device,
                                     D3D12_SHADER_BYTECODE vertexShader,
                                     D3D12_SHADER_BYTECODE pixelShader,
                                     const D3D12_INPUT_LAYOUT_DESC& inputLayout,
                                     DXGI_FORMAT renderTargetFormat);

        static Microsoft::WRL::ComPtr<ID3D12RootSignature> CreateEmptyRootSignature(ID3D12Device* device);

        static D3D12_RASTERIZER_DESC DefaultRasterizerDesc();
        static D3D12_BLEND_DESC DefaultBlendDesc();
        static D3D12_DEPTH_STENCIL_DESC DisabledDepthStencilDesc();
    };
}
