#include "PipelineBuilder.h"
#include "Dx12Check.h"
#include "DiagnosticLogger.h"
#include <climits>
#include <string>

using Microsoft::WRL::ComPtr;

namespace TriangleLab::Renderer
{
    namespace
    {
        D3D_ROOT_SIGNATURE_VERSION HighestRootSignatureVersion(ID3D12Device* device)
        {
            D3D12_FEATURE_DATA_ROOT_SIGNATURE featureData = {};
            featureData.HighestVersion = D3D_ROOT_SIGNATURE_VERSION_1_1;

            if (FAILED(device->CheckFeatureSupport(D3D12_FEATURE_ROOT_SIGNATURE, &featureData, sizeof(featureData))))
                return D3D_ROOT_SIGNATURE_VERSION_1_0;

            return featureData.HighestVersion;
        }
    }

    PipelineObjects PipelineBuilder::Build(ID3D12Device* device,
                                           D3D12_SHADER_BYTECODE vertexShader,
                                           D3D12_SHADER_BYTECODE pixelShader,
                                           const D3D12_INPUT_LAYOUT_DESC& inputLayout,
                                           DXGI_FORMAT renderTargetFormat)
    {
        if (!device)
            throw PipelineCreationError("no device");

        if (!vertexShader.pShaderBytecode || vertexShader.BytecodeLength == 0)
            throw PipelineCreationError("vertex shader bytecode is empty");

        if (!pixelShader.pShaderBytecode || pixelShader.BytecodeLength == 0)
            throw PipelineCreationError("pixel shader bytecode is empty");

        // 1. Root signature
        PipelineObjects objects;
        objects.rootSignature = CreateEmptyRootSignature(device);

        // 2. PSO description
        D3D12_GRAPHICS_PIPELINE_STATE_DESC psoDesc = {};
        psoDesc.InputLayout = inputLayout;
        psoDesc.pRootSignature = objects.rootSignature.Get();
        psoDesc.VS = vertexShader;
        psoDesc.PS = pixelShader;
        psoDesc.RasterizerState = DefaultRasterizerDesc();
        psoDesc.BlendState = DefaultBlendDesc();
        psoDesc.DepthStencilState = DisabledDepthStencilDesc();
        psoDesc.SampleMask = UINT_MAX;
        psoDesc.PrimitiveTopologyType = D3D12_PRIMITIVE_TOPOLOGY_TYPE_TRIANGLE;
        psoDesc.NumRenderTargets = 1;
        psoDesc.RTVFormats[0] = renderTargetFormat;
        psoDesc.DSVFormat = DXGI_FORMAT_UNKNOWN;
        psoDesc.SampleDesc.Count = 1;
        psoDesc.SampleDesc.Quality = 0;

        // 3. PSO
        ThrowIfFailed(device->CreateGraphicsPipelineState(&psoDesc, IID_PPV_ARGS(&objects.pipelineState)),
            ErrorKind::PipelineCreation, "CreateGraphicsPipelineState");

        DiagnosticLogger::Log("PipelineBuilder: PSO created\n");
        return objects;
    }

    ComPtr<ID3D12RootSignature> PipelineBuilder::CreateEmptyRootSignature(ID3D12Device* device)
    {
        D3D12_VERSIONED_ROOT_SIGNATURE_DESC rootSigDesc = {};
        rootSigDesc.Version = HighestRootSignatureVersion(device);
        if (rootSigDesc.Version == D3D_ROOT_SIGNATURE_VERSION_1_0)
        {
            rootSigDesc.Desc_1_0.NumParameters = 0;
            rootSigDesc.Desc_1_0.pParameters = nullptr;
            rootSigDesc.Desc_1_0.NumStaticSamplers = 0;
            rootSigDesc.Desc_1_0.pStaticSamplers = nullptr;
            rootSigDesc.Desc_1_0.Flags = D3D12_ROOT_SIGNATURE_FLAG_ALLOW_INPUT_ASSEMBLER_INPUT_LAYOUT;
        }
        else
        {
            rootSigDesc.Version = D3D_ROOT_SIGNATURE_VERSION_1_1;
            rootSigDesc.Desc_1_1.NumParameters = 0;
            rootSigDesc.Desc_1_1.pParameters = nullptr;
            rootSigDesc.Desc_1_1.NumStaticSamplers = 0;
            rootSigDesc.Desc_1_1.pStaticSamplers = nullptr;
            rootSigDesc.Desc_1_1.Flags = D3D12_ROOT_SIGNATURE_FLAG_ALLOW_INPUT_ASSEMBLER_INPUT_LAYOUT;
        }

        ComPtr<ID3DBlob> signatureBlob;
        ComPtr<ID3DBlob> errorBlob;

        HRESULT hr = D3D12SerializeVersionedRootSignature(&rootSigDesc, &signatureBlob, &errorBlob);
        if (FAILED(hr))
        {
            std::string msg = "D3D12SerializeVersionedRootSignature";
            if (errorBlob)
            {
                msg += ": ";
                msg += static_cast<const char*>(errorBlob->GetBufferPointer());
            }
            ThrowIfFailed(hr, ErrorKind::PipelineCreation, msg.c_str());
        }

        ComPtr<ID3D12RootSignature> rootSignature;
        ThrowIfFailed(device->CreateRootSignature(
            0,
            signatureBlob->GetBufferPointer(),
            signatureBlob->GetBufferSize(),
            IID_PPV_ARGS(&rootSignature)),
            ErrorKind::PipelineCreation, "CreateRootSignature");

        return rootSignature;
    }

    D3D12_RASTERIZER_DESC PipelineBuilder::DefaultRasterizerDesc()
    {
        D3D12_RASTERIZER_DESC rasterizer = {};
        rasterizer.FillMode = D3D12_FILL_MODE_SOLID;
        rasterizer.CullMode = D3D12_CULL_MODE_BACK;
        rasterizer.FrontCounterClockwise = FALSE;
        rasterizer.DepthBias = D3D12_DEFAULT_DEPTH_BIAS;
        rasterizer.DepthBiasClamp = D3D12_DEFAULT_DEPTH_BIAS_CLAMP;
        rasterizer.SlopeScaledDepthBias = D3D12_DEFAULT_SLOPE_SCALED_DEPTH_BIAS;
        rasterizer.DepthClipEnable = TRUE;
        rasterizer.MultisampleEnable = FALSE;
        rasterizer.AntialiasedLineEnable = FALSE;
        rasterizer.ForcedSampleCount = 0;
        rasterizer.ConservativeRaster = D3D12_CONSERVATIVE_RASTERIZATION_MODE_OFF;
        return rasterizer;
    }

    D3D12_BLEND_DESC PipelineBuilder::DefaultBlendDesc()
    {
        D3D12_BLEND_DESC blend = {};
        blend.AlphaToCoverageEnable = FALSE;
        blend.IndependentBlendEnable = FALSE;
        for (D3D12_RENDER_TARGET_BLEND_DESC& rt : blend.RenderTarget)
        {
            rt.BlendEnable = FALSE;
            rt.LogicOpEnable = FALSE;
            rt.SrcBlend = D3D12_BLEND_ONE;
            rt.DestBlend = D3D12_BLEND_ZERO;
            rt.BlendOp = D3D12_BLEND_OP_ADD;
            rt.SrcBlendAlpha = D3D12_BLEND_ONE;
            rt.DestBlendAlpha = D3D12_BLEND_ZERO;
            rt.BlendOpAlpha = D3D12_BLEND_OP_ADD;
            rt.LogicOp = D3D12_LOGIC_OP_NOOP;
            rt.RenderTargetWriteMask = D3D12_COLOR_WRITE_ENABLE_ALL;
        }
        return blend;
    }

    D3D12_DEPTH_STENCIL_DESC PipelineBuilder::DisabledDepthStencilDesc()
    {
        D3D12_DEPTH_STENCIL_DESC depthStencil = {};
        depthStencil.DepthEnable = FALSE;
        depthStencil.DepthWriteMask = D3D12_DEPTH_WRITE_MASK_ZERO;
        depthStencil.DepthFunc = D3D12_COMPARISON_FUNC_LESS;
        depthStencil.StencilEnable = FALSE;
        depthStencil.StencilReadMask = D3D12_DEFAULT_STENCIL_READ_MASK;
        depthStencil.StencilWriteMask = D3D12_DEFAULT_STENCIL_WRITE_MASK;
        const D3D12_DEPTH_STENCILOP_DESC defaultOp = {
            D3D12_STENCIL_OP_KEEP, D3D12_STENCIL_OP_KEEP, D3D12_STENCIL_OP_KEEP, D3D12_COMPARISON_FUNC_ALWAYS };
        depthStencil.FrontFace = defaultOp;
        depthStencil.BackFace = defaultOp;
        return depthStencil;
    }
}
