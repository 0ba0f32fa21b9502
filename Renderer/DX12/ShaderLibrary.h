#pragma once

#include <d3d12.h>
#include <d3dcommon.h>
#include <wrl/client.h>
#include <cstddef>
#include <string>

namespace TriangleLab::Renderer
{
    // Owned shader blob exposed as D3D12_SHADER_BYTECODE
    struct ShaderBytecode
    {
        Microsoft::WRL::ComPtr<ID3DBlob> blob;

        bool IsEmpty() const { return !blob || blob->GetBufferSize() == 0; }

        D3D12_SHADER_BYTECODE Get() const
        {
            if (!blob)
                return D3D12_SHADER_BYTECODE{ nullptr, 0 };
            return D3D12_SHADER_BYTECODE{ blob->GetBufferPointer(), blob->GetBufferSize() };
        }
    };

    // Shader collaborator: produces the vertex/pixel bytecode pair.
    // Binding contract: POSITION + COLOR in, no resources bound.
    class ShaderLibrary
    {
    public:
        static constexpr const char* VertexEntryPoint = "VShader";
        static constexpr const char* PixelEntryPoint = "PShader";
        static constexpr const char* VertexProfile = "vs_5_0";
        static constexpr const char* PixelProfile = "ps_5_0";

        ShaderLibrary() = default;
        ~ShaderLibrary() = default;

        ShaderLibrary(const ShaderLibrary&) = delete;
        ShaderLibrary& operator=(const ShaderLibrary&) = delete;

        // Compile both entry points from an HLSL file. Throws ShaderCompileError.
        void LoadFromFile(const std::string& path, bool debugInfo);

        // Compile both entry points from in-memory HLSL
        void LoadFromSource(const char* source, size_t length, const char* sourceName, bool debugInfo);

        // Load precompiled .cso blobs
        void LoadPrecompiled(const std::wstring& vertexPath, const std::wstring& pixelPath);

        void Shutdown();

        bool IsLoaded() const { return !m_vertexShader.IsEmpty() && !m_pixelShader.IsEmpty(); }

        const ShaderBytecode& GetVertexShader() const { return m_vertexShader; }
        const ShaderBytecode& GetPixelShader() const { return m_pixelShader; }

    private:
        static UINT CompileFlags(bool debugInfo);

        ShaderBytecode m_vertexShader;
        ShaderBytecode m_pixelShader;
    };
}
