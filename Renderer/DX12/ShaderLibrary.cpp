#include "ShaderLibrary.h"
#include "DiagnosticLogger.h"
#include "../Core/RenderErrors.h"
#include <Windows.h>
#include <d3dcompiler.h>

using Microsoft::WRL::ComPtr;

namespace TriangleLab::Renderer
{
    namespace
    {
        std::wstring Widen(const std::string& s)
        {
            if (s.empty())
                return std::wstring();

            int len = MultiByteToWideChar(CP_UTF8, 0, s.c_str(), static_cast<int>(s.size()), nullptr, 0);
            std::wstring out(static_cast<size_t>(len), L'\0');
            MultiByteToWideChar(CP_UTF8, 0, s.c_str(), static_cast<int>(s.size()), out.data(), len);
            return out;
        }

        std::string Narrow(const std::wstring& s)
        {
            if (s.empty())
                return std::string();

            int len = WideCharToMultiByte(CP_UTF8, 0, s.c_str(), static_cast<int>(s.size()), nullptr, 0, nullptr, nullptr);
            std::string out(static_cast<size_t>(len), '\0');
            WideCharToMultiByte(CP_UTF8, 0, s.c_str(), static_cast<int>(s.size()), out.data(), len, nullptr, nullptr);
            return out;
        }

        // Throws with the compiler output attached
        void CheckCompile(HRESULT hr, ID3DBlob* errorBlob, const char* stage, const std::string& source)
        {
            if (SUCCEEDED(hr))
                return;

            std::string msg = std::string(stage) + " compile error in " + source;
            if (errorBlob && errorBlob->GetBufferSize() > 0)
            {
                msg += ": ";
                msg.append(static_cast<const char*>(errorBlob->GetBufferPointer()), errorBlob->GetBufferSize());
                while (!msg.empty() && (msg.back() == '\0' || msg.back() == '\n'))
                    msg.pop_back();
            }

            DiagnosticLogger::LogError("ShaderLibrary: %s\n", msg.c_str());
            throw ShaderCompileError(msg, static_cast<int32_t>(hr));
        }
    }

    UINT ShaderLibrary::CompileFlags(bool debugInfo)
    {
        UINT flags = D3DCOMPILE_ENABLE_STRICTNESS;
        if (debugInfo)
            flags |= D3DCOMPILE_DEBUG | D3DCOMPILE_SKIP_OPTIMIZATION;
        return flags;
    }

    void ShaderLibrary::LoadFromFile(const std::string& path, bool debugInfo)
    {
        const std::wstring widePath = Widen(path);
        const UINT flags = CompileFlags(debugInfo);

        ShaderBytecode vertex;
        ShaderBytecode pixel;
        ComPtr<ID3DBlob> errorBlob;

        HRESULT hr = D3DCompileFromFile(widePath.c_str(), nullptr, D3D_COMPILE_STANDARD_FILE_INCLUDE,
            VertexEntryPoint, VertexProfile, flags, 0, &vertex.blob, &errorBlob);
        CheckCompile(hr, errorBlob.Get(), "vertex shader", path);

        errorBlob.Reset();
        hr = D3DCompileFromFile(widePath.c_str(), nullptr, D3D_COMPILE_STANDARD_FILE_INCLUDE,
            PixelEntryPoint, PixelProfile, flags, 0, &pixel.blob, &errorBlob);
        CheckCompile(hr, errorBlob.Get(), "pixel shader", path);

        m_vertexShader = vertex;
        m_pixelShader = pixel;

        DiagnosticLogger::Log("ShaderLibrary: compiled %s (%s/%s)\n", path.c_str(), VertexEntryPoint, PixelEntryPoint);
    }

    void ShaderLibrary::LoadFromSource(const char* source, size_t length, const char* sourceName, bool debugInfo)
    {
        if (!source || length == 0)
            throw ShaderCompileError("empty shader source");

        const UINT flags = CompileFlags(debugInfo);
        const std::string name = sourceName ? sourceName : "(memory)";

        ShaderBytecode vertex;
        ShaderBytecode pixel;
        ComPtr<ID3DBlob> errorBlob;

        HRESULT hr = D3DCompile(source, length, name.c_str(), nullptr, nullptr,
            VertexEntryPoint, VertexProfile, flags, 0, &vertex.blob, &errorBlob);
        CheckCompile(hr, errorBlob.Get(), "vertex shader", name);

        errorBlob.Reset();
        hr = D3DCompile(source, length, name.c_str(), nullptr, nullptr,
            PixelEntryPoint, PixelProfile, flags, 0, &pixel.blob, &errorBlob);
        CheckCompile(hr, errorBlob.Get(), "pixel shader", name);

        m_vertexShader = vertex;
        m_pixelShader = pixel;
    }

    void ShaderLibrary::LoadPrecompiled(const std::wstring& vertexPath, const std::wstring& pixelPath)
    {
        ShaderBytecode vertex;
        ShaderBytecode pixel;

        HRESULT hr = D3DReadFileToBlob(vertexPath.c_str(), &vertex.blob);
        CheckCompile(hr, nullptr, "vertex shader (precompiled)", Narrow(vertexPath));

        hr = D3DReadFileToBlob(pixelPath.c_str(), &pixel.blob);
        CheckCompile(hr, nullptr, "pixel shader (precompiled)", Narrow(pixelPath));

        m_vertexShader = vertex;
        m_pixelShader = pixel;
    }

    void ShaderLibrary::Shutdown()
    {
        m_vertexShader.blob.Reset();
        m_pixelShader.blob.Reset();
    }
}
