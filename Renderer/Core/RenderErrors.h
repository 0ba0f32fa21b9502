#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>

namespace TriangleLab
{
    // Failure categories surfaced by the renderer.
    // Ordering violations are NOT a RenderError: they are programming errors
    // and derive from std::logic_error so callers can tell them apart.
    enum class ErrorKind : uint32_t
    {
        DeviceCreation,     // both driver attempts failed
        PipelineCreation,   // root signature / PSO creation
        ShaderCompile,      // shader collaborator failed to produce bytecode
        ResourceCreation,   // committed resources, heaps, allocators, fences
        GpuCommand          // queue signal, present, device removal
    };

    const char* ErrorKindName(ErrorKind kind);

    // Formats an HRESULT-style code as 0xXXXXXXXX
    std::string FormatResult(int32_t result);

    class RenderError : public std::runtime_error
    {
    public:
        RenderError(ErrorKind kind, const std::string& what, int32_t result = 0);

        ErrorKind GetKind() const { return m_kind; }
        int32_t GetResult() const { return m_result; }

    private:
        ErrorKind m_kind;
        int32_t m_result;
    };

    class DeviceCreationError : public RenderError
    {
    public:
        explicit DeviceCreationError(const std::string& what, int32_t result = 0)
            : RenderError(ErrorKind::DeviceCreation, what, result)
        {
        }
    };

    class PipelineCreationError : public RenderError
    {
    public:
        explicit PipelineCreationError(const std::string& what, int32_t result = 0)
            : RenderError(ErrorKind::PipelineCreation, what, result)
        {
        }

    protected:
        PipelineCreationError(ErrorKind kind, const std::string& what, int32_t result)
            : RenderError(kind, what, result)
        {
        }
    };

    class ShaderCompileError : public PipelineCreationError
    {
    public:
        ShaderCompileError(const std::string& what, int32_t result = 0)
            : PipelineCreationError(ErrorKind::ShaderCompile, what, result)
        {
        }
    };

    class ResourceCreationError : public RenderError
    {
    public:
        explicit ResourceCreationError(const std::string& what, int32_t result = 0)
            : RenderError(ErrorKind::ResourceCreation, what, result)
        {
        }
    };

    class GpuCommandError : public RenderError
    {
    public:
        explicit GpuCommandError(const std::string& what, int32_t result = 0)
            : RenderError(ErrorKind::GpuCommand, what, result)
        {
        }
    };

    // API used in the wrong order (record into a closed list, reset a busy allocator, ...)
    class OrderingViolation : public std::logic_error
    {
    public:
        explicit OrderingViolation(const std::string& what)
            : std::logic_error(what)
        {
        }
    };

    // Throws the RenderError subclass matching kind
    [[noreturn]] void ThrowRenderError(ErrorKind kind, const std::string& what, int32_t result);
}
