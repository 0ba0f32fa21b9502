#include "RenderErrors.h"
#include <cstdio>

namespace TriangleLab
{
    namespace
    {
        std::string BuildMessage(ErrorKind kind, const std::string& what, int32_t result)
        {
            std::string msg = ErrorKindName(kind);
            msg += ": ";
            msg += what;
            if (result != 0)
            {
                msg += " (hr=";
                msg += FormatResult(result);
                msg += ")";
            }
            return msg;
        }
    }

    const char* ErrorKindName(ErrorKind kind)
    {
        switch (kind)
        {
        case ErrorKind::DeviceCreation:   return "device creation failed";
        case ErrorKind::PipelineCreation: return "pipeline creation failed";
        case ErrorKind::ShaderCompile:    return "shader compilation failed";
        case ErrorKind::ResourceCreation: return "resource creation failed";
        case ErrorKind::GpuCommand:       return "gpu command failed";
        }
        return "unknown error";
    }

    std::string FormatResult(int32_t result)
    {
        char buf[16];
        std::snprintf(buf, sizeof(buf), "0x%08X", static_cast<uint32_t>(result));
        return buf;
    }

    RenderError::RenderError(ErrorKind kind, const std::string& what, int32_t result)
        : std::runtime_error(BuildMessage(kind, what, result))
        , m_kind(kind)
        , m_result(result)
    {
    }

    void ThrowRenderError(ErrorKind kind, const std::string& what, int32_t result)
    {
        switch (kind)
        {
        case ErrorKind::DeviceCreation:   throw DeviceCreationError(what, result);
        case ErrorKind::PipelineCreation: throw PipelineCreationError(what, result);
        case ErrorKind::ShaderCompile:    throw ShaderCompileError(what, result);
        case ErrorKind::ResourceCreation: throw ResourceCreationError(what, result);
        case ErrorKind::GpuCommand:       throw GpuCommandError(what, result);
        }
        throw RenderError(kind, what, result);
    }
}
