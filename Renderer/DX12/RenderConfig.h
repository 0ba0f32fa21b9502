#pragma once

#include <dxgiformat.h>
#include <cstdint>

// Single source of truth for compile-time render settings
namespace TriangleLab::Renderer
{
    // Double buffering
    static constexpr uint32_t BackBufferCount = 2;

    // Swapchain and PSO render target format (8 bits per channel RGBA)
    static constexpr DXGI_FORMAT BackBufferFormat = DXGI_FORMAT_R8G8B8A8_UNORM;

    // One RTV slot, rewritten each frame for the current back buffer
    static constexpr uint32_t RtvHeapCapacity = 1;

    // Non-indexed draw of the static triangle
    static constexpr uint32_t TriangleVertexCount = 3;
    static constexpr uint32_t TriangleInstanceCount = 1;
}
