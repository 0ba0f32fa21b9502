#pragma once

#include <cstdint>
#include <limits>
#include "RenderErrors.h"

namespace TriangleLab::Renderer
{
    // Monotonic CPU-side fence counter.
    // Holds the NEXT value to signal; starts at 1 because fences are created at 0.
    class FenceCounter
    {
    public:
        static constexpr uint64_t InitialValue = 1;

        // Returns the value to signal now and advances the counter
        uint64_t Next()
        {
            if (m_next == (std::numeric_limits<uint64_t>::max)())
                throw GpuCommandError("fence counter exhausted");
            return m_next++;
        }

        uint64_t Peek() const { return m_next; }

        // 0 until the first Next()
        uint64_t LastSignaled() const { return m_next - 1; }

        void Reset() { m_next = InitialValue; }

    private:
        uint64_t m_next = InitialValue;
    };
}
