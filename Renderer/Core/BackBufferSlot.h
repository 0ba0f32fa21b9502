#pragma once

#include <cstdint>
#include <utility>

namespace TriangleLab::Renderer
{
    // Single-slot ownership arena for the current back buffer.
    // The held handle is released BEFORE the next one is fetched, so at most
    // one back-buffer reference is alive through this slot at any time.
    // Handle: any nullable owning handle (ComPtr, shared_ptr, ...).
    template <typename Handle>
    class BackBufferSlot
    {
    public:
        static constexpr uint32_t InvalidIndex = UINT32_MAX;

        BackBufferSlot() = default;

        BackBufferSlot(const BackBufferSlot&) = delete;
        BackBufferSlot& operator=(const BackBufferSlot&) = delete;

        // fetch(index) -> Handle
        template <typename Fetch>
        const Handle& Replace(uint32_t index, Fetch&& fetch)
        {
            Release();
            m_handle = std::forward<Fetch>(fetch)(index);
            m_index = index;
            return m_handle;
        }

        void Release()
        {
            m_handle = Handle{};
            m_index = InvalidIndex;
        }

        const Handle& Get() const { return m_handle; }
        uint32_t GetIndex() const { return m_index; }
        bool IsEmpty() const { return !m_handle; }

    private:
        Handle m_handle{};
        uint32_t m_index = InvalidIndex;
    };
}
