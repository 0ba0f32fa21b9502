#pragma once

#include <d3d12.h>
#include <wrl/client.h>
#include <array>
#include <cstddef>
#include <cstdint>
#include <vector>
#include "Vertex.h"

namespace TriangleLab::Renderer
{
    // Upload-heap buffer plus the view describing it.
    // The view does not own the buffer; keep resource alive while the view is bound.
    struct VertexBufferResult
    {
        Microsoft::WRL::ComPtr<ID3D12Resource> resource;
        D3D12_VERTEX_BUFFER_VIEW view = {};
    };

    // Write-once vertex upload into a CPU-writable, GPU-readable committed buffer.
    // Sized exactly to sizeof(Vertex) * count; the data is copied byte for byte.
    // Re-uploading means a fresh resource: there is no resize or partial write.
    class ResourceUploader
    {
    public:
        // count == 0 allocates nothing and returns a zero-sized view
        static VertexBufferResult UploadVertices(ID3D12Device* device, const Vertex* vertices, size_t count);

        static VertexBufferResult UploadVertices(ID3D12Device* device, const std::vector<Vertex>& vertices)
        {
            return UploadVertices(device, vertices.data(), vertices.size());
        }

        template <size_t N>
        static VertexBufferResult UploadVertices(ID3D12Device* device, const std::array<Vertex, N>& vertices)
        {
            return UploadVertices(device, vertices.data(), vertices.size());
        }

        // Generic form: any stride, throws ResourceCreationError
        static VertexBufferResult UploadBuffer(ID3D12Device* device, const void* data, uint64_t sizeBytes,
                                               uint32_t strideBytes, const wchar_t* debugName);
    };
}
