#include "ResourceUploader.h"
#include "Dx12Check.h"
#include "DiagnosticLogger.h"
#include <cstring>
#include <limits>

using Microsoft::WRL::ComPtr;

namespace TriangleLab::Renderer
{
    VertexBufferResult ResourceUploader::UploadVertices(ID3D12Device* device, const Vertex* vertices, size_t count)
    {
        if (count > 0 && !vertices)
            throw ResourceCreationError("vertex upload: null vertex data");

        return UploadBuffer(device, vertices, static_cast<uint64_t>(count) * sizeof(Vertex),
            static_cast<uint32_t>(sizeof(Vertex)), L"TriangleVertexBuffer");
    }

    VertexBufferResult ResourceUploader::UploadBuffer(ID3D12Device* device, const void* data, uint64_t sizeBytes,
                                                      uint32_t strideBytes, const wchar_t* debugName)
    {
        VertexBufferResult result;
        result.view.StrideInBytes = strideBytes;

        if (!device)
            throw ResourceCreationError("vertex upload: no device");

        if (sizeBytes == 0)
            return result;

        // D3D12_VERTEX_BUFFER_VIEW::SizeInBytes is 32-bit
        if (sizeBytes > (std::numeric_limits<UINT>::max)())
            throw ResourceCreationError("vertex upload: buffer exceeds 4 GiB view limit");

        // 1. Committed buffer in the upload heap, GENERIC_READ for its whole life
        {
            D3D12_HEAP_PROPERTIES heapProps = {};
            heapProps.Type = D3D12_HEAP_TYPE_UPLOAD;
            heapProps.CPUPageProperty = D3D12_CPU_PAGE_PROPERTY_UNKNOWN;
            heapProps.MemoryPoolPreference = D3D12_MEMORY_POOL_UNKNOWN;
            heapProps.CreationNodeMask = 1;
            heapProps.VisibleNodeMask = 1;

            D3D12_RESOURCE_DESC desc = {};
            desc.Dimension = D3D12_RESOURCE_DIMENSION_BUFFER;
            desc.Width = sizeBytes;
            desc.Height = 1;
            desc.DepthOrArraySize = 1;
            desc.MipLevels = 1;
            desc.Format = DXGI_FORMAT_UNKNOWN;
            desc.SampleDesc.Count = 1;
            desc.Layout = D3D12_TEXTURE_LAYOUT_ROW_MAJOR;
            desc.Flags = D3D12_RESOURCE_FLAG_NONE;

            ThrowIfFailed(device->CreateCommittedResource(
                &heapProps,
                D3D12_HEAP_FLAG_NONE,
                &desc,
                D3D12_RESOURCE_STATE_GENERIC_READ,
                nullptr,
                IID_PPV_ARGS(&result.resource)),
                ErrorKind::ResourceCreation, "CreateCommittedResource (vertex buffer)");

            if (debugName)
                result.resource->SetName(debugName);
        }

        // 2. Map, copy verbatim, unmap (CPU does not read: empty read range)
        {
            void* mapped = nullptr;
            D3D12_RANGE readRange = { 0, 0 };
            ThrowIfFailed(result.resource->Map(0, &readRange, &mapped),
                ErrorKind::ResourceCreation, "Map (vertex buffer)");

            std::memcpy(mapped, data, static_cast<size_t>(sizeBytes));
            result.resource->Unmap(0, nullptr);
        }

        // 3. View
        result.view.BufferLocation = result.resource->GetGPUVirtualAddress();
        result.view.SizeInBytes = static_cast<UINT>(sizeBytes);

        DiagnosticLogger::Log("ResourceUploader: uploaded %llu bytes (stride %u)\n",
            static_cast<unsigned long long>(sizeBytes), strideBytes);
        return result;
    }
}
