#pragma once

#include <d3d12.h>
#include <DirectXMath.h>
#include <array>
#include <iterator>

namespace TriangleLab::Renderer
{
    // Matches the POSITION/COLOR input layout below byte for byte
    struct Vertex
    {
        DirectX::XMFLOAT3 position;
        DirectX::XMFLOAT4 color;
    };

    static_assert(sizeof(Vertex) == 28, "Vertex must be tightly packed (3 + 4 floats)");

    inline const D3D12_INPUT_ELEMENT_DESC VertexInputElements[] = {
        { "POSITION", 0, DXGI_FORMAT_R32G32B32_FLOAT, 0, 0,
          D3D12_INPUT_CLASSIFICATION_PER_VERTEX_DATA, 0 },
        { "COLOR", 0, DXGI_FORMAT_R32G32B32A32_FLOAT, 0, D3D12_APPEND_ALIGNED_ELEMENT,
          D3D12_INPUT_CLASSIFICATION_PER_VERTEX_DATA, 0 }
    };

    inline D3D12_INPUT_LAYOUT_DESC GetVertexInputLayout()
    {
        return { VertexInputElements, static_cast<UINT>(std::size(VertexInputElements)) };
    }

    // Static scene: red top, green bottom-right, blue bottom-left (clockwise = front face)
    inline std::array<Vertex, 3> MakeTriangleVertices()
    {
        return {{
            { DirectX::XMFLOAT3(0.0f, 0.5f, 0.0f),    DirectX::XMFLOAT4(1.0f, 0.0f, 0.0f, 1.0f) },
            { DirectX::XMFLOAT3(0.45f, -0.5f, 0.0f),  DirectX::XMFLOAT4(0.0f, 1.0f, 0.0f, 1.0f) },
            { DirectX::XMFLOAT3(-0.45f, -0.5f, 0.0f), DirectX::XMFLOAT4(0.0f, 0.0f, 1.0f, 1.0f) },
        }};
    }
}
