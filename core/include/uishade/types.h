#pragma once

// uishade - Shading Core Types
// GPU-aligned structs shared by the generated shaders, the CPU evaluator and the pipeline

#include <glm/glm.hpp>
#include <cstddef>
#include <cstdint>

namespace uishade {

// UI vertex as uploaded to the vertex buffer
// Total size: 20 bytes, tightly packed
struct Vertex {
    glm::vec2 position;   // Logical (pre-scale) pixels
    glm::vec2 texCoord;   // Normalized texture coordinate
    uint32_t color;       // Packed RGBA8, R in the most significant byte

    Vertex() : position(0.0f), texCoord(0.0f), color(0) {}
    Vertex(glm::vec2 pos, glm::vec2 uv, uint32_t c)
        : position(pos), texCoord(uv), color(c) {}
    Vertex(float x, float y, float u, float v, uint32_t c)
        : position(x, y), texCoord(u, v), color(c) {}
};

static_assert(sizeof(Vertex) == 20, "Vertex must match the 20-byte vertex layout");
static_assert(offsetof(Vertex, texCoord) == 8, "texCoord must sit at offset 8");
static_assert(offsetof(Vertex, color) == 16, "color must sit at offset 16");

// Per-batch transform, bound at group 0 binding 0
// Total size: 64 bytes, column-major
struct TransformUniforms {
    glm::mat4 matrix;

    TransformUniforms() : matrix(1.0f) {}
    explicit TransformUniforms(const glm::mat4& m) : matrix(m) {}
};

static_assert(sizeof(TransformUniforms) == 64, "TransformUniforms must be one mat4x4<f32>");

// Vertex stage result, interpolated by the rasterizer
struct VertexOutput {
    glm::vec4 clipPosition{0.0f};
    glm::vec2 texCoord{0.0f};
    glm::vec4 color{0.0f};
};

// Interpolated fragment stage input
struct FragmentInput {
    glm::vec2 texCoord{0.0f};
    glm::vec4 color{0.0f};
};

} // namespace uishade
