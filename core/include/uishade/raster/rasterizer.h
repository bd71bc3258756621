#pragma once

/**
 * @file rasterizer.h
 * @brief Reference software rasterizer for UI draws
 *
 * Renders indexed triangle lists through an Evaluator into a float RGBA
 * framebuffer. It reproduces the fixed-function steps a GPU performs between
 * the two shader stages so that programs for different targets can be
 * compared pixel for pixel:
 * - clip to NDC division and the viewport transform of the target's clip
 *   space convention (framebuffer Y grows downward)
 * - pixel centers at half-integers with the top-left fill rule
 * - affine barycentric interpolation of the varyings
 *
 * There is no depth test, blending or face culling. Later triangles replace
 * earlier ones.
 *
 * @par Example
 * @code
 * Rasterizer raster(256, 256, target.clipSpace);
 * raster.clear(glm::vec4(0.0f));
 * raster.draw(evaluator, vertices, indices, uniforms, BoundTexture(white, SamplerDesc{}));
 * glm::vec4 c = raster.framebuffer().pixel(10, 10);
 * @endcode
 */

#include <uishade/projection.h>
#include <uishade/raster/texture.h>
#include <uishade/scissor.h>
#include <uishade/shader/evaluator.h>
#include <uishade/types.h>

#include <glm/glm.hpp>
#include <cstdint>
#include <optional>
#include <vector>

namespace uishade::raster {

/// Float RGBA color target plus a per-pixel coverage mask
class Framebuffer {
public:
    Framebuffer() = default;
    Framebuffer(uint32_t width, uint32_t height);

    uint32_t width() const { return m_width; }
    uint32_t height() const { return m_height; }

    glm::vec4 pixel(uint32_t x, uint32_t y) const { return m_color[index(x, y)]; }
    bool covered(uint32_t x, uint32_t y) const { return m_coverage[index(x, y)] != 0; }

    /// Number of pixels written by any draw since the last clear
    size_t coveredCount() const;

    void clear(const glm::vec4& color);
    void write(uint32_t x, uint32_t y, const glm::vec4& color);

private:
    size_t index(uint32_t x, uint32_t y) const { return static_cast<size_t>(y) * m_width + x; }

    uint32_t m_width = 0;
    uint32_t m_height = 0;
    std::vector<glm::vec4> m_color;
    std::vector<uint8_t> m_coverage;
};

class Rasterizer {
public:
    Rasterizer(uint32_t width, uint32_t height, ClipSpaceConvention clipSpace);

    void clear(const glm::vec4& color);

    /// Restrict writes to a rectangle in framebuffer pixels; nullopt disables it
    void setScissor(std::optional<ScissorRect> scissor) { m_scissor = scissor; }

    /**
     * @brief Draw an indexed triangle list
     * @return false (nothing drawn) if the index count is not a multiple of 3
     *         or an index is out of range
     *
     * Triangles with a non-positive clip w are skipped, as are degenerate ones.
     */
    bool draw(const shader::Evaluator& evaluator,
              const std::vector<Vertex>& vertices,
              const std::vector<uint32_t>& indices,
              const TransformUniforms& uniforms,
              const TextureSource& textures);

    const Framebuffer& framebuffer() const { return m_framebuffer; }

    /// Framebuffer position of a clip space position
    glm::vec2 toFramebuffer(const glm::vec4& clipPosition) const;

private:
    struct ShadedVertex {
        glm::vec2 screen{0.0f};
        std::vector<glm::vec4> varyings;
    };

    void drawTriangle(const shader::Evaluator& evaluator,
                      const ShadedVertex& a, const ShadedVertex& b, const ShadedVertex& c,
                      const TextureSource& textures);

    ClipSpaceConvention m_clipSpace;
    Framebuffer m_framebuffer;
    std::optional<ScissorRect> m_scissor;
};

} // namespace uishade::raster
