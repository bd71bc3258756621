#pragma once

/**
 * @file texture.h
 * @brief CPU texture and sampler used by the reference evaluator
 *
 * Mirrors the GPU resources bound at the texture and sampler slots: an RGBA8
 * unorm image and its filtering/addressing configuration. Sampling follows
 * WebGPU conventions (texel centers at half-integers, no mipmaps).
 */

#include <glm/glm.hpp>
#include <cstdint>
#include <string>
#include <vector>

namespace uishade::raster {

enum class FilterMode {
    Nearest,
    Linear
};

enum class AddressMode {
    ClampToEdge,
    Repeat,
    MirrorRepeat
};

/**
 * @brief Sampler configuration
 *
 * Defaults match the UI renderer's sampler: linear filtering, clamp to edge.
 */
struct SamplerDesc {
    FilterMode filter = FilterMode::Linear;
    AddressMode addressU = AddressMode::ClampToEdge;
    AddressMode addressV = AddressMode::ClampToEdge;
};

/// RGBA8 unorm image
class CpuTexture {
public:
    CpuTexture() = default;

    /// Wrap tightly packed RGBA8 data; returns an invalid texture if the size does not match
    static CpuTexture fromRgba8(int width, int height, std::vector<uint8_t> pixels);

    /// 1x1 texture of a single color (channels in 0-255)
    static CpuTexture solid(uint8_t r, uint8_t g, uint8_t b, uint8_t a);

    bool valid() const { return m_width > 0 && m_height > 0; }
    int width() const { return m_width; }
    int height() const { return m_height; }

    /// Normalized texel; x and y must be in range
    glm::vec4 texel(int x, int y) const;

private:
    int m_width = 0;
    int m_height = 0;
    std::vector<uint8_t> m_pixels;
};

/// Filtered read at normalized coordinate uv
glm::vec4 sampleTexture(const CpuTexture& texture, const SamplerDesc& sampler, glm::vec2 uv);

/**
 * @brief Texture lookups available to a fragment stage
 */
class TextureSource {
public:
    virtual ~TextureSource() = default;

    virtual glm::vec4 sample(const std::string& texture, const std::string& sampler, glm::vec2 uv) const = 0;
};

/**
 * @brief One texture + sampler pair, bound for a draw
 *
 * Answers every lookup with the same pair, like a bind group holding a single
 * texture and sampler.
 */
class BoundTexture : public TextureSource {
public:
    BoundTexture(const CpuTexture& texture, SamplerDesc sampler)
        : m_texture(texture), m_sampler(sampler) {}

    glm::vec4 sample(const std::string& texture, const std::string& sampler, glm::vec2 uv) const override;

private:
    const CpuTexture& m_texture;
    SamplerDesc m_sampler;
};

} // namespace uishade::raster
