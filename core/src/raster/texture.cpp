#include <uishade/raster/texture.h>
#include <algorithm>
#include <cmath>
#include <iostream>
#include <utility>

namespace uishade::raster {

CpuTexture CpuTexture::fromRgba8(int width, int height, std::vector<uint8_t> pixels) {
    CpuTexture tex;
    if (width <= 0 || height <= 0 ||
        pixels.size() != static_cast<size_t>(width) * static_cast<size_t>(height) * 4) {
        std::cerr << "[CpuTexture] Pixel data does not match " << width << "x" << height << " RGBA8\n";
        return tex;
    }
    tex.m_width = width;
    tex.m_height = height;
    tex.m_pixels = std::move(pixels);
    return tex;
}

CpuTexture CpuTexture::solid(uint8_t r, uint8_t g, uint8_t b, uint8_t a) {
    return fromRgba8(1, 1, {r, g, b, a});
}

glm::vec4 CpuTexture::texel(int x, int y) const {
    size_t i = (static_cast<size_t>(y) * static_cast<size_t>(m_width) + static_cast<size_t>(x)) * 4;
    return glm::vec4(
        static_cast<float>(m_pixels[i + 0]) / 255.0f,
        static_cast<float>(m_pixels[i + 1]) / 255.0f,
        static_cast<float>(m_pixels[i + 2]) / 255.0f,
        static_cast<float>(m_pixels[i + 3]) / 255.0f
    );
}

static int applyAddress(int i, int size, AddressMode mode) {
    switch (mode) {
        case AddressMode::ClampToEdge:
            return i < 0 ? 0 : (i >= size ? size - 1 : i);
        case AddressMode::Repeat: {
            int m = i % size;
            return m < 0 ? m + size : m;
        }
        case AddressMode::MirrorRepeat: {
            int period = size * 2;
            int m = i % period;
            if (m < 0) m += period;
            return m < size ? m : period - 1 - m;
        }
    }
    return 0;
}

// Bring a texel-space coordinate into a range that survives the cast to int.
// Repeat and mirror move it by whole periods, so the addressed texel is unchanged.
static float reduceCoordinate(float t, int size, AddressMode mode) {
    if (std::isnan(t)) return 0.0f;
    float extent = static_cast<float>(size);
    if (mode == AddressMode::ClampToEdge) {
        return std::clamp(t, -1.0f, extent);
    }
    if (std::isinf(t)) return 0.0f;
    float period = mode == AddressMode::MirrorRepeat ? extent * 2.0f : extent;
    float m = std::fmod(t, period);
    return m < 0.0f ? m + period : m;
}

glm::vec4 sampleTexture(const CpuTexture& texture, const SamplerDesc& sampler, glm::vec2 uv) {
    if (!texture.valid()) {
        return glm::vec4(0.0f);
    }

    int w = texture.width();
    int h = texture.height();

    if (sampler.filter == FilterMode::Nearest) {
        float sx = reduceCoordinate(uv.x * static_cast<float>(w), w, sampler.addressU);
        float sy = reduceCoordinate(uv.y * static_cast<float>(h), h, sampler.addressV);
        int x = static_cast<int>(std::floor(sx));
        int y = static_cast<int>(std::floor(sy));
        return texture.texel(applyAddress(x, w, sampler.addressU), applyAddress(y, h, sampler.addressV));
    }

    // Linear: blend the four texels around the sample point
    float fx = reduceCoordinate(uv.x * static_cast<float>(w) - 0.5f, w, sampler.addressU);
    float fy = reduceCoordinate(uv.y * static_cast<float>(h) - 0.5f, h, sampler.addressV);
    float x0f = std::floor(fx);
    float y0f = std::floor(fy);
    float tx = fx - x0f;
    float ty = fy - y0f;
    int x0 = static_cast<int>(x0f);
    int y0 = static_cast<int>(y0f);

    int xa = applyAddress(x0, w, sampler.addressU);
    int xb = applyAddress(x0 + 1, w, sampler.addressU);
    int ya = applyAddress(y0, h, sampler.addressV);
    int yb = applyAddress(y0 + 1, h, sampler.addressV);

    glm::vec4 top = glm::mix(texture.texel(xa, ya), texture.texel(xb, ya), tx);
    glm::vec4 bottom = glm::mix(texture.texel(xa, yb), texture.texel(xb, yb), tx);
    return glm::mix(top, bottom, ty);
}

glm::vec4 BoundTexture::sample(const std::string&, const std::string&, glm::vec2 uv) const {
    return sampleTexture(m_texture, m_sampler, uv);
}

} // namespace uishade::raster
