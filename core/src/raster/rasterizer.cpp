#include <uishade/raster/rasterizer.h>

#include <algorithm>
#include <cmath>
#include <iostream>
#include <utility>

namespace uishade::raster {

Framebuffer::Framebuffer(uint32_t width, uint32_t height)
    : m_width(width)
    , m_height(height)
    , m_color(static_cast<size_t>(width) * height, glm::vec4(0.0f))
    , m_coverage(static_cast<size_t>(width) * height, 0) {}

size_t Framebuffer::coveredCount() const {
    return static_cast<size_t>(std::count(m_coverage.begin(), m_coverage.end(), uint8_t(1)));
}

void Framebuffer::clear(const glm::vec4& color) {
    std::fill(m_color.begin(), m_color.end(), color);
    std::fill(m_coverage.begin(), m_coverage.end(), uint8_t(0));
}

void Framebuffer::write(uint32_t x, uint32_t y, const glm::vec4& color) {
    size_t i = index(x, y);
    m_color[i] = color;
    m_coverage[i] = 1;
}

Rasterizer::Rasterizer(uint32_t width, uint32_t height, ClipSpaceConvention clipSpace)
    : m_clipSpace(clipSpace)
    , m_framebuffer(width, height) {}

void Rasterizer::clear(const glm::vec4& color) {
    m_framebuffer.clear(color);
}

glm::vec2 Rasterizer::toFramebuffer(const glm::vec4& clipPosition) const {
    float ndcX = clipPosition.x / clipPosition.w;
    float ndcY = clipPosition.y / clipPosition.w;
    float w = static_cast<float>(m_framebuffer.width());
    float h = static_cast<float>(m_framebuffer.height());

    float x = (ndcX + 1.0f) * 0.5f * w;
    float y = m_clipSpace.yUp ? (1.0f - ndcY) * 0.5f * h : (1.0f + ndcY) * 0.5f * h;
    return glm::vec2(x, y);
}

bool Rasterizer::draw(const shader::Evaluator& evaluator,
                      const std::vector<Vertex>& vertices,
                      const std::vector<uint32_t>& indices,
                      const TransformUniforms& uniforms,
                      const TextureSource& textures) {
    if (indices.size() % 3 != 0) {
        std::cerr << "[Rasterizer] Index count " << indices.size() << " is not a multiple of 3\n";
        return false;
    }
    for (uint32_t index : indices) {
        if (index >= vertices.size()) {
            std::cerr << "[Rasterizer] Index " << index << " out of range (" << vertices.size() << " vertices)\n";
            return false;
        }
    }

    // Vertex stage runs once per vertex, as with a post-transform cache
    std::vector<ShadedVertex> shaded(vertices.size());
    std::vector<bool> visible(vertices.size(), false);
    for (size_t i = 0; i < vertices.size(); ++i) {
        shader::StageOutputs out = evaluator.runVertex(vertices[i], uniforms);
        visible[i] = out.clipPosition.w > 0.0f;
        if (visible[i]) {
            shaded[i].screen = toFramebuffer(out.clipPosition);
        }
        shaded[i].varyings = std::move(out.varyings);
    }

    for (size_t i = 0; i < indices.size(); i += 3) {
        uint32_t a = indices[i];
        uint32_t b = indices[i + 1];
        uint32_t c = indices[i + 2];
        if (!visible[a] || !visible[b] || !visible[c]) continue;
        drawTriangle(evaluator, shaded[a], shaded[b], shaded[c], textures);
    }
    return true;
}

static float edge(const glm::vec2& a, const glm::vec2& b, const glm::vec2& p) {
    return (b.x - a.x) * (p.y - a.y) - (b.y - a.y) * (p.x - a.x);
}

// With clockwise winding in Y-down space: a top edge is horizontal and runs
// right, a left edge runs up.
static bool isTopLeft(const glm::vec2& a, const glm::vec2& b) {
    return (a.y == b.y && b.x > a.x) || b.y < a.y;
}

static bool inside(float w, const glm::vec2& a, const glm::vec2& b) {
    return w > 0.0f || (w == 0.0f && isTopLeft(a, b));
}

void Rasterizer::drawTriangle(const shader::Evaluator& evaluator,
                              const ShadedVertex& a, const ShadedVertex& b, const ShadedVertex& c,
                              const TextureSource& textures) {
    const ShadedVertex* v0 = &a;
    const ShadedVertex* v1 = &b;
    const ShadedVertex* v2 = &c;

    float area = edge(v0->screen, v1->screen, v2->screen);
    if (area == 0.0f || !std::isfinite(area)) return;
    if (area < 0.0f) {
        // No culling: normalize winding instead
        std::swap(v1, v2);
        area = -area;
    }

    float minX = std::min({v0->screen.x, v1->screen.x, v2->screen.x});
    float maxX = std::max({v0->screen.x, v1->screen.x, v2->screen.x});
    float minY = std::min({v0->screen.y, v1->screen.y, v2->screen.y});
    float maxY = std::max({v0->screen.y, v1->screen.y, v2->screen.y});

    int64_t x0 = 0;
    int64_t y0 = 0;
    int64_t x1 = m_framebuffer.width();
    int64_t y1 = m_framebuffer.height();
    if (m_scissor) {
        x0 = m_scissor->x;
        y0 = m_scissor->y;
        x1 = std::min<int64_t>(x1, int64_t(m_scissor->x) + m_scissor->width);
        y1 = std::min<int64_t>(y1, int64_t(m_scissor->y) + m_scissor->height);
    }
    // Pixel centers are at +0.5. Clamp to the framebuffer before converting
    // so far off-screen vertices cannot overflow the integer bounds.
    const float width = static_cast<float>(m_framebuffer.width());
    const float height = static_cast<float>(m_framebuffer.height());
    x0 = std::max<int64_t>(x0, static_cast<int64_t>(std::clamp(std::floor(minX - 0.5f), 0.0f, width)));
    y0 = std::max<int64_t>(y0, static_cast<int64_t>(std::clamp(std::floor(minY - 0.5f), 0.0f, height)));
    x1 = std::min<int64_t>(x1, static_cast<int64_t>(std::clamp(std::ceil(maxX + 0.5f), 0.0f, width)));
    y1 = std::min<int64_t>(y1, static_cast<int64_t>(std::clamp(std::ceil(maxY + 0.5f), 0.0f, height)));

    const size_t varyingCount = v0->varyings.size();
    std::vector<glm::vec4> interpolated(varyingCount);

    for (int64_t y = y0; y < y1; ++y) {
        for (int64_t x = x0; x < x1; ++x) {
            glm::vec2 p(static_cast<float>(x) + 0.5f, static_cast<float>(y) + 0.5f);

            float w0 = edge(v1->screen, v2->screen, p);
            float w1 = edge(v2->screen, v0->screen, p);
            float w2 = edge(v0->screen, v1->screen, p);
            if (!inside(w0, v1->screen, v2->screen) ||
                !inside(w1, v2->screen, v0->screen) ||
                !inside(w2, v0->screen, v1->screen)) {
                continue;
            }

            float l0 = w0 / area;
            float l1 = w1 / area;
            float l2 = w2 / area;
            for (size_t i = 0; i < varyingCount; ++i) {
                interpolated[i] = v0->varyings[i] * l0 + v1->varyings[i] * l1 + v2->varyings[i] * l2;
            }

            glm::vec4 color = evaluator.runFragment(interpolated, textures);
            m_framebuffer.write(static_cast<uint32_t>(x), static_cast<uint32_t>(y), color);
        }
    }
}

} // namespace uishade::raster
