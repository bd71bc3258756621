#include <uishade/scissor.h>
#include <cmath>
#include <iostream>

namespace uishade {

static uint32_t toPixels(float v) {
    return v > 0.0f ? static_cast<uint32_t>(v) : 0u;
}

std::optional<ScissorRect> physicalScissor(const Rect& rect, float scale,
                                           uint32_t viewportWidth, uint32_t viewportHeight) {
    ScissorRect s;
    s.x = toPixels(std::floor(scale * rect.x));
    s.y = toPixels(std::floor(scale * rect.y));
    s.width = toPixels(std::round(scale * rect.width));
    s.height = toPixels(std::round(scale * rect.height));

    // 64-bit sums so that huge rects cannot wrap into the viewport
    bool outside = static_cast<uint64_t>(s.x) + s.width > viewportWidth ||
                   static_cast<uint64_t>(s.y) + s.height > viewportHeight;

    if (s.width == 0 || s.height == 0 || outside) {
        std::cerr << "[Scissor] Scissor rect (" << s.x << " " << s.y << " "
                  << s.width << " " << s.height << ") invalid\n";
        return std::nullopt;
    }
    return s;
}

} // namespace uishade
