#pragma once

// uishade - Scissor Rect Conversion
// Converts a logical clip rect into the physical scissor of one draw command

#include <cstdint>
#include <optional>

namespace uishade {

// Logical-pixel rectangle, as recorded by the UI layer
struct Rect {
    float x = 0.0f;
    float y = 0.0f;
    float width = 0.0f;
    float height = 0.0f;
};

// Physical-pixel scissor, ready for wgpuRenderPassEncoderSetScissorRect
struct ScissorRect {
    uint32_t x = 0;
    uint32_t y = 0;
    uint32_t width = 0;
    uint32_t height = 0;
};

// Origin is floored, extent is rounded. Returns nullopt (and logs) when the
// result is empty or does not fit in the viewport; the draw must be skipped.
std::optional<ScissorRect> physicalScissor(const Rect& rect, float scale,
                                           uint32_t viewportWidth, uint32_t viewportHeight);

} // namespace uishade
