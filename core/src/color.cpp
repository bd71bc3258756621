#include <uishade/color.h>
#include <algorithm>
#include <cmath>

namespace uishade {

static uint8_t toByte(float v) {
    float clamped = std::clamp(v, 0.0f, 1.0f);
    return static_cast<uint8_t>(std::lround(clamped * 255.0f));
}

uint32_t packColor(const glm::vec4& color) {
    return packColor(toByte(color.r), toByte(color.g), toByte(color.b), toByte(color.a));
}

glm::vec4 decodeColor(uint32_t packed) {
    return glm::vec4(
        static_cast<float>(channelR(packed)) / 255.0f,
        static_cast<float>(channelG(packed)) / 255.0f,
        static_cast<float>(channelB(packed)) / 255.0f,
        static_cast<float>(channelA(packed)) / 255.0f
    );
}

} // namespace uishade
