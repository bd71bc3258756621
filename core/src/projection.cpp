#include <uishade/projection.h>

namespace uishade {

std::optional<glm::mat4> orthographic(uint32_t physicalWidth, uint32_t physicalHeight, float scale) {
    if (physicalWidth == 0 || physicalHeight == 0 || !(scale > 0.0f)) {
        return std::nullopt;
    }

    float l = 0.0f;
    float r = static_cast<float>(physicalWidth) / scale;
    float t = 0.0f;
    float b = static_cast<float>(physicalHeight) / scale;

    // glm is column-major: m[column][row]
    glm::mat4 m(0.0f);
    m[0] = glm::vec4(2.0f / (r - l), 0.0f, 0.0f, 0.0f);
    m[1] = glm::vec4(0.0f, 2.0f / (t - b), 0.0f, 0.0f);
    m[2] = glm::vec4(0.0f, 0.0f, 0.5f, 0.0f);
    m[3] = glm::vec4((r + l) / (l - r), (t + b) / (b - t), 0.5f, 1.0f);
    return m;
}

glm::mat4 clipSpaceCorrection(const ClipSpaceConvention& from, const ClipSpaceConvention& to) {
    glm::mat4 m(1.0f);

    if (from.yUp != to.yUp) {
        m[1][1] = -1.0f;
    }

    if (from.depthZeroToOne && !to.depthZeroToOne) {
        // z' = 2z - w
        m[2][2] = 2.0f;
        m[3][2] = -1.0f;
    } else if (!from.depthZeroToOne && to.depthZeroToOne) {
        // z' = (z + w) / 2
        m[2][2] = 0.5f;
        m[3][2] = 0.5f;
    }

    return m;
}

glm::mat4 correctTransform(const glm::mat4& transform, const ClipSpaceConvention& target) {
    if (target == webGpuClipSpace()) {
        return transform;
    }
    return clipSpaceCorrection(webGpuClipSpace(), target) * transform;
}

} // namespace uishade
