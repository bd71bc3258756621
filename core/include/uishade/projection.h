#pragma once

/**
 * @file projection.h
 * @brief UI projection matrix and clip-space reconciliation
 *
 * The UI transform is authored once in WebGPU clip-space conventions (Y up,
 * depth in [0, 1]). Backends with a different native convention receive a
 * corrected matrix computed here, on the CPU, once per batch. Generated
 * shaders never flip coordinates themselves.
 */

#include <glm/glm.hpp>
#include <optional>
#include <cstdint>

namespace uishade {

/**
 * @brief Clip-space convention of a graphics API
 */
struct ClipSpaceConvention {
    bool yUp = true;             ///< +Y in NDC points to the top of the framebuffer
    bool depthZeroToOne = true;  ///< NDC depth range is [0, 1] (else [-1, 1])

    bool operator==(const ClipSpaceConvention& o) const {
        return yUp == o.yUp && depthZeroToOne == o.depthZeroToOne;
    }
    bool operator!=(const ClipSpaceConvention& o) const { return !(*this == o); }
};

/// WebGPU / Metal / D3D: Y up, depth [0, 1]. Authoring convention for all UI transforms.
constexpr ClipSpaceConvention webGpuClipSpace() { return {true, true}; }

/// Vulkan without a flipped viewport: Y down, depth [0, 1]
constexpr ClipSpaceConvention vulkanClipSpace() { return {false, true}; }

/// OpenGL / GLES: Y up, depth [-1, 1]
constexpr ClipSpaceConvention openGlClipSpace() { return {true, false}; }

/**
 * @brief Orthographic projection for a UI viewport
 *
 * Maps logical pixels (physical size divided by scale) with the origin in the
 * top-left corner to clip space. Depth is fixed: z = 0 maps to 0.5.
 *
 * @param physicalWidth Viewport width in physical pixels
 * @param physicalHeight Viewport height in physical pixels
 * @param scale Physical pixels per logical pixel
 * @return Column-major matrix, or nullopt for an empty viewport or non-positive scale
 */
std::optional<glm::mat4> orthographic(uint32_t physicalWidth, uint32_t physicalHeight, float scale);

/**
 * @brief Matrix mapping clip coordinates from one convention to another
 *
 * Applied as correction * transform. Identity when both conventions match.
 */
glm::mat4 clipSpaceCorrection(const ClipSpaceConvention& from, const ClipSpaceConvention& to);

/**
 * @brief Re-express a WebGPU-convention transform for another clip space
 */
glm::mat4 correctTransform(const glm::mat4& transform, const ClipSpaceConvention& target);

} // namespace uishade
