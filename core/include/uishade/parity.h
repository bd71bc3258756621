#pragma once

/**
 * @file parity.h
 * @brief Cross-backend parity check on the CPU
 *
 * Renders one UI scene through the program as lowered for each target, with
 * the transform corrected for the target's clip space, and compares the
 * framebuffers against the first target. Targets are equivalent when they
 * cover the same pixels and every covered pixel agrees within a tolerance.
 *
 * @par Example
 * @code
 * ParityReport report = checkParity(buildUiProgram(), builtinTargets(), defaultParityScene());
 * if (!report.passed()) { ... }
 * @endcode
 */

#include <uishade/raster/rasterizer.h>
#include <uishade/raster/texture.h>
#include <uishade/shader/backend.h>
#include <uishade/shader/ir.h>
#include <uishade/types.h>

#include <cstdint>
#include <string>
#include <vector>

namespace uishade {

/// Draw submitted to every target
struct ParityScene {
    uint32_t width = 64;        ///< Physical viewport size
    uint32_t height = 64;
    float scale = 1.0f;         ///< Physical pixels per logical pixel
    std::vector<Vertex> vertices;
    std::vector<uint32_t> indices;
    raster::CpuTexture texture;
    raster::SamplerDesc sampler;
};

/**
 * @brief Scene exercising the UI stages
 *
 * Quads with per-corner colors covering all channel extremes, both winding
 * orders, and a gradient texture sampled with linear filtering.
 */
ParityScene defaultParityScene();

/// Comparison of one target against the reference target
struct ParityResult {
    std::string reference;
    std::string target;
    size_t coveredPixels = 0;
    size_t coverageMismatches = 0;  ///< Pixels covered by only one of the two
    size_t colorMismatches = 0;     ///< Covered pixels differing by more than the tolerance
    float maxDifference = 0.0f;

    bool passed() const { return coverageMismatches == 0 && colorMismatches == 0; }
};

struct ParityReport {
    float tolerance = 0.0f;
    std::vector<ParityResult> results;

    bool passed() const;
};

/**
 * @brief Render a scene for one target
 *
 * Throws std::invalid_argument if the scene's viewport is empty.
 */
raster::Framebuffer renderScene(const shader::ShaderProgram& program,
                                const shader::BackendTarget& target,
                                const ParityScene& scene);

/**
 * @brief Compare every target against the first one
 */
ParityReport checkParity(const shader::ShaderProgram& program,
                         const std::vector<shader::BackendTarget>& targets,
                         const ParityScene& scene,
                         float tolerance = 1e-5f);

} // namespace uishade
