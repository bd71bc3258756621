#pragma once

/**
 * @file backend.h
 * @brief Shader backend targets and their capability flags
 *
 * A BackendTarget says which language to generate, which binding model the
 * resources use, what the language can express, and which clip-space
 * convention the consuming API expects. Everything backend-specific in code
 * generation and lowering is keyed off these flags.
 */

#include <uishade/projection.h>
#include <uishade/shader/binding_layout.h>

#include <string>
#include <vector>

namespace uishade::shader {

enum class Backend {
    Wgsl,   ///< WebGPU shading language
    Glsl    ///< GLSL, compiled to SPIR-V or consumed by GL/GLES drivers
};

const char* backendName(Backend backend);
bool parseBackend(const std::string& name, Backend& out);

/**
 * @brief What a target language can express
 */
struct Capabilities {
    bool hexLiterals = true;               ///< 0xFF style integer literals
    bool unsignedLiteralSuffix = true;     ///< 255u (else written as a conversion)
    bool bitwiseIntegerOps = true;         ///< >> and & on unsigned integers
    bool separateSamplers = true;          ///< Texture and sampler are distinct objects
    bool explicitBindingQualifiers = true; ///< Bindings written in the source
    bool varyingLocations = true;          ///< Inter-stage values matched by location
    bool precisionQualifiers = false;      ///< Needs default precision statements

    bool operator==(const Capabilities& o) const;
    bool operator!=(const Capabilities& o) const { return !(*this == o); }
};

struct BackendTarget {
    std::string name;
    Backend backend = Backend::Wgsl;
    int glslVersion = 0;         ///< e.g. 450, 300; GLSL only
    bool glslEs = false;         ///< Emit "#version N es"
    BindingModel bindingModel = BindingModel::Grouped;
    Capabilities caps;
    ClipSpaceConvention clipSpace = webGpuClipSpace();

    BindingLayout bindingLayout() const { return uiBindingLayout(bindingModel); }
};

/// WGSL for WebGPU: grouped bindings, WebGPU clip space
BackendTarget wgslTarget();

/// GLSL 4.50 compiled to SPIR-V and consumed through WebGPU: grouped sets, separate samplers
BackendTarget spirvGlslTarget();

/// GLSL ES 3.00: unified binding space, combined samplers, bindings assigned by the host
BackendTarget glslEs300Target();

/// All presets, in the order above
std::vector<BackendTarget> builtinTargets();

/// Look up a preset by name ("wgsl", "spirv-glsl450", "glsl-es300")
bool findTarget(const std::string& name, BackendTarget& out);

/**
 * @brief Transform to upload for a target
 *
 * UI transforms are authored in WebGPU clip space. The correction for the
 * target's convention is applied here, once per batch.
 */
glm::mat4 targetTransform(const BackendTarget& target, const glm::mat4& transform);

} // namespace uishade::shader
