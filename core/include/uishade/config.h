#pragma once

/**
 * @file config.h
 * @brief Shader generation settings loaded from JSON
 *
 * Lists the targets to generate and where to write them. Each target starts
 * from a preset and may override any of its fields:
 *
 * @par Example
 * @code
 * {
 *   "outputDir": "shaders",
 *   "baseName": "ui",
 *   "targets": [
 *     { "preset": "wgsl" },
 *     { "preset": "glsl-es300", "name": "gles-compat",
 *       "capabilities": { "bitwiseIntegerOps": false, "hexLiterals": false } }
 *   ]
 * }
 * @endcode
 *
 * Target fields: preset, name, backend ("wgsl" | "glsl"), glslVersion,
 * glslEs, bindingModel ("grouped" | "unified"), clipSpace ("webgpu" |
 * "vulkan" | "opengl") and capabilities (any Capabilities flag by name).
 * A target without a preset must name its backend.
 */

#include <uishade/shader/backend.h>
#include <uishade/shader/generator.h>

#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace uishade {

class GeneratorConfig {
public:
    std::string outputDir = ".";
    std::string baseName = "ui";
    std::vector<shader::BackendTarget> targets;

    /**
     * @brief Replace the settings with those in a JSON document
     * @return false (settings unchanged) on a parse or validation error; see lastError()
     */
    bool load(const std::string& jsonText);
    bool loadFile(const std::string& path);

    bool saveFile(const std::string& path) const;

    /// Fully expanded form: every target field is written out
    nlohmann::json toJson() const;

    /// Path of one generated source: outputDir/baseName.target<suffix>
    std::string outputPath(const shader::BackendTarget& target, const shader::ShaderSource& source) const;

    const std::string& lastError() const { return m_lastError; }

private:
    bool fail(const std::string& message);

    std::string m_lastError;
};

/// "webgpu", "vulkan", "opengl"; empty for other conventions
std::string clipSpaceName(const ClipSpaceConvention& clip);
bool parseClipSpace(const std::string& name, ClipSpaceConvention& out);

} // namespace uishade
