#pragma once

/**
 * @file ui_pipeline.h
 * @brief WebGPU render pipeline for generated UI shaders
 *
 * Builds everything a UI draw needs from a GeneratedShader and the target's
 * declarative layouts: shader modules, one bind group layout per binding
 * group, the pipeline layout, the 20-byte vertex buffer layout and an
 * alpha-blended render pipeline. Owns the transform uniform buffer.
 *
 * WGSL targets are loaded as WGSL. GLSL targets go through wgpu-native's GLSL
 * front end, which accepts Vulkan-style GLSL only (grouped sets, separate
 * samplers, version 440 or later).
 *
 * @par Example
 * @code
 * auto target = wgslTarget();
 * UiPipeline pipeline;
 * if (!pipeline.init(device, generateShader(buildUiProgram(), target), target, surfaceFormat)) {
 *     return false;
 * }
 * pipeline.writeTransform(queue, *orthographic(width, height, scale));
 * WGPUBindGroup textures = pipeline.createTextureBindGroup(atlasView, sampler);
 * pipeline.bind(pass, textures);
 * @endcode
 */

#include <uishade/gpu/gpu_common.h>
#include <uishade/shader/backend.h>
#include <uishade/shader/generator.h>

#include <glm/glm.hpp>
#include <string>
#include <vector>

namespace uishade::gpu {

class UiPipeline {
public:
    UiPipeline() = default;
    ~UiPipeline();

    UiPipeline(const UiPipeline&) = delete;
    UiPipeline& operator=(const UiPipeline&) = delete;

    /**
     * @brief Create all GPU objects
     * @return false if the target cannot be consumed by WebGPU or an object
     *         could not be created; see lastError()
     */
    bool init(WGPUDevice device, const shader::GeneratedShader& generated,
              const shader::BackendTarget& target, WGPUTextureFormat colorFormat);

    /// Release every GPU object; safe to call more than once
    void cleanup();

    bool valid() const { return m_pipeline != nullptr; }

    /**
     * @brief Upload the per-batch transform
     *
     * The matrix is in WebGPU clip-space convention and is corrected for the
     * target before upload.
     */
    void writeTransform(WGPUQueue queue, const glm::mat4& transform) const;

    /**
     * @brief Bind group for one texture + sampler pair
     *
     * Covers the binding group holding the texture. With a unified binding
     * model that group also holds the transform buffer. The caller releases
     * the bind group.
     */
    WGPUBindGroup createTextureBindGroup(WGPUTextureView view, WGPUSampler sampler) const;

    /// Same, with the pipeline's UI sampler (linear, clamp to edge)
    WGPUBindGroup createTextureBindGroup(WGPUTextureView view) const;

    /// Set the pipeline and every bind group on a render pass
    void bind(WGPURenderPassEncoder pass, WGPUBindGroup textureBindGroup) const;

    WGPURenderPipeline pipeline() const { return m_pipeline; }
    const shader::BackendTarget& target() const { return m_target; }
    const std::string& lastError() const { return m_lastError; }

    /// Empty if WebGPU can load the target's sources, otherwise the reason it cannot
    static std::string unsupportedReason(const shader::BackendTarget& target);

private:
    bool fail(const std::string& message);

    WGPUShaderModule createModule(const shader::ShaderSource& source, shader::ShaderStage stage);
    bool createModules(const shader::GeneratedShader& generated);
    bool createBindGroupLayouts();
    bool createUniformBuffer();
    bool createDefaultSampler();
    bool createStaticBindGroups();
    bool createPipeline(const shader::GeneratedShader& generated, WGPUTextureFormat colorFormat);

    /// Entries of a bind group, with the texture and sampler filled in if present
    std::vector<WGPUBindGroupEntry> groupEntries(uint32_t group, WGPUTextureView view,
                                                 WGPUSampler sampler) const;

    WGPUDevice m_device = nullptr;
    shader::BackendTarget m_target;
    shader::BindingLayout m_layout;
    uint32_t m_textureGroup = 0;

    WGPUShaderModule m_vertexModule = nullptr;
    WGPUShaderModule m_fragmentModule = nullptr;  ///< Same as m_vertexModule for WGSL
    std::vector<WGPUBindGroupLayout> m_groupLayouts;
    std::vector<WGPUBindGroup> m_staticGroups;   ///< Groups without a texture; null for the texture group
    WGPUPipelineLayout m_pipelineLayout = nullptr;
    WGPURenderPipeline m_pipeline = nullptr;
    WGPUBuffer m_uniformBuffer = nullptr;
    WGPUSampler m_defaultSampler = nullptr;

    std::string m_lastError;
};

} // namespace uishade::gpu
