#pragma once

/**
 * @file gpu_common.h
 * @brief WebGPU helpers shared by the UI pipeline
 *
 * - String view conversion for descriptor labels and entry points
 * - Mapping of the declarative layout types to WebGPU enums
 * - Sampler creation from a SamplerDesc
 * - Safe release helpers for GPU resources
 */

#include <uishade/raster/texture.h>
#include <uishade/shader/binding_layout.h>

#include <webgpu/webgpu.h>
#include <cstring>
#include <string>

namespace uishade::gpu {

// =============================================================================
// String Helper
// =============================================================================

/**
 * @brief Convert C string to WebGPU string view
 */
inline WGPUStringView toStringView(const char* str) {
    WGPUStringView view;
    view.data = str;
    view.length = std::strlen(str);
    return view;
}

inline WGPUStringView toStringView(const std::string& str) {
    WGPUStringView view;
    view.data = str.c_str();
    view.length = str.size();
    return view;
}

// =============================================================================
// Layout Conversion
// =============================================================================

WGPUVertexFormat toVertexFormat(shader::VertexFormat format);

WGPUShaderStage toShaderStage(shader::ShaderStage stages);

// =============================================================================
// Sampler Factory
// =============================================================================

/**
 * @brief Sampler descriptor matching a CPU sampler description
 *
 * The filter mode also selects the mipmap filter, so a linear sampler
 * blends between mip levels the way it blends between texels.
 */
WGPUSamplerDescriptor toSamplerDescriptor(const raster::SamplerDesc& desc);

/**
 * @brief Create a sampler matching a CPU sampler description
 *
 * The default SamplerDesc gives the UI sampler: linear filtering, clamp to edge.
 * The caller owns the sampler.
 */
WGPUSampler createSampler(WGPUDevice device, const raster::SamplerDesc& desc);

// =============================================================================
// Resource Cleanup Helpers
// =============================================================================

/**
 * @brief Safe release helpers that check for null, release, and set to nullptr
 *
 * Usage:
 * @code
 * void cleanup() {
 *     gpu::release(m_pipeline);
 *     gpu::release(m_pipelineLayout);
 *     gpu::release(m_uniformBuffer);
 * }
 * @endcode
 */

inline void release(WGPURenderPipeline& p) {
    if (p) { wgpuRenderPipelineRelease(p); p = nullptr; }
}

inline void release(WGPUBindGroupLayout& l) {
    if (l) { wgpuBindGroupLayoutRelease(l); l = nullptr; }
}

inline void release(WGPUBindGroup& g) {
    if (g) { wgpuBindGroupRelease(g); g = nullptr; }
}

inline void release(WGPUBuffer& b) {
    if (b) { wgpuBufferRelease(b); b = nullptr; }
}

inline void release(WGPUSampler& s) {
    if (s) { wgpuSamplerRelease(s); s = nullptr; }
}

inline void release(WGPUShaderModule& m) {
    if (m) { wgpuShaderModuleRelease(m); m = nullptr; }
}

inline void release(WGPUPipelineLayout& l) {
    if (l) { wgpuPipelineLayoutRelease(l); l = nullptr; }
}

} // namespace uishade::gpu
