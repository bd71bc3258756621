// uishade GPU - UI Pipeline Implementation

#include <uishade/gpu/ui_pipeline.h>
#include <uishade/types.h>

#include <webgpu/wgpu.h>
#include <iostream>

namespace uishade::gpu {

UiPipeline::~UiPipeline() {
    cleanup();
}

void UiPipeline::cleanup() {
    for (auto& group : m_staticGroups) {
        release(group);
    }
    m_staticGroups.clear();
    release(m_pipeline);
    release(m_pipelineLayout);
    for (auto& layout : m_groupLayouts) {
        release(layout);
    }
    m_groupLayouts.clear();
    if (m_fragmentModule == m_vertexModule) {
        m_fragmentModule = nullptr;
    }
    release(m_fragmentModule);
    release(m_vertexModule);
    release(m_uniformBuffer);
    release(m_defaultSampler);
    m_device = nullptr;
}

bool UiPipeline::fail(const std::string& message) {
    m_lastError = message;
    std::cerr << "[UiPipeline] " << message << "\n";
    cleanup();
    return false;
}

std::string UiPipeline::unsupportedReason(const shader::BackendTarget& target) {
    if (target.backend == shader::Backend::Wgsl) {
        return "";
    }
    if (target.glslEs || target.glslVersion < 440) {
        return "GLSL " + std::to_string(target.glslVersion) + (target.glslEs ? " es" : "") +
               " is not Vulkan GLSL";
    }
    if (!target.caps.separateSamplers) {
        return "combined image samplers are not supported";
    }
    if (!target.caps.explicitBindingQualifiers) {
        return "bindings must be declared in the source";
    }
    return "";
}

bool UiPipeline::init(WGPUDevice device, const shader::GeneratedShader& generated,
                      const shader::BackendTarget& target, WGPUTextureFormat colorFormat) {
    cleanup();

    std::string reason = unsupportedReason(target);
    if (!reason.empty()) {
        return fail("Target '" + target.name + "' cannot be loaded by WebGPU: " + reason);
    }
    if (generated.targetName != target.name || generated.backend != target.backend) {
        return fail("Shader was generated for '" + generated.targetName + "', not '" + target.name + "'");
    }

    m_device = device;
    m_target = target;
    m_layout = target.bindingLayout();

    const shader::ResourceBinding* texture = m_layout.find(shader::TEXTURE_BINDING);
    if (!texture) {
        return fail("Binding layout has no texture");
    }
    m_textureGroup = texture->group;

    if (!createModules(generated)) return false;
    if (!createBindGroupLayouts()) return false;
    if (!createUniformBuffer()) return false;
    if (!createDefaultSampler()) return false;
    if (!createStaticBindGroups()) return false;
    if (!createPipeline(generated, colorFormat)) return false;

    m_lastError.clear();
    return true;
}

WGPUShaderModule UiPipeline::createModule(const shader::ShaderSource& source, shader::ShaderStage stage) {
    WGPUShaderModuleDescriptor shaderDesc = {};
    shaderDesc.label = toStringView(source.fileSuffix);

    if (m_target.backend == shader::Backend::Wgsl) {
        WGPUShaderSourceWGSL wgslDesc = {};
        wgslDesc.chain.sType = WGPUSType_ShaderSourceWGSL;
        wgslDesc.code = toStringView(source.code);
        shaderDesc.nextInChain = &wgslDesc.chain;
        return wgpuDeviceCreateShaderModule(m_device, &shaderDesc);
    }

    WGPUShaderSourceGLSL glslDesc = {};
    glslDesc.chain.sType = static_cast<WGPUSType>(WGPUSType_ShaderSourceGLSL);
    glslDesc.stage = toShaderStage(stage);
    glslDesc.code = toStringView(source.code);
    glslDesc.defineCount = 0;
    glslDesc.defines = nullptr;
    shaderDesc.nextInChain = &glslDesc.chain;
    return wgpuDeviceCreateShaderModule(m_device, &shaderDesc);
}

bool UiPipeline::createModules(const shader::GeneratedShader& generated) {
    const shader::ShaderSource* vs = generated.sourceFor(shader::ShaderStage::Vertex);
    const shader::ShaderSource* fs = generated.sourceFor(shader::ShaderStage::Fragment);
    if (!vs || !fs) {
        return fail("Generated shader lacks a vertex or fragment source");
    }

    m_vertexModule = createModule(*vs, shader::ShaderStage::Vertex);
    if (!m_vertexModule) {
        return fail("Failed to create vertex shader module");
    }

    if (fs == vs) {
        m_fragmentModule = m_vertexModule;
        return true;
    }
    m_fragmentModule = createModule(*fs, shader::ShaderStage::Fragment);
    if (!m_fragmentModule) {
        return fail("Failed to create fragment shader module");
    }
    return true;
}

bool UiPipeline::createBindGroupLayouts() {
    for (uint32_t group = 0; group < m_layout.groupCount(); ++group) {
        std::vector<shader::ResourceBinding> bindings = m_layout.entriesInGroup(group);
        std::vector<WGPUBindGroupLayoutEntry> entries(bindings.size());

        for (size_t i = 0; i < bindings.size(); ++i) {
            auto& entry = entries[i];
            const auto& binding = bindings[i];

            entry = {};
            entry.binding = binding.binding;
            entry.visibility = toShaderStage(binding.visibility);

            switch (binding.kind) {
                case shader::ResourceKind::UniformBuffer:
                    entry.buffer.type = WGPUBufferBindingType_Uniform;
                    entry.buffer.minBindingSize = binding.size;
                    break;
                case shader::ResourceKind::Texture2D:
                    entry.texture.sampleType = WGPUTextureSampleType_Float;
                    entry.texture.viewDimension = WGPUTextureViewDimension_2D;
                    break;
                case shader::ResourceKind::Sampler:
                    entry.sampler.type = WGPUSamplerBindingType_Filtering;
                    break;
            }
        }

        WGPUBindGroupLayoutDescriptor layoutDesc = {};
        layoutDesc.entryCount = entries.size();
        layoutDesc.entries = entries.data();
        WGPUBindGroupLayout layout = wgpuDeviceCreateBindGroupLayout(m_device, &layoutDesc);
        if (!layout) {
            return fail("Failed to create bind group layout " + std::to_string(group));
        }
        m_groupLayouts.push_back(layout);
    }

    WGPUPipelineLayoutDescriptor pipelineLayoutDesc = {};
    pipelineLayoutDesc.bindGroupLayoutCount = m_groupLayouts.size();
    pipelineLayoutDesc.bindGroupLayouts = m_groupLayouts.data();
    m_pipelineLayout = wgpuDeviceCreatePipelineLayout(m_device, &pipelineLayoutDesc);
    if (!m_pipelineLayout) {
        return fail("Failed to create pipeline layout");
    }
    return true;
}

bool UiPipeline::createUniformBuffer() {
    WGPUBufferDescriptor bufferDesc = {};
    bufferDesc.label = toStringView("ui transform");
    bufferDesc.size = sizeof(TransformUniforms);
    bufferDesc.usage = WGPUBufferUsage_Uniform | WGPUBufferUsage_CopyDst;
    m_uniformBuffer = wgpuDeviceCreateBuffer(m_device, &bufferDesc);
    if (!m_uniformBuffer) {
        return fail("Failed to create transform uniform buffer");
    }
    return true;
}

bool UiPipeline::createDefaultSampler() {
    m_defaultSampler = createSampler(m_device, raster::SamplerDesc{});
    if (!m_defaultSampler) {
        return fail("Failed to create UI sampler");
    }
    return true;
}

std::vector<WGPUBindGroupEntry> UiPipeline::groupEntries(uint32_t group, WGPUTextureView view,
                                                         WGPUSampler sampler) const {
    std::vector<shader::ResourceBinding> bindings = m_layout.entriesInGroup(group);
    std::vector<WGPUBindGroupEntry> entries(bindings.size());

    for (size_t i = 0; i < bindings.size(); ++i) {
        auto& entry = entries[i];
        entry = {};
        entry.binding = bindings[i].binding;
        switch (bindings[i].kind) {
            case shader::ResourceKind::UniformBuffer:
                entry.buffer = m_uniformBuffer;
                entry.size = sizeof(TransformUniforms);
                break;
            case shader::ResourceKind::Texture2D:
                entry.textureView = view;
                break;
            case shader::ResourceKind::Sampler:
                entry.sampler = sampler;
                break;
        }
    }
    return entries;
}

bool UiPipeline::createStaticBindGroups() {
    m_staticGroups.assign(m_groupLayouts.size(), nullptr);

    for (uint32_t group = 0; group < m_groupLayouts.size(); ++group) {
        if (group == m_textureGroup) continue;

        std::vector<WGPUBindGroupEntry> entries = groupEntries(group, nullptr, nullptr);
        WGPUBindGroupDescriptor bgDesc = {};
        bgDesc.layout = m_groupLayouts[group];
        bgDesc.entryCount = entries.size();
        bgDesc.entries = entries.data();
        m_staticGroups[group] = wgpuDeviceCreateBindGroup(m_device, &bgDesc);
        if (!m_staticGroups[group]) {
            return fail("Failed to create bind group " + std::to_string(group));
        }
    }
    return true;
}

bool UiPipeline::createPipeline(const shader::GeneratedShader& generated, WGPUTextureFormat colorFormat) {
    shader::VertexLayout vertexLayout = shader::uiVertexLayout();

    std::vector<WGPUVertexAttribute> attributes(vertexLayout.attributes.size());
    for (size_t i = 0; i < attributes.size(); ++i) {
        const auto& attr = vertexLayout.attributes[i];
        attributes[i] = {};
        attributes[i].format = toVertexFormat(attr.format);
        attributes[i].offset = attr.offset;
        attributes[i].shaderLocation = attr.location;
    }

    WGPUVertexBufferLayout vertexBufferLayout = {};
    vertexBufferLayout.arrayStride = vertexLayout.stride;
    vertexBufferLayout.stepMode = WGPUVertexStepMode_Vertex;
    vertexBufferLayout.attributeCount = attributes.size();
    vertexBufferLayout.attributes = attributes.data();

    WGPUBlendState blendState = {};
    blendState.color.srcFactor = WGPUBlendFactor_SrcAlpha;
    blendState.color.dstFactor = WGPUBlendFactor_OneMinusSrcAlpha;
    blendState.color.operation = WGPUBlendOperation_Add;
    blendState.alpha.srcFactor = WGPUBlendFactor_SrcAlpha;
    blendState.alpha.dstFactor = WGPUBlendFactor_OneMinusSrcAlpha;
    blendState.alpha.operation = WGPUBlendOperation_Add;

    WGPUColorTargetState colorTarget = {};
    colorTarget.format = colorFormat;
    colorTarget.writeMask = WGPUColorWriteMask_All;
    colorTarget.blend = &blendState;

    WGPUFragmentState fragmentState = {};
    fragmentState.module = m_fragmentModule;
    fragmentState.entryPoint = toStringView(generated.fragmentEntry);
    fragmentState.targetCount = 1;
    fragmentState.targets = &colorTarget;

    WGPURenderPipelineDescriptor pipelineDesc = {};
    pipelineDesc.label = toStringView(m_target.name);
    pipelineDesc.layout = m_pipelineLayout;
    pipelineDesc.vertex.module = m_vertexModule;
    pipelineDesc.vertex.entryPoint = toStringView(generated.vertexEntry);
    pipelineDesc.vertex.bufferCount = 1;
    pipelineDesc.vertex.buffers = &vertexBufferLayout;
    pipelineDesc.primitive.topology = WGPUPrimitiveTopology_TriangleList;
    pipelineDesc.primitive.frontFace = WGPUFrontFace_CCW;
    pipelineDesc.primitive.cullMode = WGPUCullMode_None;
    pipelineDesc.multisample.count = 1;
    pipelineDesc.multisample.mask = ~0u;
    pipelineDesc.fragment = &fragmentState;

    m_pipeline = wgpuDeviceCreateRenderPipeline(m_device, &pipelineDesc);
    if (!m_pipeline) {
        return fail("Failed to create render pipeline for '" + m_target.name + "'");
    }
    return true;
}

void UiPipeline::writeTransform(WGPUQueue queue, const glm::mat4& transform) const {
    if (!m_uniformBuffer) return;
    TransformUniforms uniforms(shader::targetTransform(m_target, transform));
    wgpuQueueWriteBuffer(queue, m_uniformBuffer, 0, &uniforms, sizeof(uniforms));
}

WGPUBindGroup UiPipeline::createTextureBindGroup(WGPUTextureView view, WGPUSampler sampler) const {
    if (!valid()) {
        std::cerr << "[UiPipeline] createTextureBindGroup called before init\n";
        return nullptr;
    }

    std::vector<WGPUBindGroupEntry> entries = groupEntries(m_textureGroup, view, sampler);
    WGPUBindGroupDescriptor bgDesc = {};
    bgDesc.layout = m_groupLayouts[m_textureGroup];
    bgDesc.entryCount = entries.size();
    bgDesc.entries = entries.data();

    WGPUBindGroup group = wgpuDeviceCreateBindGroup(m_device, &bgDesc);
    if (!group) {
        std::cerr << "[UiPipeline] Failed to create texture bind group\n";
    }
    return group;
}

WGPUBindGroup UiPipeline::createTextureBindGroup(WGPUTextureView view) const {
    return createTextureBindGroup(view, m_defaultSampler);
}

void UiPipeline::bind(WGPURenderPassEncoder pass, WGPUBindGroup textureBindGroup) const {
    wgpuRenderPassEncoderSetPipeline(pass, m_pipeline);
    for (uint32_t group = 0; group < m_staticGroups.size(); ++group) {
        WGPUBindGroup bindGroup = group == m_textureGroup ? textureBindGroup : m_staticGroups[group];
        wgpuRenderPassEncoderSetBindGroup(pass, group, bindGroup, 0, nullptr);
    }
}

} // namespace uishade::gpu
