// uishade GPU - Common Utilities Implementation

#include <uishade/gpu/gpu_common.h>

namespace uishade::gpu {

WGPUVertexFormat toVertexFormat(shader::VertexFormat format) {
    switch (format) {
        case shader::VertexFormat::Float32x2: return WGPUVertexFormat_Float32x2;
        case shader::VertexFormat::Uint32: return WGPUVertexFormat_Uint32;
    }
    return WGPUVertexFormat_Float32x2;
}

WGPUShaderStage toShaderStage(shader::ShaderStage stages) {
    WGPUShaderStage result = WGPUShaderStage_None;
    if (shader::hasStage(stages, shader::ShaderStage::Vertex)) result |= WGPUShaderStage_Vertex;
    if (shader::hasStage(stages, shader::ShaderStage::Fragment)) result |= WGPUShaderStage_Fragment;
    return result;
}

static WGPUFilterMode toFilterMode(raster::FilterMode filter) {
    return filter == raster::FilterMode::Linear ? WGPUFilterMode_Linear : WGPUFilterMode_Nearest;
}

static WGPUAddressMode toAddressMode(raster::AddressMode mode) {
    switch (mode) {
        case raster::AddressMode::ClampToEdge: return WGPUAddressMode_ClampToEdge;
        case raster::AddressMode::Repeat: return WGPUAddressMode_Repeat;
        case raster::AddressMode::MirrorRepeat: return WGPUAddressMode_MirrorRepeat;
    }
    return WGPUAddressMode_ClampToEdge;
}

static WGPUMipmapFilterMode toMipmapFilterMode(raster::FilterMode filter) {
    return filter == raster::FilterMode::Linear ? WGPUMipmapFilterMode_Linear : WGPUMipmapFilterMode_Nearest;
}

WGPUSamplerDescriptor toSamplerDescriptor(const raster::SamplerDesc& desc) {
    WGPUSamplerDescriptor samplerDesc = {};
    samplerDesc.addressModeU = toAddressMode(desc.addressU);
    samplerDesc.addressModeV = toAddressMode(desc.addressV);
    samplerDesc.addressModeW = WGPUAddressMode_ClampToEdge;
    samplerDesc.magFilter = toFilterMode(desc.filter);
    samplerDesc.minFilter = toFilterMode(desc.filter);
    samplerDesc.mipmapFilter = toMipmapFilterMode(desc.filter);
    samplerDesc.lodMinClamp = 0.0f;
    samplerDesc.lodMaxClamp = 32.0f;
    samplerDesc.maxAnisotropy = 1;
    return samplerDesc;
}

WGPUSampler createSampler(WGPUDevice device, const raster::SamplerDesc& desc) {
    WGPUSamplerDescriptor samplerDesc = toSamplerDescriptor(desc);
    return wgpuDeviceCreateSampler(device, &samplerDesc);
}

} // namespace uishade::gpu
