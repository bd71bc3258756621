#pragma once

/**
 * @file binding_layout.h
 * @brief Declarative vertex input and resource binding layout
 *
 * One description of the shader interface, consumed by every code generator
 * and by the WebGPU pipeline. Backends differ only in the BindingModel used
 * to place the resources:
 *
 * | Resource    | Grouped          | Unified          |
 * |-------------|------------------|------------------|
 * | u_transform | group 0, slot 0  | group 0, slot 0  |
 * | t_texture   | group 1, slot 0  | group 0, slot 1  |
 * | s_sampler   | group 1, slot 1  | group 0, slot 2  |
 */

#include <cstdint>
#include <string>
#include <vector>

namespace uishade::shader {

enum class VertexFormat {
    Float32x2,
    Uint32
};

/// Size in bytes of one attribute of the given format
uint32_t formatSize(VertexFormat format);

struct VertexAttribute {
    std::string name;
    uint32_t location;
    VertexFormat format;
    uint32_t offset;
};

struct VertexLayout {
    uint32_t stride = 0;
    std::vector<VertexAttribute> attributes;

    const VertexAttribute* find(const std::string& name) const;

    /// Empty string when valid, otherwise a description of the first problem
    std::string validate() const;
};

/// position@0 (f32x2, +0), tex_coord@1 (f32x2, +8), color@2 (u32, +16); stride 20
VertexLayout uiVertexLayout();

enum class ResourceKind {
    UniformBuffer,
    Texture2D,
    Sampler
};

enum class ShaderStage : uint32_t {
    None = 0,
    Vertex = 1,
    Fragment = 2
};

inline ShaderStage operator|(ShaderStage a, ShaderStage b) {
    return static_cast<ShaderStage>(static_cast<uint32_t>(a) | static_cast<uint32_t>(b));
}

inline bool hasStage(ShaderStage set, ShaderStage stage) {
    return (static_cast<uint32_t>(set) & static_cast<uint32_t>(stage)) != 0;
}

struct ResourceBinding {
    std::string name;
    ResourceKind kind;
    uint32_t group;
    uint32_t binding;
    uint64_t size;            ///< Minimum binding size for buffers, 0 otherwise
    ShaderStage visibility;
};

/**
 * @brief How resources are spread over binding groups
 */
enum class BindingModel {
    Grouped,   ///< Uniform alone in group 0, texture + sampler in group 1
    Unified    ///< Everything in one binding space
};

const char* bindingModelName(BindingModel model);
bool parseBindingModel(const std::string& name, BindingModel& out);

class BindingLayout {
public:
    BindingLayout() = default;
    explicit BindingLayout(std::vector<ResourceBinding> entries);

    const std::vector<ResourceBinding>& entries() const { return m_entries; }

    /// Number of groups, i.e. highest group index + 1
    uint32_t groupCount() const;

    /// Entries of one group, ordered by binding
    std::vector<ResourceBinding> entriesInGroup(uint32_t group) const;

    const ResourceBinding* find(const std::string& name) const;

    /// Empty string when valid, otherwise a description of the first problem
    std::string validate() const;

private:
    std::vector<ResourceBinding> m_entries;
};

/// Binding names shared by the UI program and its layouts
constexpr const char* TRANSFORM_BINDING = "u_transform";
constexpr const char* TEXTURE_BINDING = "t_texture";
constexpr const char* SAMPLER_BINDING = "s_sampler";

BindingLayout uiBindingLayout(BindingModel model);

} // namespace uishade::shader
