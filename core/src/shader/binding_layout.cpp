#include <uishade/shader/binding_layout.h>
#include <uishade/types.h>
#include <algorithm>
#include <set>
#include <sstream>
#include <utility>

namespace uishade::shader {

uint32_t formatSize(VertexFormat format) {
    switch (format) {
        case VertexFormat::Float32x2: return 8;
        case VertexFormat::Uint32: return 4;
    }
    return 0;
}

const VertexAttribute* VertexLayout::find(const std::string& name) const {
    for (const auto& attr : attributes) {
        if (attr.name == name) return &attr;
    }
    return nullptr;
}

std::string VertexLayout::validate() const {
    std::set<uint32_t> locations;
    std::set<std::string> names;

    for (const auto& attr : attributes) {
        if (!locations.insert(attr.location).second) {
            return "duplicate vertex attribute location " + std::to_string(attr.location);
        }
        if (!names.insert(attr.name).second) {
            return "duplicate vertex attribute '" + attr.name + "'";
        }
        if (attr.offset + formatSize(attr.format) > stride) {
            return "vertex attribute '" + attr.name + "' overruns the stride";
        }
    }
    return "";
}

VertexLayout uiVertexLayout() {
    VertexLayout layout;
    layout.stride = sizeof(Vertex);
    layout.attributes = {
        {"a_position", 0, VertexFormat::Float32x2, offsetof(Vertex, position)},
        {"a_tex_coord", 1, VertexFormat::Float32x2, offsetof(Vertex, texCoord)},
        {"a_color", 2, VertexFormat::Uint32, offsetof(Vertex, color)},
    };
    return layout;
}

const char* bindingModelName(BindingModel model) {
    switch (model) {
        case BindingModel::Grouped: return "grouped";
        case BindingModel::Unified: return "unified";
    }
    return "unknown";
}

bool parseBindingModel(const std::string& name, BindingModel& out) {
    if (name == "grouped") {
        out = BindingModel::Grouped;
        return true;
    }
    if (name == "unified") {
        out = BindingModel::Unified;
        return true;
    }
    return false;
}

BindingLayout::BindingLayout(std::vector<ResourceBinding> entries)
    : m_entries(std::move(entries)) {}

uint32_t BindingLayout::groupCount() const {
    uint32_t count = 0;
    for (const auto& e : m_entries) {
        count = std::max(count, e.group + 1);
    }
    return count;
}

std::vector<ResourceBinding> BindingLayout::entriesInGroup(uint32_t group) const {
    std::vector<ResourceBinding> result;
    for (const auto& e : m_entries) {
        if (e.group == group) result.push_back(e);
    }
    std::sort(result.begin(), result.end(),
              [](const ResourceBinding& a, const ResourceBinding& b) { return a.binding < b.binding; });
    return result;
}

const ResourceBinding* BindingLayout::find(const std::string& name) const {
    for (const auto& e : m_entries) {
        if (e.name == name) return &e;
    }
    return nullptr;
}

std::string BindingLayout::validate() const {
    std::set<std::pair<uint32_t, uint32_t>> slots;
    std::set<std::string> names;

    for (const auto& e : m_entries) {
        if (!slots.insert({e.group, e.binding}).second) {
            std::ostringstream ss;
            ss << "duplicate binding (group " << e.group << ", binding " << e.binding << ")";
            return ss.str();
        }
        if (!names.insert(e.name).second) {
            return "duplicate resource '" + e.name + "'";
        }
        if (e.kind == ResourceKind::UniformBuffer && e.size == 0) {
            return "uniform buffer '" + e.name + "' has no size";
        }
    }
    return "";
}

BindingLayout uiBindingLayout(BindingModel model) {
    const uint64_t transformSize = sizeof(TransformUniforms);

    if (model == BindingModel::Unified) {
        return BindingLayout({
            {TRANSFORM_BINDING, ResourceKind::UniformBuffer, 0, 0, transformSize, ShaderStage::Vertex},
            {TEXTURE_BINDING, ResourceKind::Texture2D, 0, 1, 0, ShaderStage::Fragment},
            {SAMPLER_BINDING, ResourceKind::Sampler, 0, 2, 0, ShaderStage::Fragment},
        });
    }

    return BindingLayout({
        {TRANSFORM_BINDING, ResourceKind::UniformBuffer, 0, 0, transformSize, ShaderStage::Vertex},
        {TEXTURE_BINDING, ResourceKind::Texture2D, 1, 0, 0, ShaderStage::Fragment},
        {SAMPLER_BINDING, ResourceKind::Sampler, 1, 1, 0, ShaderStage::Fragment},
    });
}

} // namespace uishade::shader
