/**
 * @file test_binding_layout.cpp
 * @brief Unit tests for the vertex layout and resource binding models
 */

#include <catch2/catch_test_macros.hpp>
#include <uishade/shader/binding_layout.h>
#include <uishade/types.h>

using namespace uishade;
using namespace uishade::shader;

TEST_CASE("UI vertex layout", "[shader][layout]") {
    VertexLayout layout = uiVertexLayout();

    SECTION("matches the 20-byte vertex record") {
        REQUIRE(layout.stride == 20);
        REQUIRE(layout.stride == sizeof(Vertex));
        REQUIRE(layout.attributes.size() == 3);
        REQUIRE(layout.validate().empty());
    }

    SECTION("locations, formats and offsets") {
        const VertexAttribute* pos = layout.find("a_position");
        const VertexAttribute* uv = layout.find("a_tex_coord");
        const VertexAttribute* color = layout.find("a_color");
        REQUIRE(pos);
        REQUIRE(uv);
        REQUIRE(color);

        REQUIRE(pos->location == 0);
        REQUIRE(pos->format == VertexFormat::Float32x2);
        REQUIRE(pos->offset == 0);

        REQUIRE(uv->location == 1);
        REQUIRE(uv->format == VertexFormat::Float32x2);
        REQUIRE(uv->offset == 8);

        REQUIRE(color->location == 2);
        REQUIRE(color->format == VertexFormat::Uint32);
        REQUIRE(color->offset == 16);
    }

    SECTION("duplicate locations are rejected") {
        layout.attributes[2].location = 0;
        REQUIRE_FALSE(layout.validate().empty());
    }

    SECTION("attributes must fit in the stride") {
        layout.attributes[2].offset = 18;
        REQUIRE_FALSE(layout.validate().empty());
    }
}

TEST_CASE("Grouped binding model", "[shader][layout]") {
    BindingLayout layout = uiBindingLayout(BindingModel::Grouped);
    REQUIRE(layout.validate().empty());
    REQUIRE(layout.groupCount() == 2);

    const ResourceBinding* transform = layout.find(TRANSFORM_BINDING);
    REQUIRE(transform);
    REQUIRE(transform->group == 0);
    REQUIRE(transform->binding == 0);
    REQUIRE(transform->kind == ResourceKind::UniformBuffer);
    REQUIRE(transform->size == 64);
    REQUIRE(hasStage(transform->visibility, ShaderStage::Vertex));
    REQUIRE_FALSE(hasStage(transform->visibility, ShaderStage::Fragment));

    auto group1 = layout.entriesInGroup(1);
    REQUIRE(group1.size() == 2);
    REQUIRE(group1[0].name == TEXTURE_BINDING);
    REQUIRE(group1[0].binding == 0);
    REQUIRE(group1[1].name == SAMPLER_BINDING);
    REQUIRE(group1[1].binding == 1);
}

TEST_CASE("Unified binding model", "[shader][layout]") {
    BindingLayout layout = uiBindingLayout(BindingModel::Unified);
    REQUIRE(layout.validate().empty());
    REQUIRE(layout.groupCount() == 1);

    auto entries = layout.entriesInGroup(0);
    REQUIRE(entries.size() == 3);
    REQUIRE(entries[0].name == TRANSFORM_BINDING);
    REQUIRE(entries[1].name == TEXTURE_BINDING);
    REQUIRE(entries[2].name == SAMPLER_BINDING);
    REQUIRE(entries[0].binding == 0);
    REQUIRE(entries[1].binding == 1);
    REQUIRE(entries[2].binding == 2);
}

TEST_CASE("BindingLayout validation", "[shader][layout]") {
    SECTION("duplicate slot") {
        BindingLayout layout({
            {"a", ResourceKind::Texture2D, 0, 0, 0, ShaderStage::Fragment},
            {"b", ResourceKind::Sampler, 0, 0, 0, ShaderStage::Fragment},
        });
        REQUIRE_FALSE(layout.validate().empty());
    }

    SECTION("duplicate name") {
        BindingLayout layout({
            {"a", ResourceKind::Texture2D, 0, 0, 0, ShaderStage::Fragment},
            {"a", ResourceKind::Sampler, 0, 1, 0, ShaderStage::Fragment},
        });
        REQUIRE_FALSE(layout.validate().empty());
    }

    SECTION("uniform buffer without a size") {
        BindingLayout layout({
            {"u", ResourceKind::UniformBuffer, 0, 0, 0, ShaderStage::Vertex},
        });
        REQUIRE_FALSE(layout.validate().empty());
    }
}

TEST_CASE("binding model names", "[shader][layout]") {
    BindingModel model = BindingModel::Grouped;
    REQUIRE(parseBindingModel("unified", model));
    REQUIRE(model == BindingModel::Unified);
    REQUIRE(std::string(bindingModelName(model)) == "unified");
    REQUIRE_FALSE(parseBindingModel("flat", model));
    REQUIRE(model == BindingModel::Unified);
}
