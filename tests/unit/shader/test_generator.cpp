/**
 * @file test_generator.cpp
 * @brief Unit tests for WGSL and GLSL code generation
 *
 * Checks the generated interfaces (locations, bindings, entry points) and the
 * literal spelling each capability set selects. Compilation of the output is
 * covered by the GPU pipeline, not here.
 */

#include <catch2/catch_test_macros.hpp>
#include <uishade/shader/generator.h>
#include <uishade/shader/ui_program.h>

#include <stdexcept>
#include <string>

using namespace uishade::shader;

static bool contains(const std::string& haystack, const std::string& needle) {
    return haystack.find(needle) != std::string::npos;
}

TEST_CASE("WGSL generation", "[shader][generator][wgsl]") {
    GeneratedShader out = generateShader(buildUiProgram(), wgslTarget());

    SECTION("one module with both entry points") {
        REQUIRE(out.backend == Backend::Wgsl);
        REQUIRE(out.targetName == "wgsl");
        REQUIRE(out.sources.size() == 1);
        REQUIRE(out.sourceFor(ShaderStage::Vertex) == out.sourceFor(ShaderStage::Fragment));
        REQUIRE(out.sources[0].fileSuffix == ".wgsl");
        REQUIRE(out.vertexEntry == "vs_main");
        REQUIRE(out.fragmentEntry == "fs_main");
    }

    const std::string& code = out.sources[0].code;

    SECTION("resources use grouped bindings") {
        REQUIRE(contains(code, "@group(0) @binding(0) var<uniform> u_transform: TransformUniforms;"));
        REQUIRE(contains(code, "@group(1) @binding(0) var t_texture: texture_2d<f32>;"));
        REQUIRE(contains(code, "@group(1) @binding(1) var s_sampler: sampler;"));
    }

    SECTION("vertex inputs follow the vertex layout") {
        REQUIRE(contains(code, "@location(0) a_position: vec2<f32>,"));
        REQUIRE(contains(code, "@location(1) a_tex_coord: vec2<f32>,"));
        REQUIRE(contains(code, "@location(2) a_color: u32,"));
    }

    SECTION("stage bodies") {
        REQUIRE(contains(code, "fn vs_main(in: VertexInput) -> VertexOutput {"));
        REQUIRE(contains(code, "fn fs_main(in: VertexOutput) -> @location(0) vec4<f32> {"));
        REQUIRE(contains(code, "out.position = (u_transform.matrix * vec4<f32>(in.a_position, 0.0, 1.0));"));
        REQUIRE(contains(code, "(f32(((in.a_color >> 24u) & 0xFFu)) / 255.0)"));
        REQUIRE(contains(code, "(f32((in.a_color & 0xFFu)) / 255.0)"));
        REQUIRE(contains(code, "return (in.v_color * textureSample(t_texture, s_sampler, in.v_tex_coord));"));
    }

    SECTION("no per-backend coordinate flips") {
        REQUIRE_FALSE(contains(code, "-1.0"));
        REQUIRE_FALSE(contains(code, "1.0 -"));
    }
}

TEST_CASE("GLSL 450 generation", "[shader][generator][glsl]") {
    GeneratedShader out = generateShader(buildUiProgram(), spirvGlslTarget());

    REQUIRE(out.backend == Backend::Glsl);
    REQUIRE(out.sources.size() == 2);
    REQUIRE(out.vertexEntry == "main");
    REQUIRE(out.fragmentEntry == "main");

    const ShaderSource* vs = out.sourceFor(ShaderStage::Vertex);
    const ShaderSource* fs = out.sourceFor(ShaderStage::Fragment);
    REQUIRE(vs);
    REQUIRE(fs);
    REQUIRE(vs->fileSuffix == ".vert");
    REQUIRE(fs->fileSuffix == ".frag");

    SECTION("vertex source") {
        REQUIRE(vs->code.rfind("#version 450\n", 0) == 0);
        REQUIRE(contains(vs->code, "layout(location = 0) in vec2 a_position;"));
        REQUIRE(contains(vs->code, "layout(location = 2) in uint a_color;"));
        REQUIRE(contains(vs->code, "layout(std140, set = 0, binding = 0) uniform TransformUniforms {"));
        REQUIRE(contains(vs->code, "} u_transform;"));
        REQUIRE(contains(vs->code, "layout(location = 1) out vec4 v_color;"));
        REQUIRE(contains(vs->code, "((a_color >> 16u) & 0xFFu)"));
        REQUIRE(contains(vs->code, "gl_Position = (u_transform.matrix * vec4(a_position, 0.0, 1.0));"));
    }

    SECTION("fragment source uses separate texture and sampler") {
        REQUIRE(contains(fs->code, "layout(location = 1) in vec4 v_color;"));
        REQUIRE(contains(fs->code, "layout(set = 1, binding = 0) uniform texture2D t_texture;"));
        REQUIRE(contains(fs->code, "layout(set = 1, binding = 1) uniform sampler s_sampler;"));
        REQUIRE(contains(fs->code, "layout(location = 0) out vec4 o_color;"));
        REQUIRE(contains(fs->code, "o_color = (v_color * texture(sampler2D(t_texture, s_sampler), v_tex_coord));"));
    }
}

TEST_CASE("GLSL ES 300 generation", "[shader][generator][glsl]") {
    GeneratedShader out = generateShader(buildUiProgram(), glslEs300Target());
    const ShaderSource* vs = out.sourceFor(ShaderStage::Vertex);
    const ShaderSource* fs = out.sourceFor(ShaderStage::Fragment);
    REQUIRE(vs);
    REQUIRE(fs);

    SECTION("version and precision") {
        REQUIRE(vs->code.rfind("#version 300 es\n", 0) == 0);
        REQUIRE(fs->code.rfind("#version 300 es\n", 0) == 0);
        REQUIRE(contains(fs->code, "precision highp float;"));
    }

    SECTION("bindings are left to the host") {
        REQUIRE_FALSE(contains(vs->code, "binding ="));
        REQUIRE_FALSE(contains(fs->code, "binding ="));
        REQUIRE_FALSE(contains(vs->code, "set ="));
        REQUIRE(contains(vs->code, "layout(std140) uniform TransformUniforms {"));
    }

    SECTION("varyings match by name") {
        REQUIRE(contains(vs->code, "\nout vec4 v_color;"));
        REQUIRE(contains(fs->code, "\nin vec4 v_color;"));
    }

    SECTION("combined sampler") {
        REQUIRE(contains(fs->code, "uniform sampler2D t_texture;"));
        REQUIRE_FALSE(contains(fs->code, "s_sampler"));
        REQUIRE(contains(fs->code, "texture(t_texture, v_tex_coord)"));
    }
}

TEST_CASE("literal spelling follows capabilities", "[shader][generator]") {
    SECTION("decimal literals without hex support") {
        BackendTarget target = spirvGlslTarget();
        target.name = "no-hex";
        target.caps.hexLiterals = false;
        GeneratedShader out = generateShader(buildUiProgram(), target);
        const std::string& code = out.sourceFor(ShaderStage::Vertex)->code;
        REQUIRE(contains(code, "& 255u)"));
        REQUIRE_FALSE(contains(code, "0xFF"));
    }

    SECTION("constructor literals without the u suffix") {
        BackendTarget target = glslEs300Target();
        target.name = "no-suffix";
        target.caps.unsignedLiteralSuffix = false;
        GeneratedShader out = generateShader(buildUiProgram(), target);
        const std::string& code = out.sourceFor(ShaderStage::Vertex)->code;
        REQUIRE(contains(code, "(a_color >> uint(24))"));
        REQUIRE(contains(code, "& uint(0xFF))"));
    }

    SECTION("arithmetic decode without bit operations") {
        BackendTarget target = glslEs300Target();
        target.name = "no-bitwise";
        target.caps.bitwiseIntegerOps = false;
        target.caps.hexLiterals = false;
        target.caps.unsignedLiteralSuffix = false;
        GeneratedShader out = generateShader(buildUiProgram(), target);
        const std::string& code = out.sourceFor(ShaderStage::Vertex)->code;
        REQUIRE_FALSE(contains(code, ">>"));
        REQUIRE_FALSE(contains(code, "&"));
        REQUIRE(contains(code, "((a_color / uint(16777216)) % uint(256))"));
        REQUIRE(contains(code, "(a_color % uint(256))"));
    }
}

TEST_CASE("generation rejects unusable programs", "[shader][generator]") {
    ShaderProgram program = buildUiProgram();

    SECTION("invalid program") {
        program.fragmentColor = nullptr;
        REQUIRE_THROWS_AS(generateShader(program, wgslTarget()), std::invalid_argument);
    }

    SECTION("resource missing from the binding layout") {
        program.textureName = "t_other";
        program.fragmentColor = ir::sample("t_other", SAMPLER_BINDING,
                                           ir::varying(VARYING_TEX_COORD, ValueType::Vec2F));
        REQUIRE(program.validate().empty());
        REQUIRE_THROWS_AS(generateShader(program, wgslTarget()), std::invalid_argument);
    }
}

TEST_CASE("createGenerator picks the backend", "[shader][generator]") {
    auto wgsl = createGenerator(wgslTarget());
    auto glsl = createGenerator(glslEs300Target());
    REQUIRE(dynamic_cast<WgslGenerator*>(wgsl.get()) != nullptr);
    REQUIRE(dynamic_cast<GlslGenerator*>(glsl.get()) != nullptr);
    REQUIRE(glsl->target().name == "glsl-es300");
}
