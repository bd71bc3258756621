#include <uishade/shader/ui_program.h>
#include <uishade/types.h>

namespace uishade::shader {

ExprPtr decodeChannel(const ExprPtr& packed, uint32_t shift) {
    ExprPtr shifted = shift == 0 ? packed : ir::shr(packed, ir::u32(shift));
    ExprPtr byte = ir::bitAnd(shifted, ir::u32(0xFFu));
    return ir::div(ir::toF32(byte), ir::f32(255.0f));
}

ExprPtr decodePackedColor(const ExprPtr& packed) {
    return ir::vec4(
        decodeChannel(packed, 24),
        decodeChannel(packed, 16),
        decodeChannel(packed, 8),
        decodeChannel(packed, 0)
    );
}

ShaderProgram buildUiProgram() {
    ShaderProgram program;
    program.vertexLayout = uiVertexLayout();
    program.uniforms.typeName = "TransformUniforms";
    program.uniforms.instanceName = TRANSFORM_BINDING;
    program.uniforms.members = {{TRANSFORM_MEMBER, ValueType::Mat4F, 0}};
    program.textureName = TEXTURE_BINDING;
    program.samplerName = SAMPLER_BINDING;

    // Vertex stage
    auto position = ir::attribute("a_position", ValueType::Vec2F);
    auto texCoord = ir::attribute("a_tex_coord", ValueType::Vec2F);
    auto color = ir::attribute("a_color", ValueType::U32);
    auto matrix = ir::uniform(TRANSFORM_BINDING, TRANSFORM_MEMBER, ValueType::Mat4F);

    program.clipPosition = ir::matMul(matrix, ir::vec4(position, ir::f32(0.0f), ir::f32(1.0f)));
    program.varyings = {
        {VARYING_TEX_COORD, ValueType::Vec2F, 0},
        {VARYING_COLOR, ValueType::Vec4F, 1},
    };
    program.varyingValues = {texCoord, decodePackedColor(color)};

    // Fragment stage
    auto uv = ir::varying(VARYING_TEX_COORD, ValueType::Vec2F);
    auto tint = ir::varying(VARYING_COLOR, ValueType::Vec4F);
    program.fragmentColor = ir::mul(tint, ir::sample(TEXTURE_BINDING, SAMPLER_BINDING, uv));

    return program;
}

} // namespace uishade::shader
