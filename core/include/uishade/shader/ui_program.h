#pragma once

// uishade - UI Shader Program
// The single definition of the UI transform, color decode and composite stages

#include <uishade/shader/ir.h>

namespace uishade::shader {

/// Varying names produced by the UI vertex stage
constexpr const char* VARYING_TEX_COORD = "v_tex_coord";
constexpr const char* VARYING_COLOR = "v_color";

/// Uniform block member holding the 4x4 transform
constexpr const char* TRANSFORM_MEMBER = "matrix";

/// Decode one 8-bit channel of a packed u32 color: ((c >> shift) & 0xFF) / 255
ExprPtr decodeChannel(const ExprPtr& packed, uint32_t shift);

/// RGBA decode of a packed u32 color, all four channels
ExprPtr decodePackedColor(const ExprPtr& packed);

/**
 * @brief Build the UI program
 *
 * Vertex stage: clip = matrix * vec4(a_position, 0, 1); v_tex_coord = a_tex_coord;
 * v_color = decode(a_color). Fragment stage: v_color * sample(t_texture, s_sampler, v_tex_coord).
 */
ShaderProgram buildUiProgram();

} // namespace uishade::shader
