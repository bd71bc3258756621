#pragma once

/**
 * @file color.h
 * @brief Packed RGBA8 vertex color codec
 *
 * UI vertices carry their color as one 32-bit integer with the red channel in
 * the most significant byte. Every backend decodes it with the same formula;
 * the functions here are the CPU reference for that formula.
 *
 * @par Example
 * @code
 * uint32_t coral = packColor(255, 127, 80, 255);   // 0xFF7F50FF
 * glm::vec4 c = decodeColor(coral);                // (1.0, 0.498, 0.314, 1.0)
 * @endcode
 */

#include <glm/glm.hpp>
#include <cstdint>

namespace uishade {

constexpr uint32_t packColor(uint8_t r, uint8_t g, uint8_t b, uint8_t a) {
    return (static_cast<uint32_t>(r) << 24) |
           (static_cast<uint32_t>(g) << 16) |
           (static_cast<uint32_t>(b) << 8) |
           static_cast<uint32_t>(a);
}

/**
 * @brief Pack a normalized color
 *
 * Channels are clamped to [0, 1] and rounded to the nearest 8-bit value.
 */
uint32_t packColor(const glm::vec4& color);

constexpr uint8_t channelR(uint32_t c) { return static_cast<uint8_t>((c >> 24) & 0xFFu); }
constexpr uint8_t channelG(uint32_t c) { return static_cast<uint8_t>((c >> 16) & 0xFFu); }
constexpr uint8_t channelB(uint32_t c) { return static_cast<uint8_t>((c >> 8) & 0xFFu); }
constexpr uint8_t channelA(uint32_t c) { return static_cast<uint8_t>(c & 0xFFu); }

/**
 * @brief Decode a packed color into normalized RGBA
 *
 * All four channels are always produced, in RGBA order.
 */
glm::vec4 decodeColor(uint32_t packed);

} // namespace uishade
