#pragma once

#include <array>
#include <cstdint>

namespace lcd::core {

/// RGB565: rrrrrggg gggbbbbb
using color = uint16_t;

[[nodiscard]]
constexpr auto make_color565(const uint8_t r5, const uint8_t g6, const uint8_t b5) noexcept -> color {
	return static_cast<color>(
		(static_cast<uint32_t>(r5 & 0x1Fu) << 11) |
		(static_cast<uint32_t>(g6 & 0x3Fu) << 5) |
		(static_cast<uint32_t>(b5 & 0x1Fu))
	);
}

/// 8 bits per channel in, low bits are dropped
[[nodiscard]]
constexpr auto make_color(const uint8_t r, const uint8_t g, const uint8_t b) noexcept -> color {
	return make_color565(r >> 3, g >> 2, b >> 3);
}

[[nodiscard]] constexpr auto red_of  (const color clr) noexcept -> uint8_t { return (clr >> 11) & 0x1Fu; }
[[nodiscard]] constexpr auto green_of(const color clr) noexcept -> uint8_t { return (clr >>  5) & 0x3Fu; }
[[nodiscard]] constexpr auto blue_of (const color clr) noexcept -> uint8_t { return  clr        & 0x1Fu; }

/// Wire order of the controller: high byte first
[[nodiscard]]
constexpr auto to_bytes(const color clr) noexcept -> std::array<uint8_t, 2> {
	return { static_cast<uint8_t>(clr >> 8), static_cast<uint8_t>(clr) };
}

namespace colors {

inline constexpr color black       { 0x0000u }; /*   0,   0,   0 */
inline constexpr color navy        { 0x000Fu }; /*   0,   0, 128 */
inline constexpr color dark_green  { 0x03E0u }; /*   0, 128,   0 */
inline constexpr color maroon      { 0x7800u }; /* 128,   0,   0 */
inline constexpr color dark_grey   { 0x7BEFu }; /* 128, 128, 128 */
inline constexpr color blue        { 0x001Fu }; /*   0,   0, 255 */
inline constexpr color green       { 0x07E0u }; /*   0, 255,   0 */
inline constexpr color cyan        { 0x07FFu }; /*   0, 255, 255 */
inline constexpr color red         { 0xF800u }; /* 255,   0,   0 */
inline constexpr color magenta     { 0xF81Fu }; /* 255,   0, 255 */
inline constexpr color yellow      { 0xFFE0u }; /* 255, 255,   0 */
inline constexpr color white       { 0xFFFFu }; /* 255, 255, 255 */
inline constexpr color orange      { 0xFDA0u }; /* 255, 180,   0 */

} // namespace colors

} // namespace lcd::core


namespace lcd {

using core::color;

} // namespace lcd
