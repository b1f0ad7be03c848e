#pragma once

#include <cstddef>
#include <cstdint>

namespace lcd::core {

struct alignas(alignof(uint32_t)) vec2u16 {
	union { uint16_t x, w{}; };
	union { uint16_t y, h{}; };

	inline auto operator +(const vec2u16 &other) const noexcept -> vec2u16;
	inline auto operator -(const vec2u16 &other) const noexcept -> vec2u16;

	inline auto operator==(const vec2u16 &other) const noexcept -> bool;
	inline auto operator!=(const vec2u16 &other) const noexcept -> bool;

	inline static auto make(uint16_t x, uint16_t y) noexcept { return vec2u16{ .x = x, .y = y }; }
	inline static auto make(uint16_t value) noexcept { return make(value, value); }

	[[nodiscard]]
	inline auto swapped() const noexcept -> vec2u16 { return make(y, x); }
};

/// Inclusive pixel rectangle, the way the controller's address registers see it
struct rect {
	vec2u16 left_top{};
	vec2u16 right_bottom{};

	[[nodiscard]]
	inline static auto from_corners(uint16_t x0, uint16_t y0, uint16_t x1, uint16_t y1) noexcept -> rect;

	[[nodiscard]]
	inline static auto from_size(vec2u16 pos, vec2u16 size) noexcept -> rect;

	[[nodiscard]] inline auto width() const noexcept -> uint32_t;
	[[nodiscard]] inline auto height() const noexcept -> uint32_t;
	[[nodiscard]] inline auto area() const noexcept -> size_t;

	/// true when the corners are ordered and the whole rect fits into [0, bounds)
	[[nodiscard]] inline auto fits(vec2u16 bounds) const noexcept -> bool;
	[[nodiscard]] inline auto contains(vec2u16 point) const noexcept -> bool;

	inline auto operator==(const rect &other) const noexcept -> bool;
};

} // namespace lcd::core

namespace lcd {

using core::vec2u16;
using core::rect;

} // namespace lcd

#include "./math.inl"
