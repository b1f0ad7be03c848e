#pragma once

#include <span>
#include <ranges>
#include <utility>
#include <concepts>
#include <functional>

#include "lcd/core/math.hpp"
#include "lcd/core/color.hpp"
#include "lcd/core/status.hpp"
#include "lcd/tft/protocol.hpp"

namespace lcd::graphics {

struct pixel {
	vec2u16 pos{};
	color   clr{};
};

template<class T>
concept pixel_range = std::ranges::input_range<T>
	&& std::convertible_to<std::ranges::range_reference_t<T>, pixel>;

/// What a drawing surface needs from a display
template<class T>
concept pixel_target = requires(T &target, const uint16_t coord, const color clr, const rect &window,
		std::span<const color> colors) {
	{ target.size() } -> std::same_as<vec2u16>;
	{ target.write_pixel(coord, coord, clr) } -> std::same_as<status>;
	{ target.fill_rect(vec2u16{}, vec2u16{}, clr) } -> std::same_as<status>;
	{ target.write_block(window, colors) } -> std::same_as<status>;
};

/**
 * @brief Thin surface for shape/text renderers that only know "put this pixel".
 *
 * Off-panel pixels of draw() are dropped the way a drawing layer expects a
 * clipped target to behave. draw_sized() hands the whole bounding box to the
 * display as one block.
 */
template<pixel_target Display>
class canvas {
public:
	explicit canvas(Display &display) noexcept
		: m_display{ std::ref(display) } {}

	[[nodiscard]]
	auto size() const noexcept -> vec2u16 { return m_display.get().size(); }

	[[nodiscard]]
	auto bounding_box() const noexcept -> rect { return rect::from_size({}, size()); }

	[[nodiscard]]
	auto set_pixel(const vec2u16 pos, const color clr) noexcept -> status {
		return m_display.get().write_pixel(pos.x, pos.y, clr);
	}

	template<pixel_range Pixels>
	[[nodiscard]]
	auto draw(Pixels &&pixels) noexcept -> status {
		const auto bounds{ bounding_box() };
		for (const pixel px : pixels) {
			if (!bounds.contains(px.pos)) {
				continue;
			}
			if (const auto result{ set_pixel(px.pos, px.clr) }; result != status::ok) [[unlikely]] {
				return result;
			}
		}
		return status::ok;
	}

	/// `colors` covers `box` row by row
	template<tft::color_range Colors>
	[[nodiscard]]
	auto draw_sized(const rect &box, Colors &&colors) noexcept -> status {
		return m_display.get().write_block(box, std::forward<Colors>(colors));
	}

	[[nodiscard]]
	auto fill_rect(const vec2u16 pos, const vec2u16 size, const color clr) noexcept -> status {
		return m_display.get().fill_rect(pos, size, clr);
	}

	[[nodiscard]]
	auto display() noexcept -> Display & { return m_display.get(); }

private:
	std::reference_wrapper<Display> m_display;
};

} // namespace lcd::graphics
