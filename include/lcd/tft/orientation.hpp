#pragma once

#include <cstdint>

#include "lcd/core/math.hpp"
#include "lcd/core/enum_array.hpp"
#include "lcd/tft/panel.hpp"
#include "lcd/tft/commands.hpp"

namespace lcd::tft {

enum class orientation : uint8_t {
	portrait,
	landscape,
	portrait_swapped,
	landscape_swapped,

	COUNT
};

struct orientation_info {
	uint8_t memory_access{};
	bool    swaps_axes{ false };
};

inline constexpr core::enum_array<orientation, orientation_info> orientations{ {
	orientation_info{ .memory_access = display_config::portrait,          .swaps_axes = false },
	orientation_info{ .memory_access = display_config::landscape,         .swaps_axes = true  },
	orientation_info{ .memory_access = display_config::portrait_swapped,  .swaps_axes = false },
	orientation_info{ .memory_access = display_config::landscape_swapped, .swaps_axes = true  },
} };

/// Value of the SET_MEMORY_ACCESS (MADCTL) parameter
[[nodiscard]]
constexpr auto memory_access_value(const orientation value, const color_order order) noexcept -> uint8_t {
	const auto order_bit{ order == color_order::bgr ? display_config::bgr_color_order : 0u };
	return static_cast<uint8_t>(orientations[value].memory_access | order_bit);
}

[[nodiscard]]
constexpr auto swaps_axes(const orientation value) noexcept -> bool {
	return orientations[value].swaps_axes;
}

/// Logical resolution seen by the caller
[[nodiscard]]
inline auto size_for(const orientation value, const panel_config &panel) noexcept -> vec2u16 {
	return swaps_axes(value) ? panel.size.swapped() : panel.size;
}

/// Column (x) and row (y) the controller RAM starts at for the visible area
[[nodiscard]]
inline auto offset_for(const orientation value, const panel_config &panel) noexcept -> vec2u16 {
	return swaps_axes(value) ? panel.offset.swapped() : panel.offset;
}

} // namespace lcd::tft
