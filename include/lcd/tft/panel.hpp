#pragma once

#include <cstdint>

#include "lcd/core/math.hpp"

namespace lcd::tft {

enum class color_order : uint8_t {
	rgb,
	bgr
};

/// Physical panel glued to the controller. Everything is given for portrait.
struct panel_config {
	vec2u16     size{};   ///< visible resolution
	vec2u16     offset{}; ///< first visible column (x) and row (y) of the controller RAM
	color_order order{ color_order::rgb };
	bool        inverted{ false };
};

} // namespace lcd::tft
