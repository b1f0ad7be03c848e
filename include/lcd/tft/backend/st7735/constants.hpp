#pragma once

#include <cstdint>

#include "lcd/core/math.hpp"
#include "lcd/tft/panel.hpp"

namespace lcd::tft::constants::backend::st7735 {

inline constexpr core::vec2u16 DISPLAY_SIZE{ .w = 128u, .h = 160u };

// 1.8" 128x160 modules (red/black tab)
inline constexpr panel_config PANEL_128X160{
	.size = DISPLAY_SIZE,
};

// 1.44" 128x128 modules (green tab), the controller RAM is 132x162
inline constexpr panel_config PANEL_128X128{
	.size   = { .w = 128u, .h = 128u },
	.offset = { .x = 2u, .y = 3u },
};

// 0.96" 80x160 IPS modules
inline constexpr panel_config PANEL_80X160{
	.size     = { .w = 80u, .h = 160u },
	.offset   = { .x = 26u, .y = 1u },
	.order    = color_order::bgr,
	.inverted = true,
};

inline constexpr panel_config DEFAULT_PANEL{ PANEL_128X160 };

// Hardware reset pulse: release, pull low, release and let it settle
inline constexpr uint32_t RESET_PREPARE_MS{   5u };
inline constexpr uint32_t RESET_HOLD_MS   {  20u };
inline constexpr uint32_t RESET_SETTLE_MS { 150u };

// SLPOUT needs 120 ms before the next command
inline constexpr uint32_t WAKE_UP_MS      { 120u };

} // namespace lcd::tft::constants::backend::st7735
