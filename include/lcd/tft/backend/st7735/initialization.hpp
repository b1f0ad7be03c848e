#pragma once

#include <array>

#include "lcd/tft/backend/st7735/commands.hpp"

namespace lcd::tft::backend::st7735 {

inline constexpr size_t initialization_sequence_length{ 16u };

/// ST7735R/S power-up table. Only MADCTL and the inversion mode depend on the panel.
constexpr auto make_initialization_sequence(const uint8_t memory_access, const bool inverted)
	-> std::array<command, initialization_sequence_length> {
	return {
		command{ command_id::SOFT_RESET,      0u, {}, 200u },
		command{ command_id::EXIT_SLEEP_MODE, 0u, {}, 200u },

		command{ command_id::EXT_FRAME_RATE_CONTROL_NORMAL,  3u, { 0x01, 0x2C, 0x2D } },
		command{ command_id::EXT_FRAME_RATE_CONTROL_IDLE,    3u, { 0x01, 0x2C, 0x2D } },
		command{ command_id::EXT_FRAME_RATE_CONTROL_PARTIAL, 6u, { 0x01, 0x2C, 0x2D, 0x01, 0x2C, 0x2D } },
		command{ command_id::EXT_DISPLAY_INVERSION_CONTROL,  1u, { 0x07 } }, // no inversion

		command{ command_id::EXT_POWER_CONTROL_1, 3u, { 0xA2, 0x02, 0x84 } }, // -4.6V, auto mode
		command{ command_id::EXT_POWER_CONTROL_2, 1u, { 0xC5 } },
		command{ command_id::EXT_POWER_CONTROL_3, 2u, { 0x0A, 0x00 } },
		command{ command_id::EXT_POWER_CONTROL_4, 2u, { 0x8A, 0x2A } },
		command{ command_id::EXT_POWER_CONTROL_5, 2u, { 0x8A, 0xEE } },
		command{ command_id::EXT_VCOM_CONTROL_1,  1u, { 0x0E } },

		command{ inverted ? command_id::ENTER_INVERT_MODE : command_id::EXIT_INVERT_MODE },
		command{ command_id::SET_MEMORY_ACCESS, 1u, { memory_access } },
		command{ command_id::SET_PIXEL_FORMAT,  1u, { display_config::R5G6B5 } },

		command{ command_id::ENABLE_DISPLAY, 0u, {}, 200u },
	};
}

} // namespace lcd::tft::backend::st7735
