#pragma once

#include <span>
#include <array>
#include <cstdint>

namespace lcd::tft::backend::st7735 {

enum class command_id : uint8_t {
	NOP                              = 0x00,
	SOFT_RESET                       = 0x01,
	GET_DISPLAY_ID                   = 0x04,
	GET_DISPLAY_STATUS               = 0x09,
	GET_POWER_MODE                   = 0x0A,
	GET_ADDRESS_MODE                 = 0x0B,
	GET_PIXEL_FORMAT                 = 0x0C,
	GET_IMAGE_MODE                   = 0x0D,
	GET_SIGNAL_MODE                  = 0x0E,
	ENTER_SLEEP_MODE                 = 0x10,
	EXIT_SLEEP_MODE                  = 0x11,
	ENTER_PARTIAL_MODE               = 0x12,
	ENTER_NORMAL_MODE                = 0x13,
	EXIT_INVERT_MODE                 = 0x20,
	ENTER_INVERT_MODE                = 0x21,
	SET_GAMMA_CURVE                  = 0x26,
	DISABLE_DISPLAY                  = 0x28,
	ENABLE_DISPLAY                   = 0x29,
	SET_COLUMN_ADDRESS               = 0x2A,
	SET_ROW_ADDRESS                  = 0x2B,
	WRITE_MEMORY_START               = 0x2C,
	READ_MEMORY_START                = 0x2E,
	SET_PARTIAL_AREA                 = 0x30,
	SET_TEAR_OFF                     = 0x34,
	SET_TEAR_ON                      = 0x35,
	SET_MEMORY_ACCESS                = 0x36,
	EXIT_IDLE_MODE                   = 0x38,
	ENTER_IDLE_MODE                  = 0x39,
	SET_PIXEL_FORMAT                 = 0x3A,

// Panel function commands
	EXT_FRAME_RATE_CONTROL_NORMAL    = 0xB1,
	EXT_FRAME_RATE_CONTROL_IDLE      = 0xB2,
	EXT_FRAME_RATE_CONTROL_PARTIAL   = 0xB3,
	EXT_DISPLAY_INVERSION_CONTROL    = 0xB4,
	EXT_DISPLAY_FUNCTION_SET_5       = 0xB6,
	EXT_POWER_CONTROL_1              = 0xC0,
	EXT_POWER_CONTROL_2              = 0xC1,
	EXT_POWER_CONTROL_3              = 0xC2,
	EXT_POWER_CONTROL_4              = 0xC3,
	EXT_POWER_CONTROL_5              = 0xC4,
	EXT_VCOM_CONTROL_1               = 0xC5,
	EXT_VCOM_OFFSET_CONTROL          = 0xC7,
	EXT_WRITE_ID2                    = 0xD1,
	EXT_WRITE_ID3                    = 0xD2,
	EXT_NV_MEMORY_CONTROL_1          = 0xD9,
	EXT_READ_ID1                     = 0xDA,
	EXT_READ_ID2                     = 0xDB,
	EXT_READ_ID3                     = 0xDC,
	EXT_NV_MEMORY_CONTROL_2          = 0xDE,
	EXT_NV_MEMORY_CONTROL_3          = 0xDF,
	EXT_POSITIVE_GAMMA_CONTROL       = 0xE0,
	EXT_NEGATIVE_GAMMA_CONTROL       = 0xE1,
	EXT_POWER_CONTROL_6              = 0xFC,

	INVALID                          = 0xFF
};

struct display_config {
	enum memory_access : uint8_t {
		row_address_order        = 0x80, // MY
		column_address_order     = 0x40, // MX
		swap_row_column          = 0x20, // MV
		vertical_refresh_order   = 0x10, // ML
		bgr_color_order          = 0x08, // RGB bit set == BGR panel
		horizontal_refresh_order = 0x04, // MH
	};

	enum rotation : uint8_t {
		portrait          = 0x00,
		landscape         = column_address_order | swap_row_column,
		portrait_swapped  = row_address_order | column_address_order,
		landscape_swapped = row_address_order | swap_row_column,
	};

	enum pixel_format : uint8_t {
		R4G4B4 = 0x03,
		R5G6B5 = 0x05,
		R6G6B6 = 0x06,
	};
};

/// Opcode, its parameters and how long the controller needs before the next one
struct command {
	command_id id{ command_id::INVALID };
	uint8_t params_count{};
	std::array<uint8_t, 16> params{};
	uint16_t delay_ms{};
};

[[gnu::always_inline]]
inline auto as_span(const command &cmd) noexcept -> std::span<const uint8_t> {
	return std::span<const uint8_t>{
		std::data(cmd.params), static_cast<size_t>(cmd.params_count)
	};
}

} // namespace lcd::tft::backend::st7735
