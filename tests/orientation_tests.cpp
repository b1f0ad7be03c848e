#include <array>

#include <gtest/gtest.h>

#include "lcd/tft/orientation.hpp"
#include "lcd/tft/initialization.hpp"
#include "lcd/tft/backend/st7735/constants.hpp"

namespace lcd::tft {
namespace {

namespace st7735 = constants::backend::st7735;

TEST(orientation, maps_to_memory_access_register) {
	EXPECT_EQ(memory_access_value(orientation::portrait,          color_order::rgb), 0x00);
	EXPECT_EQ(memory_access_value(orientation::landscape,         color_order::rgb), 0x60);
	EXPECT_EQ(memory_access_value(orientation::portrait_swapped,  color_order::rgb), 0xC0);
	EXPECT_EQ(memory_access_value(orientation::landscape_swapped, color_order::rgb), 0xA0);
}

TEST(orientation, bgr_panels_set_the_order_bit) {
	EXPECT_EQ(memory_access_value(orientation::portrait,          color_order::bgr), 0x08);
	EXPECT_EQ(memory_access_value(orientation::landscape,         color_order::bgr), 0x68);
	EXPECT_EQ(memory_access_value(orientation::portrait_swapped,  color_order::bgr), 0xC8);
	EXPECT_EQ(memory_access_value(orientation::landscape_swapped, color_order::bgr), 0xA8);
}

TEST(orientation, landscape_swaps_size_and_offset) {
	constexpr panel_config panel{
		.size   = { .w = 128u, .h = 160u },
		.offset = { .x = 2u, .y = 1u },
	};

	EXPECT_EQ(size_for(orientation::portrait, panel), vec2u16::make(128u, 160u));
	EXPECT_EQ(size_for(orientation::landscape, panel), vec2u16::make(160u, 128u));
	EXPECT_EQ(size_for(orientation::portrait_swapped, panel), vec2u16::make(128u, 160u));
	EXPECT_EQ(size_for(orientation::landscape_swapped, panel), vec2u16::make(160u, 128u));

	EXPECT_EQ(offset_for(orientation::portrait, panel), vec2u16::make(2u, 1u));
	EXPECT_EQ(offset_for(orientation::landscape, panel), vec2u16::make(1u, 2u));
	EXPECT_EQ(offset_for(orientation::landscape_swapped, panel), vec2u16::make(1u, 2u));
}

TEST(initialization_table, follows_the_panel) {
	const auto rgb{ make_initialization_sequence(st7735::PANEL_128X160) };
	ASSERT_EQ(rgb.size(), 16u);
	EXPECT_EQ(rgb[12].id, command_id::EXIT_INVERT_MODE);
	EXPECT_EQ(rgb[13].id, command_id::SET_MEMORY_ACCESS);
	EXPECT_EQ(rgb[13].params[0], 0x00);

	const auto ips{ make_initialization_sequence(st7735::PANEL_80X160, orientation::landscape) };
	EXPECT_EQ(ips[12].id, command_id::ENTER_INVERT_MODE);
	EXPECT_EQ(ips[13].params[0], 0x68);
}

TEST(initialization_table, has_the_power_up_order) {
	const auto sequence{ make_initialization_sequence(st7735::DEFAULT_PANEL) };

	const std::array expected{
		command_id::SOFT_RESET,
		command_id::EXIT_SLEEP_MODE,
		command_id::EXT_FRAME_RATE_CONTROL_NORMAL,
		command_id::EXT_FRAME_RATE_CONTROL_IDLE,
		command_id::EXT_FRAME_RATE_CONTROL_PARTIAL,
		command_id::EXT_DISPLAY_INVERSION_CONTROL,
		command_id::EXT_POWER_CONTROL_1,
		command_id::EXT_POWER_CONTROL_2,
		command_id::EXT_POWER_CONTROL_3,
		command_id::EXT_POWER_CONTROL_4,
		command_id::EXT_POWER_CONTROL_5,
		command_id::EXT_VCOM_CONTROL_1,
		command_id::EXIT_INVERT_MODE,
		command_id::SET_MEMORY_ACCESS,
		command_id::SET_PIXEL_FORMAT,
		command_id::ENABLE_DISPLAY,
	};
	for (size_t i{}; i < expected.size(); ++i) {
		EXPECT_EQ(sequence[i].id, expected[i]) << "at " << i;
	}

	EXPECT_EQ(sequence[0].delay_ms, 200u);
	EXPECT_EQ(sequence[1].delay_ms, 200u);
	EXPECT_EQ(sequence[15].delay_ms, 200u);
	EXPECT_EQ(sequence[14].params_count, 1u);
	EXPECT_EQ(sequence[14].params[0], 0x05);
}

} // namespace
} // namespace lcd::tft
