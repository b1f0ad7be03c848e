#include <algorithm>
#include <array>
#include <vector>

#include <gtest/gtest.h>
#include <gmock/gmock.h>

#include "fakes.hpp"
#include "lcd/tft/backend/st7735/constants.hpp"

namespace lcd::testing {
namespace {

using ::testing::ElementsAre;
using ::testing::ElementsAreArray;

namespace st7735 = tft::constants::backend::st7735;

auto expected_power_up(const uint8_t memory_access, const uint8_t inversion) -> std::vector<decoded_command> {
	return {
		{ 0x01, {} },
		{ 0x11, {} },
		{ 0xB1, { 0x01, 0x2C, 0x2D } },
		{ 0xB2, { 0x01, 0x2C, 0x2D } },
		{ 0xB3, { 0x01, 0x2C, 0x2D, 0x01, 0x2C, 0x2D } },
		{ 0xB4, { 0x07 } },
		{ 0xC0, { 0xA2, 0x02, 0x84 } },
		{ 0xC1, { 0xC5 } },
		{ 0xC2, { 0x0A, 0x00 } },
		{ 0xC3, { 0x8A, 0x2A } },
		{ 0xC4, { 0x8A, 0xEE } },
		{ 0xC5, { 0x0E } },
		{ inversion, {} },
		{ 0x36, { memory_access } },
		{ 0x3A, { 0x05 } },
		{ 0x29, {} },
	};
}

TEST(initialize, pulses_reset_before_anything_else) {
	harness state{};
	auto display{ make_display(state) };
	fake_delay delay{ state };

	ASSERT_EQ(display.initialize(delay), status::ok);

	ASSERT_GE(state.events.size(), 6u);
	const std::vector<event> head(state.events.begin(), state.events.begin() + 6);
	EXPECT_THAT(head, ElementsAre(
		event::level(line::reset, true),
		event::delay(5),
		event::level(line::reset, false),
		event::delay(20),
		event::level(line::reset, true),
		event::delay(150)
	));
}

TEST(initialize, sends_the_power_up_table) {
	harness state{};
	auto display{ make_display(state) };
	fake_delay delay{ state };

	ASSERT_EQ(display.initialize(delay), status::ok);
	EXPECT_TRUE(display.is_initialized());

	EXPECT_THAT(state.commands(), ElementsAreArray(expected_power_up(0x00, 0x20)));
	EXPECT_THAT(state.delays(), ElementsAre(5u, 20u, 150u, 200u, 200u, 200u));
}

TEST(initialize, applies_panel_flags_and_orientation) {
	harness state{};
	auto display{ make_display(state, st7735::PANEL_80X160, tft::orientation::landscape) };
	fake_delay delay{ state };

	ASSERT_EQ(display.initialize(delay), status::ok);
	EXPECT_THAT(state.commands(), ElementsAreArray(expected_power_up(0x68, 0x21)));
}

TEST(initialize, waits_before_the_next_command) {
	harness state{};
	auto display{ make_display(state) };
	fake_delay delay{ state };

	ASSERT_EQ(display.initialize(delay), status::ok);

	// Software reset, its 200 ms and only then sleep out
	const auto &events{ state.events };
	const auto swreset{ std::find(events.begin(), events.end(), event::byte(0x01)) };
	ASSERT_NE(swreset, events.end());

	const std::vector<event> window(swreset, swreset + 5);
	EXPECT_THAT(window, ElementsAre(
		event::byte(0x01),
		event::level(line::data_command, true),
		event::level(line::chip_select, true),
		event::delay(200),
		event::level(line::chip_select, false)
	));

	// Display on is the last thing, followed by its delay
	ASSERT_GE(events.size(), 2u);
	EXPECT_EQ(events[events.size() - 2], event::level(line::chip_select, true));
	EXPECT_EQ(events.back(), event::delay(200));
}

TEST(initialize, every_command_gets_its_own_chip_select) {
	harness state{};
	auto display{ make_display(state) };
	fake_delay delay{ state };

	ASSERT_EQ(display.initialize(delay), status::ok);

	const auto levels{ state.levels(line::chip_select) };
	ASSERT_EQ(levels.size(), 2u * tft::backend::st7735::initialization_sequence_length);
	for (size_t i{}; i < levels.size(); i += 2) {
		EXPECT_EQ(levels[i], 0u);
		EXPECT_EQ(levels[i + 1], 1u);
	}
}

TEST(initialize, is_repeatable) {
	harness first{};
	harness second{};
	auto display{ make_display(first) };
	fake_delay delay{ first };

	ASSERT_EQ(display.initialize(delay), status::ok);
	const auto first_run{ first.events };
	first.clear();

	ASSERT_EQ(display.initialize(delay), status::ok);
	EXPECT_EQ(first.events, first_run);

	auto other{ make_display(second) };
	fake_delay other_delay{ second };
	ASSERT_EQ(other.initialize(other_delay), status::ok);
	EXPECT_EQ(second.events, first_run);
}

TEST(initialize, bus_failure_aborts_and_keeps_display_uninitialized) {
	harness state{ .fail_at_byte = 5 };
	auto display{ make_display(state) };
	fake_delay delay{ state };

	EXPECT_EQ(display.initialize(delay), status::transport_error);
	EXPECT_FALSE(display.is_initialized());

	// 0x01, 0x11, 0xB1 0x01 0x2C and nothing past the failing byte
	EXPECT_THAT(state.bytes(), ElementsAre(0x01, 0x11, 0xB1, 0x01, 0x2C));
	EXPECT_EQ(state.offers.back(), 0x2D);
	EXPECT_EQ(state.levels(line::chip_select).back(), 1u);
}

TEST(initialize, reset_line_failure_sends_nothing) {
	harness state{ .failing_line = line::reset };
	auto display{ make_display(state) };
	fake_delay delay{ state };

	EXPECT_EQ(display.initialize(delay), status::transport_error);
	EXPECT_FALSE(display.is_initialized());
	EXPECT_TRUE(state.offers.empty());
}

TEST(initialize, failed_retry_drops_the_initialized_state) {
	harness state{};
	auto display{ make_display(state) };
	fake_delay delay{ state };

	ASSERT_EQ(display.initialize(delay), status::ok);

	state.fail_at_byte = state.accepted;
	EXPECT_EQ(display.initialize(delay), status::transport_error);
	EXPECT_FALSE(display.is_initialized());
	EXPECT_EQ(display.write_pixel(0, 0, core::colors::red), status::not_initialized);
}

TEST(initialize, drawing_before_it_is_rejected) {
	harness state{};
	auto display{ make_display(state) };

	const std::array<color, 1> colors{ core::colors::red };
	EXPECT_EQ(display.write_pixel(0, 0, core::colors::red), status::not_initialized);
	EXPECT_EQ(display.set_window(0, 0, 1, 1), status::not_initialized);
	EXPECT_EQ(display.write_block(0, 0, 0, 0, colors), status::not_initialized);
	EXPECT_EQ(display.write_pixels(colors), status::not_initialized);
	EXPECT_EQ(display.fill_rect({}, vec2u16::make(4), core::colors::red), status::not_initialized);
	EXPECT_EQ(display.sleep(), status::not_initialized);

	EXPECT_TRUE(state.events.empty());
}

TEST(initialize, orientation_before_it_is_only_stored) {
	harness state{};
	auto display{ make_display(state) };

	EXPECT_EQ(display.set_orientation(tft::orientation::portrait_swapped), status::ok);
	EXPECT_TRUE(state.events.empty());
	EXPECT_EQ(display.current_orientation(), tft::orientation::portrait_swapped);

	fake_delay delay{ state };
	ASSERT_EQ(display.initialize(delay), status::ok);
	EXPECT_THAT(state.commands(), ElementsAreArray(expected_power_up(0xC0, 0x20)));
}

} // namespace
} // namespace lcd::testing
