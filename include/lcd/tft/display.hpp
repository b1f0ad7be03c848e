#pragma once

#include <span>
#include <array>
#include <cstddef>
#include <cstdint>

#include "lcd/core/math.hpp"
#include "lcd/core/color.hpp"
#include "lcd/core/status.hpp"
#include "lcd/hal/interfaces.hpp"
#include "lcd/tft/panel.hpp"
#include "lcd/tft/commands.hpp"
#include "lcd/tft/constants.hpp"
#include "lcd/tft/protocol.hpp"
#include "lcd/tft/orientation.hpp"
#include "lcd/tft/initialization.hpp"

namespace lcd::tft {

/**
 * @brief ST7735 display handle.
 *
 * Owns the bus and the control lines. Nothing but hard_reset() and
 * initialize() reaches the controller before initialize() succeeded; drawing
 * calls answer status::not_initialized until then.
 *
 * Not thread-safe. Every call runs to completion (including the bus polling)
 * before it returns.
 */
template<
	hal::bus_transport Bus,
	hal::output_pin DataCommandPin,
	hal::output_pin ResetPin,
	hal::output_pin ChipSelectPin = hal::null_pin
>
class display {
public:
	using protocol_type = protocol<Bus, DataCommandPin, ChipSelectPin>;

	explicit display(
		Bus bus,
		DataCommandPin data_command,
		ResetPin reset,
		const panel_config &panel = constants::DEFAULT_PANEL,
		orientation value = orientation::portrait
	) noexcept;

	explicit display(
		Bus bus,
		DataCommandPin data_command,
		ResetPin reset,
		ChipSelectPin chip_select,
		const panel_config &panel = constants::DEFAULT_PANEL,
		orientation value = orientation::portrait
	) noexcept;

	display(const display &) = delete;
	display(display &&) noexcept = default;

	auto operator=(const display &) -> display & = delete;
	auto operator=(display &&) noexcept -> display & = default;

	/// Reset pulse followed by the power-up table. Safe to call again.
	template<hal::delay_provider Delay>
	[[nodiscard]]
	auto initialize(Delay &delay) noexcept -> status;

	template<hal::delay_provider Delay>
	[[nodiscard]]
	auto hard_reset(Delay &delay) noexcept -> status;

	/// Before initialize() the value is only stored, the power-up table applies it
	[[nodiscard]]
	auto set_orientation(orientation value) noexcept -> status;

	/// Extra image offset on top of the panel one, for modules glued off-center
	void set_offset(vec2u16 value) noexcept { m_user_offset = value; }

	[[nodiscard]]
	auto set_inverted(bool inverted) noexcept -> status;

	[[nodiscard]]
	auto sleep() noexcept -> status;

	template<hal::delay_provider Delay>
	[[nodiscard]]
	auto wake(Delay &delay) noexcept -> status;

	/// CASET + RASET + RAMWR for an inclusive rectangle of the current orientation
	[[nodiscard]]
	auto set_window(uint16_t x0, uint16_t y0, uint16_t x1, uint16_t y1) noexcept -> status;

	[[nodiscard]]
	auto set_window(const rect &window) noexcept -> status;

	[[nodiscard]]
	auto write_pixel(uint16_t x, uint16_t y, color clr) noexcept -> status;

	/**
	 * @brief Opens the window and streams `colors` in row-major order.
	 * @note The colors count is not checked against the window area. A short
	 * range leaves the controller mid-burst, a long one wraps inside the
	 * window.
	 */
	template<color_range Colors>
	[[nodiscard]]
	auto write_block(uint16_t x0, uint16_t y0, uint16_t x1, uint16_t y1, Colors &&colors) noexcept -> status;

	template<color_range Colors>
	[[nodiscard]]
	auto write_block(const rect &window, Colors &&colors) noexcept -> status;

	/// Streams into the window opened by the last set_window()
	template<color_range Colors>
	[[nodiscard]]
	auto write_pixels(Colors &&colors) noexcept -> status;

	[[nodiscard]]
	auto fill_rect(vec2u16 pos, vec2u16 size, color clr) noexcept -> status;

	[[nodiscard]]
	auto clear_screen(color clr = core::colors::black) noexcept -> status;

	[[nodiscard]]
	auto size() const noexcept -> vec2u16 { return size_for(m_orientation, m_panel); }

	[[nodiscard]]
	auto pixels_count() const noexcept -> size_t {
		const auto current{ size() };
		return static_cast<size_t>(current.w) * static_cast<size_t>(current.h);
	}

	/// Column/row of the controller RAM that (0, 0) maps to
	[[nodiscard]]
	auto offset() const noexcept -> vec2u16 { return offset_for(m_orientation, m_panel) + m_user_offset; }

	[[nodiscard]] auto current_orientation() const noexcept -> orientation { return m_orientation; }
	[[nodiscard]] auto panel() const noexcept -> const panel_config & { return m_panel; }
	[[nodiscard]] auto is_initialized() const noexcept -> bool { return m_initialized; }

private:
	protocol_type m_protocol;
	ResetPin      m_reset;
	panel_config  m_panel;
	orientation   m_orientation{ orientation::portrait };
	vec2u16       m_user_offset{};
	bool          m_initialized{ false };

	[[nodiscard]] auto validate(const rect &window) const noexcept -> status;

	/// Window commands without checks or chip-select handling
	[[nodiscard]] auto send_window(const rect &window) noexcept -> status;

	[[nodiscard]] auto send_single(command_id id, std::span<const uint8_t> params = {}) noexcept -> status;
};

} // namespace lcd::tft

#include "./display.inl"
