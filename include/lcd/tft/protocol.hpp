#pragma once

#include <span>
#include <cstddef>
#include <cstdint>
#include <ranges>
#include <concepts>

#include "lcd/core/color.hpp"
#include "lcd/core/status.hpp"
#include "lcd/hal/interfaces.hpp"
#include "lcd/tft/commands.hpp"

namespace lcd::tft {

template<class T>
concept color_range = std::ranges::input_range<T>
	&& std::convertible_to<std::ranges::range_reference_t<T>, color>;

/**
 * @brief Command/data engine of the 4-wire serial interface.
 *
 * The data/command line is low while an opcode is on the wire and high for
 * everything else. Each byte is offered to the bus until it is accepted, so a
 * command is either fully sent or reported as a transport error.
 */
template<
	hal::bus_transport Bus,
	hal::output_pin DataCommandPin,
	hal::output_pin ChipSelectPin = hal::null_pin
>
class protocol {
public:
	explicit protocol(Bus bus, DataCommandPin data_command, ChipSelectPin chip_select = {}) noexcept;

	protocol(const protocol &) = delete;
	protocol(protocol &&) noexcept = default;

	auto operator=(const protocol &) -> protocol & = delete;
	auto operator=(protocol &&) noexcept -> protocol & = default;

	/// Opcode in command mode, then the parameters in data mode
	[[nodiscard]]
	auto send_command(command_id id, std::span<const uint8_t> params = {}) noexcept -> status;

	[[nodiscard]]
	auto send_command(const command &cmd) noexcept -> status;

	/// Raw data burst, data mode is asserted once
	[[nodiscard]]
	auto send_data(std::span<const uint8_t> data) noexcept -> status;

	/// Colour burst, high byte first
	template<color_range Colors>
	[[nodiscard]]
	auto send_colors(Colors &&colors) noexcept -> status;

	[[nodiscard]]
	auto send_color_repeat(color clr, size_t count) noexcept -> status;

	/// Keeps the chip selected while `fn` runs, deselects it even if `fn` failed
	template<std::invocable Fn>
	[[nodiscard]]
	auto transaction(Fn &&fn) noexcept -> status;

private:
	Bus            m_bus;
	DataCommandPin m_data_command;
	ChipSelectPin  m_chip_select;

	[[nodiscard]] auto enter_command_mode() noexcept -> status;
	[[nodiscard]] auto enter_data_mode() noexcept -> status;

	[[nodiscard]] auto transmit(uint8_t byte) noexcept -> status;
	[[nodiscard]] auto transmit_color(color clr) noexcept -> status;
};

} // namespace lcd::tft

#include "./protocol.inl"
