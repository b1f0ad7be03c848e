#include <utility>

namespace lcd::tft {

template<hal::bus_transport Bus, hal::output_pin DataCommandPin, hal::output_pin ChipSelectPin>
protocol<Bus, DataCommandPin, ChipSelectPin>::protocol(
	Bus bus,
	DataCommandPin data_command,
	ChipSelectPin chip_select
) noexcept
	: m_bus{ std::move(bus) }
	, m_data_command{ std::move(data_command) }
	, m_chip_select{ std::move(chip_select) } {}


template<hal::bus_transport Bus, hal::output_pin DataCommandPin, hal::output_pin ChipSelectPin>
auto protocol<Bus, DataCommandPin, ChipSelectPin>::send_command(
	const command_id id,
	const std::span<const uint8_t> params
) noexcept -> status {
	if (const auto result{ enter_command_mode() }; result != status::ok) [[unlikely]] {
		return result;
	}
	if (const auto result{ transmit(std::to_underlying(id)) }; result != status::ok) [[unlikely]] {
		return result;
	}

	// Leave command mode right after the opcode, even without parameters
	if (const auto result{ enter_data_mode() }; result != status::ok) [[unlikely]] {
		return result;
	}
	for (const auto param : params) {
		if (const auto result{ transmit(param) }; result != status::ok) [[unlikely]] {
			return result;
		}
	}
	return status::ok;
}

template<hal::bus_transport Bus, hal::output_pin DataCommandPin, hal::output_pin ChipSelectPin>
[[gnu::always_inline]]
inline auto protocol<Bus, DataCommandPin, ChipSelectPin>::send_command(const command &cmd) noexcept -> status {
	return send_command(cmd.id, as_span(cmd));
}

template<hal::bus_transport Bus, hal::output_pin DataCommandPin, hal::output_pin ChipSelectPin>
auto protocol<Bus, DataCommandPin, ChipSelectPin>::send_data(const std::span<const uint8_t> data) noexcept -> status {
	if (const auto result{ enter_data_mode() }; result != status::ok) [[unlikely]] {
		return result;
	}
	for (const auto byte : data) {
		if (const auto result{ transmit(byte) }; result != status::ok) [[unlikely]] {
			return result;
		}
	}
	return status::ok;
}

template<hal::bus_transport Bus, hal::output_pin DataCommandPin, hal::output_pin ChipSelectPin>
template<color_range Colors>
auto protocol<Bus, DataCommandPin, ChipSelectPin>::send_colors(Colors &&colors) noexcept -> status {
	if (const auto result{ enter_data_mode() }; result != status::ok) [[unlikely]] {
		return result;
	}
	for (const color clr : colors) {
		if (const auto result{ transmit_color(clr) }; result != status::ok) [[unlikely]] {
			return result;
		}
	}
	return status::ok;
}

template<hal::bus_transport Bus, hal::output_pin DataCommandPin, hal::output_pin ChipSelectPin>
auto protocol<Bus, DataCommandPin, ChipSelectPin>::send_color_repeat(
	const color clr,
	const size_t count
) noexcept -> status {
	if (const auto result{ enter_data_mode() }; result != status::ok) [[unlikely]] {
		return result;
	}
	for (size_t i{}; i < count; ++i) {
		if (const auto result{ transmit_color(clr) }; result != status::ok) [[unlikely]] {
			return result;
		}
	}
	return status::ok;
}

template<hal::bus_transport Bus, hal::output_pin DataCommandPin, hal::output_pin ChipSelectPin>
template<std::invocable Fn>
auto protocol<Bus, DataCommandPin, ChipSelectPin>::transaction(Fn &&fn) noexcept -> status {
	if (!m_chip_select.set_level(false)) [[unlikely]] {
		return status::transport_error;
	}

	const status result{ std::forward<Fn>(fn)() };

	const bool released{ m_chip_select.set_level(true) };
	if (result != status::ok) {
		return result;
	}
	return released ? status::ok : status::transport_error;
}


template<hal::bus_transport Bus, hal::output_pin DataCommandPin, hal::output_pin ChipSelectPin>
[[gnu::always_inline]]
inline auto protocol<Bus, DataCommandPin, ChipSelectPin>::enter_command_mode() noexcept -> status {
	return m_data_command.set_level(false) ? status::ok : status::transport_error;
}

template<hal::bus_transport Bus, hal::output_pin DataCommandPin, hal::output_pin ChipSelectPin>
[[gnu::always_inline]]
inline auto protocol<Bus, DataCommandPin, ChipSelectPin>::enter_data_mode() noexcept -> status {
	return m_data_command.set_level(true) ? status::ok : status::transport_error;
}

template<hal::bus_transport Bus, hal::output_pin DataCommandPin, hal::output_pin ChipSelectPin>
[[gnu::always_inline]]
inline auto protocol<Bus, DataCommandPin, ChipSelectPin>::transmit(const uint8_t byte) noexcept -> status {
	// No timeout here: a bus that never gets ready stalls the caller
	hal::poll_result result{};
	do {
		result = m_bus.write(byte);
	} while (result == hal::poll_result::pending);

	return result == hal::poll_result::done ? status::ok : status::transport_error;
}

template<hal::bus_transport Bus, hal::output_pin DataCommandPin, hal::output_pin ChipSelectPin>
[[gnu::always_inline]]
inline auto protocol<Bus, DataCommandPin, ChipSelectPin>::transmit_color(const color clr) noexcept -> status {
	const auto bytes{ core::to_bytes(clr) };
	if (const auto result{ transmit(bytes[0]) }; result != status::ok) [[unlikely]] {
		return result;
	}
	return transmit(bytes[1]);
}

} // namespace lcd::tft
