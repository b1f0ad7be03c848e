#pragma once

#include <cstdint>
#include <concepts>

namespace lcd::hal {

/// Answer of a non-blocking bus operation
enum class poll_result : uint8_t {
	done,    ///< the byte left the wire, next one may be offered
	pending, ///< not ready yet, offer the very same byte again
	failed,  ///< the transfer cannot complete
};

/**
 * @brief Byte-oriented serial transmitter.
 *
 * `write(byte)` never blocks. While it answers `pending` the caller keeps
 * offering the same byte; an implementation that has already started moving
 * the byte must treat the repeated offers as a completion poll.
 */
template<class T>
concept bus_transport = requires(T &bus, const uint8_t byte) {
	{ bus.write(byte) } -> std::same_as<poll_result>;
};

/// Digital output line. `set_level` answers false when the line could not be driven.
template<class T>
concept output_pin = requires(T &pin, const bool high) {
	{ pin.set_level(high) } -> std::same_as<bool>;
};

template<class T>
concept delay_provider = requires(T &delay, const uint32_t ms) {
	delay.delay_ms(ms);
};

/// Line that is not wired, e.g. chip-select tied to ground
struct null_pin {
	[[nodiscard]]
	constexpr auto set_level(bool) noexcept -> bool { return true; }
};

} // namespace lcd::hal
