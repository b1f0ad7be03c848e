#pragma once

#include <span>

#include <esp_err.h>
#include <driver/gpio.h>

namespace lcd::hal::esp {

/// Push-pull output driven through gpio_set_level. GPIO_NUM_NC is a line that is not wired.
class gpio_pin {
public:
	explicit gpio_pin(gpio_num_t pin) noexcept : m_pin{ pin } {}

	[[nodiscard]]
	auto set_level(bool high) noexcept -> bool;

	/// Puts every wired pin of `pins` into output mode, driven high
	[[nodiscard]]
	static auto configure_outputs(std::span<const gpio_num_t> pins) -> esp_err_t;

private:
	gpio_num_t m_pin{ GPIO_NUM_NC };
};

} // namespace lcd::hal::esp
