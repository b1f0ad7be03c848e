#include <esp_log.h>

#include "lcd/hal/esp/gpio_pin.hpp"

namespace lcd::hal::esp {

inline constexpr auto TAG{ "[hal::esp::gpio_pin]" };

auto gpio_pin::set_level(const bool high) noexcept -> bool {
	if (m_pin == GPIO_NUM_NC) {
		return true;
	}
	if (const auto error{ gpio_set_level(m_pin, high ? 1u : 0u) }; error != ESP_OK) [[unlikely]] {
		ESP_LOGE(TAG, "Cannot drive GPIO %d: %s", static_cast<int>(m_pin), esp_err_to_name(error));
		return false;
	}
	return true;
}

auto gpio_pin::configure_outputs(const std::span<const gpio_num_t> pins) -> esp_err_t {
	uint64_t mask{};
	for (const auto pin : pins) {
		if (pin != GPIO_NUM_NC) {
			mask |= 1ull << pin;
		}
	}
	if (mask == 0u) {
		return ESP_OK;
	}

	const gpio_config_t io_conf{
		.pin_bit_mask = mask,
		.mode         = GPIO_MODE_OUTPUT,
		.pull_up_en   = GPIO_PULLUP_DISABLE,
		.pull_down_en = GPIO_PULLDOWN_DISABLE,
		.intr_type    = GPIO_INTR_DISABLE
	};
	if (const auto error{ gpio_config(&io_conf) }; error != ESP_OK) [[unlikely]] {
		ESP_LOGE(TAG, "Cannot configure GPIO: %s", esp_err_to_name(error));
		return error;
	}

	// Idle level: chip deselected, reset released, data mode
	for (const auto pin : pins) {
		if (pin == GPIO_NUM_NC) {
			continue;
		}
		if (const auto error{ gpio_set_level(pin, 1u) }; error != ESP_OK) [[unlikely]] {
			ESP_LOGE(TAG, "Cannot set idle level of GPIO %d: %s",
				static_cast<int>(pin), esp_err_to_name(error)
			);
			return error;
		}
	}
	ESP_LOGI(TAG, "GPIO Configured");

	return ESP_OK;
}

} // namespace lcd::hal::esp
