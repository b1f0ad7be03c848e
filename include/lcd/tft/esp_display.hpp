#pragma once

#include <optional>

#include "lcd/tft/panel.hpp"
#include "lcd/tft/display.hpp"
#include "lcd/tft/constants.hpp"
#include "lcd/tft/orientation.hpp"
#include "lcd/hal/esp/delay.hpp"
#include "lcd/hal/esp/wiring.hpp"
#include "lcd/hal/esp/spi_bus.hpp"
#include "lcd/hal/esp/gpio_pin.hpp"

namespace lcd::tft {

using esp_display = display<hal::esp::spi_bus, hal::esp::gpio_pin, hal::esp::gpio_pin, hal::esp::gpio_pin>;

/**
 * @brief Brings up the pins, the SPI host and the panel in one go.
 *
 * @return Initialized display or std::nullopt if any step failed. Failures are
 * logged.
 */
[[nodiscard]]
auto make_esp_display(
	const hal::esp::wiring &wiring = {},
	const panel_config &panel = constants::DEFAULT_PANEL,
	orientation value = orientation::portrait
) -> std::optional<esp_display>;

} // namespace lcd::tft
