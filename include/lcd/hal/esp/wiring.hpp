#pragma once

#include <cstdint>

#include <driver/spi_master.h>

#include "lcd/hal/esp/pins.hpp"
#include "lcd/hal/esp/utils.hpp"

namespace lcd::hal::esp {

namespace defaults {

using namespace utils::literals;

/// ST7735 gets unstable above ~27 MHz
inline constexpr int32_t spi_clock_speed{ 16_MHz };

} // namespace defaults

struct wiring {
	spi_host_device_t host{ SPI2_HOST };
	int32_t           clock_speed_hz{ defaults::spi_clock_speed };
	gpio_num_t        mosi{ pins::MOSI };
	gpio_num_t        sclk{ pins::SCLK };
	gpio_num_t        data_command{ pins::DC };
	gpio_num_t        reset{ pins::RESET };
	gpio_num_t        chip_select{ pins::CS }; // GPIO_NUM_NC when CS is tied low
	/// Leave false when another device already brought the host up
	bool              initialize_bus{ true };
};

} // namespace lcd::hal::esp
