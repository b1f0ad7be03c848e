#pragma once

#include <cstdint>
#include <soc/gpio_num.h>

namespace lcd::hal::esp::pins {

// Controlling pins
inline constexpr auto RESET{ GPIO_NUM_9  };
inline constexpr auto CS   { GPIO_NUM_10 }; // Chip select control pin
inline constexpr auto DC   { GPIO_NUM_11 }; // Data/Command. When HIGH == data mode, LOW == command

// SPI pins
inline constexpr auto MOSI { GPIO_NUM_12 };
inline constexpr auto SCLK { GPIO_NUM_13 };

} // namespace lcd::hal::esp::pins
