#pragma once

#include <cstdint>

namespace lcd::hal::esp {

/// vTaskDelay based delay, busy waits below one tick
struct freertos_delay {
	void delay_ms(uint32_t ms) const noexcept;
};

} // namespace lcd::hal::esp
