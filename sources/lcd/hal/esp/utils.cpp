#include <esp_timer.h>

#include "lcd/hal/esp/utils.hpp"

namespace lcd::hal::esp::utils {

void delay_microseconds(const uint32_t us) {
	// esp_timer counts microseconds since boot in 64 bits, it does not wrap
	const int64_t deadline{ esp_timer_get_time() + static_cast<int64_t>(us) };
	while (esp_timer_get_time() < deadline) {
		asm volatile ("nop");
	}
}

} // namespace lcd::hal::esp::utils
