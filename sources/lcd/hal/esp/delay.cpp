#include <freertos/FreeRTOS.h>
#include <freertos/task.h>

#include "lcd/hal/esp/delay.hpp"
#include "lcd/hal/esp/utils.hpp"

namespace lcd::hal::esp {

void freertos_delay::delay_ms(const uint32_t ms) const noexcept {
	if (ms < portTICK_PERIOD_MS) {
		utils::delay_microseconds(ms * 1000u);
		return;
	}

	// vTaskDelay may wake up at the very start of its last tick, one extra tick covers it
	const TickType_t ticks{ static_cast<TickType_t>((ms + portTICK_PERIOD_MS - 1u) / portTICK_PERIOD_MS + 1u) };
	vTaskDelay(ticks);
}

} // namespace lcd::hal::esp
