#pragma once

#include <cstdint>
#include <esp_attr.h>

namespace lcd::hal::esp::utils {

/// Busy wait on esp_timer, for pauses shorter than a FreeRTOS tick
void IRAM_ATTR delay_microseconds(uint32_t us);


namespace literals {

consteval int32_t operator""_KHz(const unsigned long long herz) noexcept {
	return static_cast<int32_t>(herz * 1000);
}

consteval int32_t operator""_MHz(const unsigned long long herz) noexcept {
	return static_cast<int32_t>(herz * 1000000);
}

} // namespace literals

} // namespace lcd::hal::esp::utils
