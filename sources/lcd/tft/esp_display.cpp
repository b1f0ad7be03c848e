#include <array>
#include <utility>

#include <esp_log.h>

#include "lcd/tft/esp_display.hpp"

namespace lcd::tft {

inline constexpr auto TAG{ "[tft::esp_display]" };

static auto initialize_bus(const hal::esp::wiring &wiring) -> esp_err_t {
	const spi_bus_config_t bus_config{
		.mosi_io_num     = wiring.mosi,
		.miso_io_num     = -1,
		.sclk_io_num     = wiring.sclk,
		.quadwp_io_num   = -1,
		.quadhd_io_num   = -1,
		.max_transfer_sz = 4,
	};

	const auto error{ spi_bus_initialize(wiring.host, &bus_config, SPI_DMA_DISABLED) };
	if (error == ESP_ERR_INVALID_STATE) {
		ESP_LOGW(TAG, "SPI host is already initialized, reusing it");
		return ESP_OK;
	}
	if (error != ESP_OK) [[unlikely]] {
		ESP_LOGE(TAG, "Cannot initialize SPI host: %s", esp_err_to_name(error));
		return error;
	}
	ESP_LOGI(TAG, "SPI Bus initialized");

	return ESP_OK;
}

auto make_esp_display(
	const hal::esp::wiring &wiring,
	const panel_config &panel,
	const orientation value
) -> std::optional<esp_display> {
	const std::array control_pins{ wiring.data_command, wiring.reset, wiring.chip_select };
	if (hal::esp::gpio_pin::configure_outputs(control_pins) != ESP_OK) {
		return std::nullopt;
	}

	if (wiring.initialize_bus && initialize_bus(wiring) != ESP_OK) {
		return std::nullopt;
	}

	spi_device_handle_t device{};
	const hal::esp::spi_bus::device_config device_config{
		.host           = wiring.host,
		.clock_speed_hz = wiring.clock_speed_hz,
	};
	if (hal::esp::spi_bus::add_device(device_config, device) != ESP_OK) {
		return std::nullopt;
	}

	std::optional<esp_display> result{ std::in_place,
		hal::esp::spi_bus{ device },
		hal::esp::gpio_pin{ wiring.data_command },
		hal::esp::gpio_pin{ wiring.reset },
		hal::esp::gpio_pin{ wiring.chip_select },
		panel, value
	};

	hal::esp::freertos_delay delay{};
	if (const auto result_status{ result->initialize(delay) }; !core::succeeded(result_status)) {
		ESP_LOGE(TAG, "Display initialization failed: %s", core::to_string(result_status).data());
		return std::nullopt;
	}

	const auto size{ result->size() };
	ESP_LOGI(TAG, "Display initialized: %ux%u", static_cast<unsigned>(size.w), static_cast<unsigned>(size.h));

	return result;
}

} // namespace lcd::tft
