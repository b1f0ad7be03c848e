#include <esp_log.h>

#include "lcd/hal/esp/spi_bus.hpp"

namespace lcd::hal::esp {

inline constexpr auto TAG{ "[hal::esp::spi_bus]" };

spi_bus::~spi_bus() {
	release();
}

spi_bus::spi_bus(spi_bus &&other) noexcept
	: m_device{ std::exchange(other.m_device, nullptr) }
	, m_transaction{ other.m_transaction }
	, m_in_flight{ std::exchange(other.m_in_flight, false) } {}

auto spi_bus::operator=(spi_bus &&other) noexcept -> spi_bus & {
	if (this != &other) {
		release();
		m_device      = std::exchange(other.m_device, nullptr);
		m_transaction = other.m_transaction;
		m_in_flight   = std::exchange(other.m_in_flight, false);
	}
	return *this;
}

void spi_bus::release() noexcept {
	if (m_device == nullptr) return;

	if (const auto error{ spi_bus_remove_device(std::exchange(m_device, nullptr)) }; error != ESP_OK) [[unlikely]] {
		ESP_LOGE(TAG, "Cannot remove SPI device: %s", esp_err_to_name(error));
	}
	m_in_flight = false;
}

auto spi_bus::write(const uint8_t byte) noexcept -> poll_result {
	if (!m_in_flight) {
		m_transaction = spi_transaction_t{
			.flags   = SPI_TRANS_USE_TXDATA,
			.length  = 8,
			.tx_data = { byte }
		};

		const auto error{ spi_device_queue_trans(m_device, &m_transaction, 0) };
		if (error == ESP_ERR_TIMEOUT) {
			return poll_result::pending; // queue is full, try again later
		}
		if (error != ESP_OK) [[unlikely]] {
			ESP_LOGE(TAG, "Cannot queue 0x%02X: %s", byte, esp_err_to_name(error));
			return poll_result::failed;
		}
		m_in_flight = true;
	}

	spi_transaction_t *finished{ nullptr };
	const auto error{ spi_device_get_trans_result(m_device, &finished, 0) };
	if (error == ESP_ERR_TIMEOUT) {
		return poll_result::pending;
	}

	m_in_flight = false;
	if (error != ESP_OK) [[unlikely]] {
		ESP_LOGE(TAG, "Transfer of 0x%02X failed: %s", byte, esp_err_to_name(error));
		return poll_result::failed;
	}
	return poll_result::done;
}

auto spi_bus::add_device(const device_config &config, spi_device_handle_t &device) -> esp_err_t {
	const spi_device_interface_config_t device_config{
		.mode           = config.mode,
		.clock_speed_hz = config.clock_speed_hz,
		.spics_io_num   = -1,
		.queue_size     = 1,
	};

	if (const auto error{ spi_bus_add_device(config.host, &device_config, &device) }; error != ESP_OK) [[unlikely]] {
		ESP_LOGE(TAG, "Cannot add SPI device: %s", esp_err_to_name(error));
		return error;
	}
	ESP_LOGI(TAG, "SPI device attached at %ld Hz", static_cast<long>(config.clock_speed_hz));

	return ESP_OK;
}

} // namespace lcd::hal::esp
