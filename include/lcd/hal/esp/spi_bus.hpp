#pragma once

#include <cstdint>
#include <utility>

#include <esp_err.h>
#include <driver/spi_master.h>

#include "lcd/hal/interfaces.hpp"
#include "lcd/hal/esp/wiring.hpp"

namespace lcd::hal::esp {

/**
 * @brief One byte at a time over an ESP-IDF SPI device, never waiting.
 *
 * A byte is queued with a zero timeout and its result is polled with a zero
 * timeout. A full queue or an unfinished transfer is reported as pending, the
 * next write() of the same byte keeps polling the transfer already in flight.
 *
 * @note The object must not be moved while a transfer is in flight, the
 * driver keeps a pointer to the transaction.
 */
class spi_bus {
public:
	struct device_config {
		spi_host_device_t host{ SPI2_HOST };
		int32_t           clock_speed_hz{ defaults::spi_clock_speed };
		uint8_t           mode{ 0u };
	};

	/// Takes ownership of @p device, it is removed from its host on destruction.
	explicit spi_bus(spi_device_handle_t device) noexcept : m_device{ device } {}
	~spi_bus();

	spi_bus(const spi_bus &) = delete;
	spi_bus(spi_bus &&other) noexcept;

	auto operator=(const spi_bus &) -> spi_bus & = delete;
	auto operator=(spi_bus &&other) noexcept -> spi_bus &;

	[[nodiscard]]
	auto write(uint8_t byte) noexcept -> poll_result;

	/// Attaches the panel to an initialized host. Chip-select stays under GPIO control.
	[[nodiscard]]
	static auto add_device(const device_config &config, spi_device_handle_t &device) -> esp_err_t;

private:
	void release() noexcept;

	spi_device_handle_t m_device{};
	spi_transaction_t   m_transaction{};
	bool                m_in_flight{ false };
};

} // namespace lcd::hal::esp
