#include <array>
#include <ranges>
#include <utility>

#include <freertos/FreeRTOS.h>
#include <freertos/task.h>

#include <esp_log.h>

#include "lcd/core/color.hpp"
#include "lcd/graphics/canvas.hpp"
#include "lcd/tft/esp_display.hpp"
#include "lcd/tft/backend/st7735/constants.hpp"

static constexpr auto TAG{ "st7735-demo" };

static auto draw_palette(lcd::tft::esp_display &display) -> lcd::status {
	using namespace lcd;

	constexpr std::array palette{
		core::colors::red, core::colors::green, core::colors::blue, core::colors::yellow,
		core::colors::cyan, core::colors::magenta, core::colors::orange, core::colors::white,
	};

	const auto size{ display.size() };
	const auto stripe_height{ static_cast<uint16_t>(size.h / palette.size()) };

	for (size_t i{}; i < palette.size(); ++i) {
		const vec2u16 pos{ .x = 0, .y = static_cast<uint16_t>(i * stripe_height) };
		const vec2u16 stripe{ .w = size.w, .h = stripe_height };
		if (const auto result{ display.fill_rect(pos, stripe, palette[i]) }; result != status::ok) {
			return result;
		}
	}
	return status::ok;
}

static auto draw_gradient(lcd::tft::esp_display &display) -> lcd::status {
	using namespace lcd;

	constexpr uint16_t side{ 32 };
	const auto size{ display.size() };
	const auto box{ rect::from_size(
		vec2u16{ .x = static_cast<uint16_t>((size.w - side) / 2), .y = static_cast<uint16_t>((size.h - side) / 2) },
		vec2u16::make(side)
	) };

	auto gradient{ std::views::iota(uint32_t{}, uint32_t{ side * side })
		| std::views::transform([](const uint32_t index) {
			const auto x{ static_cast<uint8_t>((index % side) * 8) };
			const auto y{ static_cast<uint8_t>((index / side) * 8) };
			return core::make_color(x, y, static_cast<uint8_t>(255u - x));
		})
	};

	graphics::canvas canvas{ display };
	return canvas.draw_sized(box, gradient);
}

extern "C" void app_main(void) {
	using namespace lcd;

	auto display{ tft::make_esp_display({}, tft::constants::backend::st7735::PANEL_128X160) };
	if (!display) {
		ESP_LOGE(TAG, "Failed to bring up the display");
		return;
	}

	constexpr std::array orientations{
		tft::orientation::portrait,
		tft::orientation::landscape,
		tft::orientation::portrait_swapped,
		tft::orientation::landscape_swapped,
	};

	for (size_t frame{};; ++frame) {
		const auto value{ orientations[frame % orientations.size()] };

		auto result{ display->set_orientation(value) };
		if (result == status::ok) result = display->clear_screen();
		if (result == status::ok) result = draw_palette(*display);
		if (result == status::ok) result = draw_gradient(*display);

		if (result != status::ok) {
			ESP_LOGE(TAG, "Frame %zu failed: %s", frame, core::to_string(result).data());
			return;
		}
		ESP_LOGI(TAG, "Orientation %u drawn", static_cast<unsigned>(std::to_underlying(value)));

		vTaskDelay(pdMS_TO_TICKS(2000));
	}
}
