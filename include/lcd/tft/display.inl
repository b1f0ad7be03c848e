#include <limits>
#include <utility>

namespace lcd::tft {

namespace detail {

/// Start and end address as the controller wants them: big-endian words
[[gnu::always_inline]]
inline auto encode_address_range(const uint16_t first, const uint16_t last) noexcept -> std::array<uint8_t, 4> {
	return {
		static_cast<uint8_t>(first >> 8), static_cast<uint8_t>(first),
		static_cast<uint8_t>(last  >> 8), static_cast<uint8_t>(last)
	};
}

} // namespace detail

#define LCD_TFT_DISPLAY_TEMPLATE \
	template<hal::bus_transport Bus, hal::output_pin DataCommandPin, hal::output_pin ResetPin, hal::output_pin ChipSelectPin>
#define LCD_TFT_DISPLAY display<Bus, DataCommandPin, ResetPin, ChipSelectPin>

LCD_TFT_DISPLAY_TEMPLATE
LCD_TFT_DISPLAY::display(
	Bus bus,
	DataCommandPin data_command,
	ResetPin reset,
	const panel_config &panel,
	const orientation value
) noexcept
	: m_protocol{ std::move(bus), std::move(data_command) }
	, m_reset{ std::move(reset) }
	, m_panel{ panel }
	, m_orientation{ value } {}

LCD_TFT_DISPLAY_TEMPLATE
LCD_TFT_DISPLAY::display(
	Bus bus,
	DataCommandPin data_command,
	ResetPin reset,
	ChipSelectPin chip_select,
	const panel_config &panel,
	const orientation value
) noexcept
	: m_protocol{ std::move(bus), std::move(data_command), std::move(chip_select) }
	, m_reset{ std::move(reset) }
	, m_panel{ panel }
	, m_orientation{ value } {}


LCD_TFT_DISPLAY_TEMPLATE
template<hal::delay_provider Delay>
auto LCD_TFT_DISPLAY::initialize(Delay &delay) noexcept -> status {
	m_initialized = false;

	if (const auto result{ hard_reset(delay) }; result != status::ok) [[unlikely]] {
		return result;
	}

	for (const auto &cmd : make_initialization_sequence(m_panel, m_orientation)) {
		const auto result{ m_protocol.transaction([this, &cmd] {
			return m_protocol.send_command(cmd);
		}) };
		if (result != status::ok) [[unlikely]] {
			return result;
		}
		if (cmd.delay_ms != 0u) {
			delay.delay_ms(cmd.delay_ms);
		}
	}

	m_initialized = true;
	return status::ok;
}

LCD_TFT_DISPLAY_TEMPLATE
template<hal::delay_provider Delay>
auto LCD_TFT_DISPLAY::hard_reset(Delay &delay) noexcept -> status {
	if (!m_reset.set_level(true)) [[unlikely]] {
		return status::transport_error;
	}
	delay.delay_ms(constants::RESET_PREPARE_MS);

	if (!m_reset.set_level(false)) [[unlikely]] {
		return status::transport_error;
	}
	delay.delay_ms(constants::RESET_HOLD_MS);

	if (!m_reset.set_level(true)) [[unlikely]] {
		return status::transport_error;
	}
	delay.delay_ms(constants::RESET_SETTLE_MS); // wait reset completion

	return status::ok;
}

LCD_TFT_DISPLAY_TEMPLATE
auto LCD_TFT_DISPLAY::set_orientation(const orientation value) noexcept -> status {
	if (m_initialized) {
		const std::array params{ memory_access_value(value, m_panel.order) };
		if (const auto result{ send_single(command_id::SET_MEMORY_ACCESS, params) }; result != status::ok) [[unlikely]] {
			return result; // the panel keeps scanning the old way
		}
	}
	m_orientation = value;
	return status::ok;
}

LCD_TFT_DISPLAY_TEMPLATE
auto LCD_TFT_DISPLAY::set_inverted(const bool inverted) noexcept -> status {
	if (m_initialized) {
		const auto id{ inverted ? command_id::ENTER_INVERT_MODE : command_id::EXIT_INVERT_MODE };
		if (const auto result{ send_single(id) }; result != status::ok) [[unlikely]] {
			return result;
		}
	}
	m_panel.inverted = inverted;
	return status::ok;
}

LCD_TFT_DISPLAY_TEMPLATE
auto LCD_TFT_DISPLAY::sleep() noexcept -> status {
	if (!m_initialized) [[unlikely]] {
		return status::not_initialized;
	}
	return send_single(command_id::ENTER_SLEEP_MODE);
}

LCD_TFT_DISPLAY_TEMPLATE
template<hal::delay_provider Delay>
auto LCD_TFT_DISPLAY::wake(Delay &delay) noexcept -> status {
	if (!m_initialized) [[unlikely]] {
		return status::not_initialized;
	}
	if (const auto result{ send_single(command_id::EXIT_SLEEP_MODE) }; result != status::ok) [[unlikely]] {
		return result;
	}
	delay.delay_ms(constants::WAKE_UP_MS);
	return status::ok;
}

LCD_TFT_DISPLAY_TEMPLATE
[[gnu::always_inline]]
inline auto LCD_TFT_DISPLAY::set_window(
	const uint16_t x0, const uint16_t y0,
	const uint16_t x1, const uint16_t y1
) noexcept -> status {
	return set_window(rect::from_corners(x0, y0, x1, y1));
}

LCD_TFT_DISPLAY_TEMPLATE
auto LCD_TFT_DISPLAY::set_window(const rect &window) noexcept -> status {
	if (const auto result{ validate(window) }; result != status::ok) {
		return result;
	}
	return m_protocol.transaction([this, &window] {
		return send_window(window);
	});
}

LCD_TFT_DISPLAY_TEMPLATE
auto LCD_TFT_DISPLAY::write_pixel(const uint16_t x, const uint16_t y, const color clr) noexcept -> status {
	const auto window{ rect::from_corners(x, y, x, y) };
	if (const auto result{ validate(window) }; result != status::ok) {
		return result;
	}
	return m_protocol.transaction([this, &window, clr] {
		if (const auto result{ send_window(window) }; result != status::ok) [[unlikely]] {
			return result;
		}
		return m_protocol.send_color_repeat(clr, 1u);
	});
}

LCD_TFT_DISPLAY_TEMPLATE
template<color_range Colors>
[[gnu::always_inline]]
inline auto LCD_TFT_DISPLAY::write_block(
	const uint16_t x0, const uint16_t y0,
	const uint16_t x1, const uint16_t y1,
	Colors &&colors
) noexcept -> status {
	return write_block(rect::from_corners(x0, y0, x1, y1), std::forward<Colors>(colors));
}

LCD_TFT_DISPLAY_TEMPLATE
template<color_range Colors>
auto LCD_TFT_DISPLAY::write_block(const rect &window, Colors &&colors) noexcept -> status {
	if (const auto result{ validate(window) }; result != status::ok) {
		return result;
	}
	return m_protocol.transaction([this, &window, &colors] {
		if (const auto result{ send_window(window) }; result != status::ok) [[unlikely]] {
			return result;
		}
		return m_protocol.send_colors(std::forward<Colors>(colors));
	});
}

LCD_TFT_DISPLAY_TEMPLATE
template<color_range Colors>
auto LCD_TFT_DISPLAY::write_pixels(Colors &&colors) noexcept -> status {
	if (!m_initialized) [[unlikely]] {
		return status::not_initialized;
	}
	return m_protocol.transaction([this, &colors] {
		return m_protocol.send_colors(std::forward<Colors>(colors));
	});
}

LCD_TFT_DISPLAY_TEMPLATE
auto LCD_TFT_DISPLAY::fill_rect(const vec2u16 pos, const vec2u16 size, const color clr) noexcept -> status {
	if (!m_initialized) [[unlikely]] {
		return status::not_initialized;
	}
	if (size.w == 0u || size.h == 0u) {
		return status::ok;
	}

	const auto bounds{ this->size() };
	if (static_cast<uint32_t>(pos.x) + size.w > bounds.w
	||  static_cast<uint32_t>(pos.y) + size.h > bounds.h
	) {
		return status::invalid_geometry;
	}

	const auto window{ rect::from_size(pos, size) };
	if (const auto result{ validate(window) }; result != status::ok) {
		return result;
	}
	return m_protocol.transaction([this, &window, clr] {
		if (const auto result{ send_window(window) }; result != status::ok) [[unlikely]] {
			return result;
		}
		return m_protocol.send_color_repeat(clr, window.area());
	});
}

LCD_TFT_DISPLAY_TEMPLATE
[[gnu::always_inline]]
inline auto LCD_TFT_DISPLAY::clear_screen(const color clr) noexcept -> status {
	return fill_rect({}, size(), clr);
}


LCD_TFT_DISPLAY_TEMPLATE
auto LCD_TFT_DISPLAY::validate(const rect &window) const noexcept -> status {
	if (!m_initialized) [[unlikely]] {
		return status::not_initialized;
	}
	if (!window.fits(size())) {
		return status::invalid_geometry;
	}

	// Shifted by the offsets, the window must still fit the 16-bit address registers
	constexpr uint32_t max_address{ std::numeric_limits<uint16_t>::max() };
	const auto panel_offset{ offset_for(m_orientation, m_panel) };
	if (uint32_t{ window.right_bottom.x } + panel_offset.x + m_user_offset.x > max_address
	||  uint32_t{ window.right_bottom.y } + panel_offset.y + m_user_offset.y > max_address
	) {
		return status::invalid_geometry;
	}
	return status::ok;
}

LCD_TFT_DISPLAY_TEMPLATE
auto LCD_TFT_DISPLAY::send_window(const rect &window) noexcept -> status {
	const auto origin{ offset() };
	const auto first{ window.left_top + origin };
	const auto last { window.right_bottom + origin };

	const auto columns{ detail::encode_address_range(first.x, last.x) };
	if (const auto result{ m_protocol.send_command(command_id::SET_COLUMN_ADDRESS, columns) };
		result != status::ok
	) [[unlikely]] {
		return result;
	}

	const auto rows{ detail::encode_address_range(first.y, last.y) };
	if (const auto result{ m_protocol.send_command(command_id::SET_ROW_ADDRESS, rows) };
		result != status::ok
	) [[unlikely]] {
		return result;
	}

	return m_protocol.send_command(command_id::WRITE_MEMORY_START);
}

LCD_TFT_DISPLAY_TEMPLATE
auto LCD_TFT_DISPLAY::send_single(const command_id id, const std::span<const uint8_t> params) noexcept -> status {
	return m_protocol.transaction([this, id, params] {
		return m_protocol.send_command(id, params);
	});
}

#undef LCD_TFT_DISPLAY
#undef LCD_TFT_DISPLAY_TEMPLATE

} // namespace lcd::tft
