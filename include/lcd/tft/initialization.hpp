#pragma once


#include "lcd/tft/config.hpp"
#include "lcd/tft/panel.hpp"
#include "lcd/tft/orientation.hpp"

#include LCD_TFT_BACKEND_INITIALIZATION_HPP


namespace lcd::tft {

constexpr decltype(auto) make_initialization_sequence(
	const panel_config &panel,
	const orientation value = orientation::portrait
) {
	return backend::LCD_TFT_BACKEND::make_initialization_sequence(
		memory_access_value(value, panel.order),
		panel.inverted
	);
}

} // namespace lcd::tft
