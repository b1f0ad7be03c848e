#pragma once

#include "lcd/tft/config.hpp"
#include LCD_TFT_BACKEND_CONSTANTS_HPP

namespace lcd::tft::constants {

inline constexpr auto DISPLAY_SIZE { backend::LCD_TFT_BACKEND::DISPLAY_SIZE };
inline constexpr auto DEFAULT_PANEL{ backend::LCD_TFT_BACKEND::DEFAULT_PANEL };

inline constexpr auto RESET_PREPARE_MS{ backend::LCD_TFT_BACKEND::RESET_PREPARE_MS };
inline constexpr auto RESET_HOLD_MS   { backend::LCD_TFT_BACKEND::RESET_HOLD_MS };
inline constexpr auto RESET_SETTLE_MS { backend::LCD_TFT_BACKEND::RESET_SETTLE_MS };
inline constexpr auto WAKE_UP_MS      { backend::LCD_TFT_BACKEND::WAKE_UP_MS };

} // namespace lcd::tft::constants
