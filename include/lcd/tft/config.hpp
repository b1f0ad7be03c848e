#pragma once

#if __has_include("lcd-user-config.hpp")
#include "lcd-user-config.hpp"
#endif // __has_include("lcd-user-config.hpp")

#if !defined(LCD_TFT_BACKEND)
#define LCD_TFT_BACKEND st7735
#endif // !defined(LCD_TFT_BACKEND)


#define LCD_TFT_BACKEND_COMMANDS_HPP       <lcd/tft/backend/LCD_TFT_BACKEND/commands.hpp>
#define LCD_TFT_BACKEND_CONSTANTS_HPP      <lcd/tft/backend/LCD_TFT_BACKEND/constants.hpp>
#define LCD_TFT_BACKEND_INITIALIZATION_HPP <lcd/tft/backend/LCD_TFT_BACKEND/initialization.hpp>
