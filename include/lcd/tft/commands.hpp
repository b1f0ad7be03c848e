#pragma once


#include "lcd/tft/config.hpp"

#include LCD_TFT_BACKEND_COMMANDS_HPP


namespace lcd::tft {

using command_id     = backend::LCD_TFT_BACKEND::command_id;
using command        = backend::LCD_TFT_BACKEND::command;
using display_config = backend::LCD_TFT_BACKEND::display_config;

using backend::LCD_TFT_BACKEND::as_span;

} // namespace lcd::tft
