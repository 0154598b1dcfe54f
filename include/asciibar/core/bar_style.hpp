#pragma once

#include "../common/constants.hpp"

namespace asciibar {
namespace core {

// Process-wide glyph set and width; copied into each Bar at construction.
struct BarStyle {
    char left_end = constants::glyphs::LEFT_END;
    char right_end = constants::glyphs::RIGHT_END;
    char fill = constants::glyphs::FILL;
    char head = constants::glyphs::HEAD;
    char empty = constants::glyphs::EMPTY;
    int width = constants::limits::DEFAULT_BAR_WIDTH;
};

}}
