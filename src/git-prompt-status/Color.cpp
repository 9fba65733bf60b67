//          Copyright Nick G 2020.
// Distributed under the Boost Software License, Version 1.0.
//    (See accompanying file LICENSE or copy at
//          https://www.boost.org/LICENSE_1_0.txt)
#include "Color.hpp"

namespace {

const std::string COLOR_END = "\u001b[0m";

std::string ansiStart(Color color) {
    switch(color) {
        case Color::RED:
            return "\u001b[31m";
        case Color::GREEN:
            return "\u001b[32m";
        case Color::YELLOW:
            return "\u001b[33m";
        case Color::BLUE:
            return "\u001b[34m";
        case Color::MAGENTA:
            return "\u001b[35m";
        case Color::CYAN:
            return "\u001b[36m";
    }
    return "";
}

}

std::string colorName(Color color) {
    switch(color) {
        case Color::BLUE:
            return "blue";
        case Color::GREEN:
            return "green";
        case Color::RED:
            return "red";
        case Color::YELLOW:
            return "yellow";
        default:
            return "not implemented yet";
    }
}

std::string formatColor(const std::string &text, Color color, RenderMode mode) {
    // No escape pair around empty text, unlike the older tool which emitted e.g. "%F{yellow}%f".
    if(text.empty()) {
        return text;
    }

    switch(mode) {
        case RenderMode::TERMINAL:
            return ansiStart(color) + text + COLOR_END;
        case RenderMode::PROMPT_ESCAPE:
            return "%F{" + colorName(color) + "}" + text + "%f";
        case RenderMode::PLAIN:
            break;
    }
    return text;
}
