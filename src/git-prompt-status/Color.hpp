//          Copyright Nick G 2020.
// Distributed under the Boost Software License, Version 1.0.
//    (See accompanying file LICENSE or copy at
//          https://www.boost.org/LICENSE_1_0.txt)
#pragma once

#include <string>

/// How colors are encoded in the output.
///
/// - PLAIN leaves text untouched
/// - TERMINAL wraps text in ANSI escapes
/// - PROMPT_ESCAPE wraps text in zsh prompt escapes, `%F{color}text%f`
enum class RenderMode {PLAIN, TERMINAL, PROMPT_ESCAPE};

enum class Color {BLUE, GREEN, RED, YELLOW, MAGENTA, CYAN};

/// The zsh name for `color`.  Only blue, green, red and yellow have one, anything else comes back as
/// "not implemented yet".
std::string colorName(Color color);

std::string formatColor(const std::string &text, Color color, RenderMode mode);
