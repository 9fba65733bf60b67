//          Copyright Nick G 2020.
// Distributed under the Boost Software License, Version 1.0.
//    (See accompanying file LICENSE or copy at
//          https://www.boost.org/LICENSE_1_0.txt)
#pragma once

#include <string>
#include <CLI/CLI.hpp>
#include "Color.hpp"

struct Options {
    std::string git_dir = ".";
    bool color = false;
    bool zsh = false;

    /// zsh escapes win over plain ANSI colors when both are requested.
    RenderMode renderMode() const;
};

void addOptions(CLI::App &app, Options &options);
