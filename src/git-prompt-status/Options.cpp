//          Copyright Nick G 2020.
// Distributed under the Boost Software License, Version 1.0.
//    (See accompanying file LICENSE or copy at
//          https://www.boost.org/LICENSE_1_0.txt)
#include "Options.hpp"

#ifndef GIT_PROMPT_STATUS_VERSION
#define GIT_PROMPT_STATUS_VERSION "unknown"
#endif

RenderMode Options::renderMode() const {
    if(zsh) {
        return RenderMode::PROMPT_ESCAPE;
    }
    if(color) {
        return RenderMode::TERMINAL;
    }
    return RenderMode::PLAIN;
}

void addOptions(CLI::App &app, Options &options) {
    app.set_version_flag("--version", GIT_PROMPT_STATUS_VERSION);
    app.add_option("dir,--git-dir", options.git_dir, "git directory to analyze")->type_name("DIR");
    app.add_flag("--color", options.color, "enable color");
    app.add_flag("--zsh", options.zsh, "enable zsh encoded color");
}
