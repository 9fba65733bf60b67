//          Copyright Nick G 2020.
// Distributed under the Boost Software License, Version 1.0.
//    (See accompanying file LICENSE or copy at
//          https://www.boost.org/LICENSE_1_0.txt)
#pragma once

#include <string>
#include <spdlog/common.h>

extern const char * const LOG_LEVEL_VARIABLE;
extern const char * const LOG_STYLE_VARIABLE;

/// Maps a level name ("trace", "debug", "info", "warn", "error", "critical", "off") to a spdlog level.  Unknown
/// or empty names give `info`.
spdlog::level::level_enum logLevelFromName(const std::string &name);

/// Maps "auto", "always" or "never" to a spdlog color mode.  Anything else gives automatic coloring.
spdlog::color_mode logStyleFromName(const std::string &name);

/// Installs the default logger, writing to stderr so stdout only ever carries the prompt.  Level and coloring come
/// from the GIT_PROMPT_STATUS_LOG_LEVEL and GIT_PROMPT_STATUS_LOG_STYLE environment variables.
void setupLogging();
