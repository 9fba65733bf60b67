//          Copyright Nick G 2020.
// Distributed under the Boost Software License, Version 1.0.
//    (See accompanying file LICENSE or copy at
//          https://www.boost.org/LICENSE_1_0.txt)
#include <cstdlib>
#include <memory>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include "Logging.hpp"

const char * const LOG_LEVEL_VARIABLE = "GIT_PROMPT_STATUS_LOG_LEVEL";
const char * const LOG_STYLE_VARIABLE = "GIT_PROMPT_STATUS_LOG_STYLE";

namespace {

std::string environmentOr(const char *name, const std::string &fallback) {
    auto value = std::getenv(name);
    if(value == NULL || *value == '\0') {
        return fallback;
    }
    return value;
}

}

spdlog::level::level_enum logLevelFromName(const std::string &name) {
    // from_str() hands back `off` for names it doesn't know, which would silence everything.
    if(name == "off") {
        return spdlog::level::off;
    }
    auto level = spdlog::level::from_str(name);
    if(level == spdlog::level::off) {
        return spdlog::level::info;
    }
    return level;
}

spdlog::color_mode logStyleFromName(const std::string &name) {
    if(name == "always") {
        return spdlog::color_mode::always;
    }
    if(name == "never") {
        return spdlog::color_mode::never;
    }
    return spdlog::color_mode::automatic;
}

void setupLogging() {
    auto style = logStyleFromName(environmentOr(LOG_STYLE_VARIABLE, "auto"));
    auto sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>(style);
    auto logger = std::make_shared<spdlog::logger>("git-prompt-status", sink);
    logger->set_level(logLevelFromName(environmentOr(LOG_LEVEL_VARIABLE, "info")));
    spdlog::set_default_logger(logger);
}
