// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright 2025 attrval Contributors

#include <attrval/config/log_config.h>

#include <spdlog/spdlog.h>

#include <cctype>
#include <cstdlib>
#include <string>

namespace attrval::config {

std::optional<spdlog::level::level_enum> parseLogLevel(std::string_view text) {
    std::string v;
    v.reserve(text.size());
    for (char c : text)
        v.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
    if (v == "trace")
        return spdlog::level::trace;
    if (v == "debug")
        return spdlog::level::debug;
    if (v == "info")
        return spdlog::level::info;
    if (v == "warn" || v == "warning")
        return spdlog::level::warn;
    if (v == "error" || v == "err")
        return spdlog::level::err;
    if (v == "critical" || v == "crit")
        return spdlog::level::critical;
    if (v == "off" || v == "none" || v == "silent")
        return spdlog::level::off;
    return std::nullopt;
}

std::optional<spdlog::level::level_enum> applyLogLevelFromEnv(const char* variable) {
    const char* env = std::getenv(variable);
    if (!env || !*env) {
        return std::nullopt;
    }
    auto level = parseLogLevel(env);
    if (!level) {
        spdlog::warn("Config: ignoring unrecognised {}='{}'", variable, env);
        return std::nullopt;
    }
    spdlog::set_level(*level);
    return level;
}

} // namespace attrval::config
