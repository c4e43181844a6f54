// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright 2025 attrval Contributors

#pragma once

#include <spdlog/common.h>

#include <optional>
#include <string_view>

namespace attrval::config {

inline constexpr const char* kLogLevelEnv = "ATTRVAL_LOG_LEVEL";

// trace|debug|info|warn|warning|error|err|critical|crit|off|none|silent, any case
std::optional<spdlog::level::level_enum> parseLogLevel(std::string_view text);

/**
 * @brief Set the spdlog level from ATTRVAL_LOG_LEVEL
 *
 * Unset, empty or unrecognised values leave the current level alone.
 * @return the level applied, if any
 */
std::optional<spdlog::level::level_enum> applyLogLevelFromEnv(const char* variable = kLogLevelEnv);

} // namespace attrval::config
