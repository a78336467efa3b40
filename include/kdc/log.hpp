#pragma once
/**
 * @file log.hpp
 * @brief spdlog setup for the daemon and tests.
 *
 * One default logger writing to stderr with the pattern
 * `[%H:%M:%S.%e] [%l] %v`. Components log through `spdlog::info(...)` etc. with
 * `component: event key=value` messages.
 */

#include <string>

#include <spdlog/spdlog.h>

#include "kdc/status.hpp"

namespace kdc {

/// "trace", "debug", "info", "warn", "error", "critical", "off".
bool parse_log_level(const std::string& name, spdlog::level::level_enum& out);

/// Install the default logger at @p level. Config error on an unknown level name.
Status init_logging(const std::string& level);

} // namespace kdc
