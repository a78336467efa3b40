// ============================================================================
// log.cpp — implementation for log.hpp
// ============================================================================

#include "kdc/log.hpp"

#include <memory>

#include <spdlog/sinks/stdout_color_sinks.h>

namespace kdc {

bool parse_log_level(const std::string& name, spdlog::level::level_enum& out) {
  static const struct { const char* name; spdlog::level::level_enum level; } levels[] = {
      {"trace", spdlog::level::trace}, {"debug", spdlog::level::debug}, {"info", spdlog::level::info},
      {"warn", spdlog::level::warn},   {"warning", spdlog::level::warn}, {"error", spdlog::level::err},
      {"critical", spdlog::level::critical}, {"off", spdlog::level::off},
  };
  for (const auto& l : levels) {
    if (name == l.name) {
      out = l.level;
      return true;
    }
  }
  return false;
}

Status init_logging(const std::string& level) {
  spdlog::level::level_enum lvl = spdlog::level::info;
  if (!parse_log_level(level, lvl)) return Status(ErrorKind::Config, "unknown log level '" + level + "'");

  auto sink   = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
  auto logger = std::make_shared<spdlog::logger>("kdc", sink);
  logger->set_pattern("[%H:%M:%S.%e] [%l] %v");
  logger->set_level(lvl);
  logger->flush_on(spdlog::level::warn);
  spdlog::set_default_logger(logger);
  return Status();
}

} // namespace kdc
