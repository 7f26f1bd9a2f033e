// ngdef/driver/logging.hpp - Diagnostic logger setup
//
// stdout carries the protocol stream, so log output goes to a daily rotating
// file or to stderr, never to stdout.
//
#pragma once

#include <spdlog/spdlog.h>

#include <memory>
#include <optional>
#include <string_view>
#include <utility>

#include "ngdef/project/server_config.hpp"

namespace ngdef
{

inline constexpr const char * k_logger_name = "ngdef";
inline constexpr const char * k_log_level_env = "NGDEF_LOG_LEVEL";

/// Parse a level name; unknown names yield `fallback`.
[[nodiscard]] spdlog::level::level_enum parse_log_level(
  std::string_view level, spdlog::level::level_enum fallback = spdlog::level::info);

/**
 * Build the process logger from configuration.
 *
 * `level_override` (from the command line or NGDEF_LOG_LEVEL) wins over the
 * configured level. Falls back to stderr if the log directory is unusable.
 */
[[nodiscard]] std::shared_ptr<spdlog::logger> make_logger(
  const LogConfig & config, std::optional<std::string_view> level_override = std::nullopt);

/// Logger with no sinks, for components constructed without one.
[[nodiscard]] std::shared_ptr<spdlog::logger> null_logger();

/// Flushes and shuts spdlog down when the process leaves main().
class LoggingGuard
{
public:
  explicit LoggingGuard(std::shared_ptr<spdlog::logger> logger) : logger_(std::move(logger)) {}
  LoggingGuard(const LoggingGuard &) = delete;
  LoggingGuard & operator=(const LoggingGuard &) = delete;
  ~LoggingGuard();

private:
  std::shared_ptr<spdlog::logger> logger_;
};

}  // namespace ngdef
