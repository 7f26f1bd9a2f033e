// ngdef/driver/logging.cpp
#include "ngdef/driver/logging.hpp"

#include <spdlog/sinks/daily_file_sink.h>
#include <spdlog/sinks/stdout_sinks.h>

#include <filesystem>
#include <string>
#include <unordered_map>

namespace ngdef
{

namespace
{

constexpr const char * k_log_pattern = "[%Y-%m-%d %H:%M:%S.%e][%n][%L] %v";

}  // namespace

spdlog::level::level_enum parse_log_level(
  std::string_view level, spdlog::level::level_enum fallback)
{
  static const std::unordered_map<std::string_view, spdlog::level::level_enum> k_level_map = {
    {"trace", spdlog::level::trace}, {"debug", spdlog::level::debug},
    {"info", spdlog::level::info},   {"warn", spdlog::level::warn},
    {"error", spdlog::level::err},   {"off", spdlog::level::off},
  };

  if (auto it = k_level_map.find(level); it != k_level_map.end()) {
    return it->second;
  }
  return fallback;
}

std::shared_ptr<spdlog::logger> make_logger(
  const LogConfig & config, std::optional<std::string_view> level_override)
{
  std::shared_ptr<spdlog::logger> logger;

  if (config.directory) {
    std::error_code ec;
    std::filesystem::create_directories(*config.directory, ec);
    const auto file = (*config.directory / config.file_name).string();
    try {
      auto sink = std::make_shared<spdlog::sinks::daily_file_sink_mt>(file, 0, 0);
      logger = std::make_shared<spdlog::logger>(k_logger_name, std::move(sink));
    } catch (const spdlog::spdlog_ex & e) {
      logger = std::make_shared<spdlog::logger>(
        k_logger_name, std::make_shared<spdlog::sinks::stderr_sink_mt>());
      logger->warn("cannot open log file '{}': {}; logging to stderr", file, e.what());
    }
  } else {
    logger = std::make_shared<spdlog::logger>(
      k_logger_name, std::make_shared<spdlog::sinks::stderr_sink_mt>());
  }

  const auto base = parse_log_level(config.level);
  const auto level = level_override ? parse_log_level(*level_override, base) : base;
  logger->set_pattern(k_log_pattern);
  logger->set_level(level);
  logger->flush_on(spdlog::level::warn);
  return logger;
}

std::shared_ptr<spdlog::logger> null_logger()
{
  auto logger = std::make_shared<spdlog::logger>("ngdef-null");
  logger->set_level(spdlog::level::off);
  return logger;
}

LoggingGuard::~LoggingGuard()
{
  if (logger_) {
    logger_->flush();
  }
  spdlog::shutdown();
}

}  // namespace ngdef
