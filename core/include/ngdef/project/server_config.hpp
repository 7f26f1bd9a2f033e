// ngdef/project/server_config.hpp - Server configuration (ngdef.yaml)
//
// Parses the optional ngdef.yaml file. Only logging is configurable; protocol
// behavior is fixed.
//
#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <utility>

namespace ngdef
{

// ============================================================================
// Configuration Structures
// ============================================================================

/**
 * Logging section.
 */
struct LogConfig
{
  /// trace | debug | info | warn | error | off
  std::string level = "info";

  /// Directory for daily rotating log files. Logs go to stderr when unset.
  std::optional<std::filesystem::path> directory;

  /// Base file name inside `directory`
  std::string file_name = "ngdef.log";
};

/**
 * Complete server configuration (ngdef.yaml).
 */
struct ServerConfig
{
  LogConfig log;

  /// File the configuration was loaded from, empty for defaults
  std::filesystem::path source;
};

// ============================================================================
// Configuration Loading Result
// ============================================================================

struct ConfigLoadResult
{
  /// Loaded configuration (only valid if success == true)
  ServerConfig config;

  /// Whether loading succeeded
  bool success = false;

  /// Error message if loading failed
  std::string error;

  static ConfigLoadResult ok(ServerConfig cfg)
  {
    ConfigLoadResult r;
    r.config = std::move(cfg);
    r.success = true;
    return r;
  }

  static ConfigLoadResult fail(std::string msg)
  {
    ConfigLoadResult r;
    r.error = std::move(msg);
    r.success = false;
    return r;
  }
};

// ============================================================================
// Configuration Loading API
// ============================================================================

/**
 * Load a configuration from an ngdef.yaml file.
 *
 * Relative `log.directory` values are resolved against the file's directory.
 */
[[nodiscard]] ConfigLoadResult load_server_config(const std::filesystem::path & config_path);

/// Parse configuration from YAML text (no file involved).
[[nodiscard]] ConfigLoadResult parse_server_config(
  const std::string & yaml_text, const std::filesystem::path & base_dir = {});

/**
 * Find ngdef.yaml by searching upward from start_dir.
 *
 * @return Path to the file if found, std::nullopt otherwise
 */
[[nodiscard]] std::optional<std::filesystem::path> find_server_config(
  const std::filesystem::path & start_dir);

/// True if `level` names a known log level.
[[nodiscard]] bool is_valid_log_level(const std::string & level);

inline constexpr const char * k_server_config_file_name = "ngdef.yaml";

}  // namespace ngdef
