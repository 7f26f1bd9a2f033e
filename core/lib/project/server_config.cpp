// ngdef/project/server_config.cpp - Configuration loading implementation
//
#include "ngdef/project/server_config.hpp"

#include <yaml-cpp/yaml.h>

#include <array>
#include <fstream>
#include <sstream>

namespace ngdef
{

namespace
{

constexpr std::array<const char *, 6> k_log_levels = {
  "trace", "debug", "info", "warn", "error", "off"};

/// Apply the 'log' section onto `log`.
bool parse_log_section(
  const YAML::Node & node, const std::filesystem::path & base_dir, LogConfig & log,
  std::string & error)
{
  if (!node.IsMap()) {
    error = "log must be a map";
    return false;
  }

  if (node["level"]) {
    log.level = node["level"].as<std::string>();
    if (!is_valid_log_level(log.level)) {
      error = "invalid log.level: '" + log.level +
              "' (must be one of trace, debug, info, warn, error, off)";
      return false;
    }
  }

  if (node["directory"]) {
    std::filesystem::path dir = node["directory"].as<std::string>();
    if (dir.is_relative() && !base_dir.empty()) {
      dir = base_dir / dir;
    }
    log.directory = dir;
  }

  if (node["file_name"]) {
    log.file_name = node["file_name"].as<std::string>();
    if (log.file_name.empty()) {
      error = "log.file_name must not be empty";
      return false;
    }
  }

  return true;
}

}  // namespace

bool is_valid_log_level(const std::string & level)
{
  for (const char * l : k_log_levels) {
    if (level == l) {
      return true;
    }
  }
  return false;
}

ConfigLoadResult parse_server_config(
  const std::string & yaml_text, const std::filesystem::path & base_dir)
{
  YAML::Node root;
  try {
    root = YAML::Load(yaml_text);
  } catch (const YAML::Exception & e) {
    return ConfigLoadResult::fail("failed to parse YAML: " + std::string(e.what()));
  }

  ServerConfig config;

  // An empty document means "all defaults".
  if (!root || root.IsNull()) {
    return ConfigLoadResult::ok(std::move(config));
  }
  if (!root.IsMap()) {
    return ConfigLoadResult::fail("configuration root must be a map");
  }

  try {
    if (root["log"]) {
      std::string error;
      if (!parse_log_section(root["log"], base_dir, config.log, error)) {
        return ConfigLoadResult::fail(error);
      }
    }
  } catch (const YAML::Exception & e) {
    return ConfigLoadResult::fail("invalid configuration value: " + std::string(e.what()));
  }

  return ConfigLoadResult::ok(std::move(config));
}

ConfigLoadResult load_server_config(const std::filesystem::path & config_path)
{
  namespace fs = std::filesystem;

  if (!fs::exists(config_path)) {
    return ConfigLoadResult::fail("configuration file not found: " + config_path.string());
  }

  std::ifstream f(config_path, std::ios::in | std::ios::binary);
  if (!f.is_open()) {
    return ConfigLoadResult::fail("cannot open configuration file: " + config_path.string());
  }
  std::ostringstream ss;
  ss << f.rdbuf();

  auto result = parse_server_config(ss.str(), fs::absolute(config_path).parent_path());
  if (result.success) {
    result.config.source = fs::absolute(config_path);
  }
  return result;
}

std::optional<std::filesystem::path> find_server_config(const std::filesystem::path & start_dir)
{
  namespace fs = std::filesystem;

  std::error_code ec;
  fs::path current = fs::absolute(start_dir, ec);
  if (ec) {
    return std::nullopt;
  }

  // If start_dir is a file, start from its parent
  if (fs::is_regular_file(current, ec)) {
    current = current.parent_path();
  }

  while (true) {
    const fs::path candidate = current / k_server_config_file_name;
    if (fs::exists(candidate, ec)) {
      return candidate;
    }

    const fs::path parent = current.parent_path();
    if (parent == current) {
      // Reached filesystem root
      break;
    }
    current = parent;
  }

  return std::nullopt;
}

}  // namespace ngdef
