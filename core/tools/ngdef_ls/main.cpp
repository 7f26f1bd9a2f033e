// ngdef-ls - template go-to-definition language server (stdio JSON-RPC)
//
// Usage:
//   ngdef-ls [--config <ngdef.yaml>] [--log-level <level>]
//
#include <cstdlib>
#include <cstring>
#include <filesystem>
#include <iostream>
#include <optional>
#include <string>

#include "ngdef/driver/logging.hpp"
#include "ngdef/project/server_config.hpp"
#include "ngdef/protocol/capabilities.hpp"
#include "ngdef/server/server.hpp"
#include "ngdef/vfs/file_store.hpp"

namespace fs = std::filesystem;

namespace
{

struct Options
{
  std::optional<fs::path> config_path;
  std::optional<std::string> log_level;
  bool help = false;
  bool version = false;
};

void print_usage(const char * program_name)
{
  std::cerr << ngdef::k_server_name << " v" << ngdef::k_server_version << "\n\n"
            << "Usage: " << program_name << " [options]\n\n"
            << "Options:\n"
            << "  --config <path>          Configuration file (default: nearest ngdef.yaml)\n"
            << "  --log-level <level>      trace|debug|info|warn|error|off\n"
            << "  --version                Print version and exit\n"
            << "  -h, --help               Show this help message\n\n"
            << "Environment:\n"
            << "  " << ngdef::k_log_level_env << "          Log level override\n";
}

bool parse_args(int argc, char * argv[], Options & opts)
{
  for (int i = 1; i < argc; ++i) {
    const char * arg = argv[i];
    if (std::strcmp(arg, "-h") == 0 || std::strcmp(arg, "--help") == 0) {
      opts.help = true;
    } else if (std::strcmp(arg, "--version") == 0) {
      opts.version = true;
    } else if (std::strcmp(arg, "--config") == 0) {
      if (i + 1 >= argc) {
        std::cerr << "error: --config requires a path\n";
        return false;
      }
      opts.config_path = fs::path(argv[++i]);
    } else if (std::strcmp(arg, "--log-level") == 0) {
      if (i + 1 >= argc) {
        std::cerr << "error: --log-level requires a value\n";
        return false;
      }
      opts.log_level = argv[++i];
      if (!ngdef::is_valid_log_level(*opts.log_level)) {
        std::cerr << "error: unknown log level '" << *opts.log_level << "'\n";
        return false;
      }
    } else if (std::strcmp(arg, "--stdio") == 0) {
      // Accepted for client compatibility; stdio is the only transport.
    } else {
      std::cerr << "error: unknown option '" << arg << "'\n";
      return false;
    }
  }
  return true;
}

ngdef::ServerConfig load_config(const Options & opts)
{
  std::optional<fs::path> path = opts.config_path;
  if (!path) {
    std::error_code ec;
    path = ngdef::find_server_config(fs::current_path(ec));
  }
  if (!path) {
    return ngdef::ServerConfig{};
  }

  const auto result = ngdef::load_server_config(*path);
  if (!result.success) {
    std::cerr << "ngdef-ls: " << result.error << " (using defaults)\n";
    return ngdef::ServerConfig{};
  }
  return result.config;
}

}  // namespace

int main(int argc, char * argv[])
{
  Options opts;
  if (!parse_args(argc, argv, opts)) {
    print_usage(argv[0]);
    return 2;
  }
  if (opts.help) {
    print_usage(argv[0]);
    return 0;
  }
  if (opts.version) {
    std::cout << ngdef::k_server_name << " " << ngdef::k_server_version << "\n";
    return 0;
  }

  const ngdef::ServerConfig config = load_config(opts);

  std::optional<std::string> level_override = opts.log_level;
  if (!level_override) {
    if (const char * env = std::getenv(ngdef::k_log_level_env)) {
      level_override = env;
    }
  }

  auto logger = ngdef::make_logger(config.log, level_override);
  const ngdef::LoggingGuard logging_guard(logger);

  try {
    logger->info(
      "================ {} {} ================", ngdef::k_server_name, ngdef::k_server_version);
    if (!config.source.empty()) {
      logger->info("configuration: {}", config.source.string());
    }

    const ngdef::DiskFileStore files;
    ngdef::Server server(std::cin, std::cout, files, logger);
    return server.run();
  } catch (const std::exception & e) {
    logger->critical("fatal error: {}", e.what());
    std::cerr << "ngdef-ls: fatal error: " << e.what() << "\n";
    return 1;
  }
}
