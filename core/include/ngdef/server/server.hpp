// ngdef/server/server.hpp - Single-threaded LSP dispatch loop
#pragma once

#include <spdlog/spdlog.h>

#include <nlohmann/json.hpp>

#include <cstdint>
#include <functional>
#include <istream>
#include <memory>
#include <ostream>
#include <string>
#include <unordered_map>

#include "ngdef/protocol/message.hpp"
#include "ngdef/protocol/transport.hpp"
#include "ngdef/resolver/definition_resolver.hpp"
#include "ngdef/vfs/file_store.hpp"

namespace ngdef
{

/// Consecutive read/decode failures after which the loop gives up.
inline constexpr uint32_t k_max_consecutive_failures = 10;

enum class ServerState : uint8_t {
  Running,
  Exited,
};

enum class ExitReason : uint8_t {
  None,              // still running
  ExitNotification,  // client sent `exit`
  TooManyFailures,   // fail-safe tripped
};

/**
 * Reads one message at a time, dispatches it and writes the response before
 * reading the next.
 *
 * Requests are answered exactly once with their own id. Failures with no
 * recoverable id are only logged and counted; the counter resets on every
 * successful read.
 */
class Server
{
public:
  Server(
    std::istream & in, std::ostream & out, const FileStore & files,
    std::shared_ptr<spdlog::logger> logger);

  Server(const Server &) = delete;
  Server & operator=(const Server &) = delete;

  /**
   * Run until `exit` or the failure threshold.
   *
   * @return 0 if `shutdown` was received before `exit`, 1 otherwise
   */
  int run();

  /// Process exactly one message. Returns false once the server has exited.
  bool step();

  [[nodiscard]] ServerState state() const noexcept { return state_; }
  [[nodiscard]] ExitReason exit_reason() const noexcept { return exit_reason_; }
  [[nodiscard]] uint32_t consecutive_failures() const noexcept { return failures_; }
  [[nodiscard]] bool shutdown_requested() const noexcept { return shutdown_requested_; }

private:
  using RequestHandler = std::function<nlohmann::json(const nlohmann::json & params)>;

  void handle_request(const Request & request);
  void handle_notification(const Notification & notification);
  void handle_failure(const Error & error);

  nlohmann::json on_initialize(const nlohmann::json & params);
  nlohmann::json on_shutdown(const nlohmann::json & params);
  nlohmann::json on_definition(const nlohmann::json & params);

  void reply(const Response & response);
  void terminate(ExitReason reason);

  MessageReader reader_;
  MessageWriter writer_;
  std::shared_ptr<spdlog::logger> logger_;
  resolver::DefinitionResolver resolver_;
  std::unordered_map<std::string, RequestHandler> handlers_;

  ServerState state_ = ServerState::Running;
  ExitReason exit_reason_ = ExitReason::None;
  uint32_t failures_ = 0;
  bool shutdown_requested_ = false;
};

}  // namespace ngdef
