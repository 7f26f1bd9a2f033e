// ngdef/server/server.cpp - Dispatch loop implementation
#include "ngdef/server/server.hpp"

#include <cstdint>
#include <exception>
#include <limits>
#include <utility>
#include <variant>

#include "ngdef/basic/error.hpp"
#include "ngdef/basic/position.hpp"
#include "ngdef/driver/logging.hpp"
#include "ngdef/protocol/capabilities.hpp"

namespace ngdef
{

using json = nlohmann::json;

namespace
{

bool is_non_negative_integer(const json & obj, const char * key)
{
  const auto it = obj.find(key);
  return it != obj.end() && it->is_number_integer() && it->get<int64_t>() >= 0 &&
         it->get<int64_t>() <= std::numeric_limits<uint32_t>::max();
}

// Extract `{textDocument:{uri}, position:{line, character}}`.
void parse_definition_params(const json & params, std::string & uri, Position & position)
{
  if (!params.is_object()) {
    throw RpcError(Error::invalid_request("definition params must be an object"));
  }
  const auto td = params.find("textDocument");
  if (td == params.end() || !td->is_object() || !td->contains("uri") || !(*td)["uri"].is_string()) {
    throw RpcError(Error::invalid_request("definition params require textDocument.uri"));
  }
  const auto pos = params.find("position");
  if (
    pos == params.end() || !pos->is_object() || !is_non_negative_integer(*pos, "line") ||
    !is_non_negative_integer(*pos, "character")) {
    throw RpcError(Error::invalid_request(
      "definition params require position.line and position.character"));
  }
  uri = (*td)["uri"].get<std::string>();
  position = pos->get<Position>();
}

}  // namespace

Server::Server(
  std::istream & in, std::ostream & out, const FileStore & files,
  std::shared_ptr<spdlog::logger> logger)
: reader_(in),
  writer_(out),
  logger_(logger ? std::move(logger) : null_logger()),
  resolver_(files, logger_)
{
  handlers_["initialize"] = [this](const json & p) { return on_initialize(p); };
  handlers_["shutdown"] = [this](const json & p) { return on_shutdown(p); };
  handlers_["textDocument/definition"] = [this](const json & p) { return on_definition(p); };
}

int Server::run()
{
  logger_->info("server loop started");
  while (step()) {
  }
  logger_->info(
    "server loop exited ({})",
    exit_reason_ == ExitReason::ExitNotification ? "exit notification" : "too many failures");
  return (exit_reason_ == ExitReason::ExitNotification && shutdown_requested_) ? 0 : 1;
}

bool Server::step()
{
  if (state_ == ServerState::Exited) {
    return false;
  }

  MessageResult result = reader_.read();
  if (!result.success) {
    handle_failure(result.error);
    return state_ == ServerState::Running;
  }

  failures_ = 0;
  logger_->debug("decoded message '{}'", method_of(*result.message));

  if (const auto * request = std::get_if<Request>(&*result.message)) {
    handle_request(*request);
  } else if (const auto * notification = std::get_if<Notification>(&*result.message)) {
    handle_notification(*notification);
  }
  return state_ == ServerState::Running;
}

void Server::handle_request(const Request & request)
{
  logger_->debug("request id={} method={}", request.id.to_string(), request.method);

  const auto it = handlers_.find(request.method);
  if (it == handlers_.end()) {
    logger_->warn("unknown request method '{}'", request.method);
    reply(Response::failure(request.id, Error::method_not_found(request.method)));
    return;
  }

  try {
    reply(Response::success(request.id, it->second(request.params)));
  } catch (const RpcError & e) {
    logger_->warn("request id={} failed: {}", request.id.to_string(), e.what());
    reply(Response::failure(request.id, e.error()));
  } catch (const json::exception & e) {
    logger_->warn("request id={} has malformed params: {}", request.id.to_string(), e.what());
    reply(Response::failure(request.id, Error::invalid_request(e.what())));
  } catch (const std::exception & e) {
    logger_->error("request id={} raised: {}", request.id.to_string(), e.what());
    reply(Response::failure(request.id, Error::internal("internal error", e.what())));
  }
}

void Server::handle_notification(const Notification & notification)
{
  if (notification.method == "exit") {
    logger_->info("exit notification (shutdown requested: {})", shutdown_requested_);
    terminate(ExitReason::ExitNotification);
    return;
  }
  if (notification.method == "initialized") {
    logger_->debug("client initialized");
    return;
  }
  logger_->debug("ignoring notification '{}'", notification.method);
}

void Server::handle_failure(const Error & error)
{
  ++failures_;
  logger_->warn(
    "read failure {}/{}: {}", failures_, k_max_consecutive_failures, error.describe());
  if (error.raw_body) {
    logger_->debug("raw body: {}", *error.raw_body);
  }

  if (error.id) {
    reply(Response::failure(*error.id, error));
  }

  if (failures_ >= k_max_consecutive_failures) {
    logger_->error("{} consecutive read failures; giving up", failures_);
    terminate(ExitReason::TooManyFailures);
  }
}

json Server::on_initialize(const json & params)
{
  if (!is_valid_initialize_params(params)) {
    throw RpcError(Error::invalid_request(
      "initialize params require a capabilities object"));
  }
  logger_->info("initialize");
  return initialize_result();
}

json Server::on_shutdown(const json & /*params*/)
{
  logger_->info("shutdown requested");
  shutdown_requested_ = true;
  return nullptr;
}

json Server::on_definition(const json & params)
{
  std::string uri;
  Position position;
  parse_definition_params(params, uri, position);

  const auto location = resolver_.resolve(uri, position);
  if (!location) {
    return nullptr;
  }
  return *location;
}

void Server::reply(const Response & response)
{
  if (!writer_.write(response)) {
    logger_->error("failed to write response id={}", response.id.to_string());
  }
}

void Server::terminate(ExitReason reason)
{
  state_ = ServerState::Exited;
  exit_reason_ = reason;
}

}  // namespace ngdef
