// ngdef/protocol/message.hpp - JSON-RPC 2.0 message model
//
// Messages are decoded in an explicit order: the `method` member and the
// presence of `id` decide between Request and Notification. Structural
// guessing across variants is never attempted.
//
#pragma once

#include <nlohmann/json.hpp>

#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <variant>

#include "ngdef/basic/error.hpp"
#include "ngdef/protocol/request_id.hpp"

namespace ngdef
{

inline constexpr const char * k_jsonrpc_version = "2.0";

struct Request
{
  RequestId id;
  std::string method;
  nlohmann::json params;  // object, array or null
};

struct Notification
{
  std::string method;
  nlohmann::json params;
};

struct ResponseError
{
  int code = 0;
  std::string message;
};

struct Response
{
  RequestId id;
  nlohmann::json result;  // ignored when error is set
  std::optional<ResponseError> error;

  [[nodiscard]] static Response success(RequestId id, nlohmann::json result);
  [[nodiscard]] static Response failure(RequestId id, const Error & error);
};

using Message = std::variant<Request, Notification, Response>;

/**
 * Outcome of decoding (or reading) one message.
 */
struct MessageResult
{
  /// Decoded message (only valid if success == true)
  std::optional<Message> message;

  /// Whether decoding succeeded
  bool success = false;

  /// Failure details (only valid if success == false)
  Error error;

  static MessageResult ok(Message msg)
  {
    MessageResult r;
    r.message = std::move(msg);
    r.success = true;
    return r;
  }

  static MessageResult fail(Error err)
  {
    MessageResult r;
    r.error = std::move(err);
    r.success = false;
    return r;
  }
};

/**
 * Decode a message body.
 *
 * Only Request and Notification are accepted. A body that is not JSON, or
 * whose envelope matches neither shape, yields a Decode error carrying the
 * raw text. If the body is a JSON object with a usable `id`, the error is an
 * InvalidRequest addressed to that id, unless the body is a response
 * (`result` or `error` without `method`), which is never answered.
 *
 * A missing `jsonrpc` member is accepted; a value other than "2.0" is not.
 */
[[nodiscard]] MessageResult decode_message(std::string_view body);

/// Encode any message (including the jsonrpc member).
[[nodiscard]] nlohmann::json encode_message(const Message & msg);

/// Method name of a Request/Notification, empty for Response.
[[nodiscard]] std::string_view method_of(const Message & msg) noexcept;

}  // namespace ngdef
