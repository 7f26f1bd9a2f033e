// ngdef/basic/error.hpp - Flat error taxonomy shared by transport, dispatcher and resolver
#pragma once

#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>

#include "ngdef/protocol/request_id.hpp"

namespace ngdef
{

// ============================================================================
// Error codes (JSON-RPC 2.0)
// ============================================================================

inline constexpr int k_parse_error = -32700;
inline constexpr int k_invalid_request = -32600;
inline constexpr int k_method_not_found = -32601;
inline constexpr int k_internal_error = -32603;

/**
 * Kind of failure.
 *
 * Io / Header / Decode come from the framing reader and are never answered
 * unless a request id could be recovered. The remaining kinds are protocol
 * errors addressed to a known request.
 */
enum class ErrorKind : uint8_t {
  Io,              // end of stream or read failure
  Header,          // malformed header block / Content-Length
  Decode,          // body is not JSON or not a Request/Notification
  InvalidRequest,  // well-formed message that cannot be served
  MethodNotFound,
  Internal,
};

[[nodiscard]] std::string_view to_string(ErrorKind kind) noexcept;

/**
 * A single error value.
 *
 * Deeply nested causes are collapsed into `cause` (the underlying library
 * message, e.g. from nlohmann::json or the filesystem).
 */
struct Error
{
  ErrorKind kind = ErrorKind::Internal;
  std::string message;

  /// Request the error is attributable to, if one could be recovered.
  std::optional<RequestId> id;

  /// Raw body text for decode errors.
  std::optional<std::string> raw_body;

  /// Underlying cause, empty if none.
  std::string cause;

  /// JSON-RPC error code for this kind.
  [[nodiscard]] int code() const noexcept;

  /// Human readable one-liner for logs.
  [[nodiscard]] std::string describe() const;

  static Error io(std::string message, std::string cause = {});
  static Error header(std::string message);
  static Error decode(std::string message, std::string raw_body, std::string cause = {});
  static Error invalid_request(std::string message);
  static Error method_not_found(std::string_view method);
  static Error internal(std::string message, std::string cause = {});
};

/**
 * Exception carrying an Error.
 *
 * Thrown by request handlers and the definition resolver for infrastructure
 * failures; the dispatcher turns it into a JSON-RPC error response.
 */
class RpcError : public std::runtime_error
{
public:
  explicit RpcError(Error error);

  [[nodiscard]] const Error & error() const noexcept { return error_; }

private:
  Error error_;
};

}  // namespace ngdef
