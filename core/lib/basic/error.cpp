// ngdef/basic/error.cpp - Error taxonomy implementation
#include "ngdef/basic/error.hpp"

#include <fmt/core.h>

#include <utility>

namespace ngdef
{

std::string_view to_string(ErrorKind kind) noexcept
{
  switch (kind) {
    case ErrorKind::Io:
      return "io";
    case ErrorKind::Header:
      return "header";
    case ErrorKind::Decode:
      return "decode";
    case ErrorKind::InvalidRequest:
      return "invalid-request";
    case ErrorKind::MethodNotFound:
      return "method-not-found";
    case ErrorKind::Internal:
      return "internal";
  }
  return "unknown";
}

int Error::code() const noexcept
{
  switch (kind) {
    case ErrorKind::Io:
    case ErrorKind::Header:
    case ErrorKind::Decode:
      return k_parse_error;
    case ErrorKind::InvalidRequest:
      return k_invalid_request;
    case ErrorKind::MethodNotFound:
      return k_method_not_found;
    case ErrorKind::Internal:
      return k_internal_error;
  }
  return k_internal_error;
}

std::string Error::describe() const
{
  std::string out = fmt::format("[{}] {}", to_string(kind), message);
  if (id) {
    out += fmt::format(" (id={})", id->to_string());
  }
  if (!cause.empty()) {
    out += fmt::format(": {}", cause);
  }
  return out;
}

Error Error::io(std::string message, std::string cause)
{
  Error e;
  e.kind = ErrorKind::Io;
  e.message = std::move(message);
  e.cause = std::move(cause);
  return e;
}

Error Error::header(std::string message)
{
  Error e;
  e.kind = ErrorKind::Header;
  e.message = std::move(message);
  return e;
}

Error Error::decode(std::string message, std::string raw_body, std::string cause)
{
  Error e;
  e.kind = ErrorKind::Decode;
  e.message = std::move(message);
  e.raw_body = std::move(raw_body);
  e.cause = std::move(cause);
  return e;
}

Error Error::invalid_request(std::string message)
{
  Error e;
  e.kind = ErrorKind::InvalidRequest;
  e.message = std::move(message);
  return e;
}

Error Error::method_not_found(std::string_view method)
{
  Error e;
  e.kind = ErrorKind::MethodNotFound;
  e.message = fmt::format("Method not found: {}", method);
  return e;
}

Error Error::internal(std::string message, std::string cause)
{
  Error e;
  e.kind = ErrorKind::Internal;
  e.message = std::move(message);
  e.cause = std::move(cause);
  return e;
}

RpcError::RpcError(Error error) : std::runtime_error(error.describe()), error_(std::move(error))
{
}

}  // namespace ngdef
