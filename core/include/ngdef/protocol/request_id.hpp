// ngdef/protocol/request_id.hpp - JSON-RPC request id (string or 32-bit integer)
#pragma once

#include <nlohmann/json.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <variant>

namespace ngdef
{

/**
 * Opaque request identifier.
 *
 * Echoed verbatim on the matching response. Only strings and integers that
 * fit in 32 bits are accepted.
 */
class RequestId
{
public:
  RequestId() : value_(int32_t{0}) {}
  explicit RequestId(int32_t v) : value_(v) {}
  explicit RequestId(std::string v) : value_(std::move(v)) {}

  [[nodiscard]] bool is_integer() const noexcept
  {
    return std::holds_alternative<int32_t>(value_);
  }
  [[nodiscard]] bool is_string() const noexcept
  {
    return std::holds_alternative<std::string>(value_);
  }

  [[nodiscard]] int32_t as_integer() const { return std::get<int32_t>(value_); }
  [[nodiscard]] const std::string & as_string() const { return std::get<std::string>(value_); }

  [[nodiscard]] nlohmann::json to_json() const;
  [[nodiscard]] std::string to_string() const;

  /// Accepts a JSON string or a 32-bit integer; anything else is rejected.
  [[nodiscard]] static std::optional<RequestId> from_json(const nlohmann::json & j);

  [[nodiscard]] bool operator==(const RequestId & other) const { return value_ == other.value_; }
  [[nodiscard]] bool operator!=(const RequestId & other) const { return value_ != other.value_; }

private:
  std::variant<int32_t, std::string> value_;
};

}  // namespace ngdef
