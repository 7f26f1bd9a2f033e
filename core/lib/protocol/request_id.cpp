// ngdef/protocol/request_id.cpp
#include "ngdef/protocol/request_id.hpp"

#include <limits>

namespace ngdef
{

nlohmann::json RequestId::to_json() const
{
  if (is_integer()) {
    return nlohmann::json(as_integer());
  }
  return nlohmann::json(as_string());
}

std::string RequestId::to_string() const
{
  if (is_integer()) {
    return std::to_string(as_integer());
  }
  return "\"" + as_string() + "\"";
}

std::optional<RequestId> RequestId::from_json(const nlohmann::json & j)
{
  if (j.is_string()) {
    return RequestId(j.get<std::string>());
  }
  if (j.is_number_integer()) {
    // number_unsigned is also number_integer in nlohmann::json
    if (j.is_number_unsigned()) {
      const auto v = j.get<uint64_t>();
      if (v > static_cast<uint64_t>(std::numeric_limits<int32_t>::max())) {
        return std::nullopt;
      }
      return RequestId(static_cast<int32_t>(v));
    }
    const auto v = j.get<int64_t>();
    if (v < std::numeric_limits<int32_t>::min() || v > std::numeric_limits<int32_t>::max()) {
      return std::nullopt;
    }
    return RequestId(static_cast<int32_t>(v));
  }
  return std::nullopt;
}

}  // namespace ngdef
