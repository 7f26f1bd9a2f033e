// ngdef/basic/position.hpp - LSP position / range / location values
//
// Columns are the raw UTF-8 byte columns reported by tree-sitter. No UTF-16
// code unit conversion is performed.
//
#pragma once

#include <nlohmann/json.hpp>

#include <cstdint>
#include <string>

namespace ngdef
{

struct Position
{
  uint32_t line = 0;
  uint32_t character = 0;

  [[nodiscard]] bool operator==(const Position & o) const noexcept
  {
    return line == o.line && character == o.character;
  }
  [[nodiscard]] bool operator!=(const Position & o) const noexcept { return !(*this == o); }
  [[nodiscard]] bool operator<(const Position & o) const noexcept
  {
    return line < o.line || (line == o.line && character < o.character);
  }
  [[nodiscard]] bool operator<=(const Position & o) const noexcept { return !(o < *this); }
};

struct Range
{
  Position start;
  Position end;

  [[nodiscard]] bool operator==(const Range & o) const noexcept
  {
    return start == o.start && end == o.end;
  }
};

struct Location
{
  std::string uri;
  Range range;
};

// nlohmann ADL hooks
void to_json(nlohmann::json & j, const Position & p);
void from_json(const nlohmann::json & j, Position & p);
void to_json(nlohmann::json & j, const Range & r);
void from_json(const nlohmann::json & j, Range & r);
void to_json(nlohmann::json & j, const Location & l);
void from_json(const nlohmann::json & j, Location & l);

}  // namespace ngdef
