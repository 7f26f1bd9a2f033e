// ngdef/basic/utf8.cpp
#include "ngdef/basic/utf8.hpp"

#include <cstdint>

namespace ngdef
{

namespace
{

constexpr std::string_view k_replacement = "\xEF\xBF\xBD";

bool is_continuation(unsigned char b)
{
  return (b & 0xC0) == 0x80;
}

// Length of the valid sequence starting at i, or 0 if invalid.
size_t valid_sequence_length(std::string_view s, size_t i)
{
  const auto b0 = static_cast<unsigned char>(s[i]);
  if (b0 < 0x80) return 1;

  size_t len = 0;
  uint32_t cp = 0;
  if ((b0 & 0xE0) == 0xC0) {
    len = 2;
    cp = b0 & 0x1F;
  } else if ((b0 & 0xF0) == 0xE0) {
    len = 3;
    cp = b0 & 0x0F;
  } else if ((b0 & 0xF8) == 0xF0) {
    len = 4;
    cp = b0 & 0x07;
  } else {
    return 0;
  }

  if (i + len > s.size()) return 0;
  for (size_t k = 1; k < len; ++k) {
    const auto b = static_cast<unsigned char>(s[i + k]);
    if (!is_continuation(b)) return 0;
    cp = (cp << 6) | (b & 0x3F);
  }

  // Overlong forms, surrogates and out-of-range code points.
  if (len == 2 && cp < 0x80) return 0;
  if (len == 3 && cp < 0x800) return 0;
  if (len == 4 && (cp < 0x10000 || cp > 0x10FFFF)) return 0;
  if (cp >= 0xD800 && cp <= 0xDFFF) return 0;
  return len;
}

}  // namespace

std::string decode_utf8_lossy(std::string_view bytes)
{
  std::string out;
  out.reserve(bytes.size());

  size_t i = 0;
  while (i < bytes.size()) {
    const size_t len = valid_sequence_length(bytes, i);
    if (len == 0) {
      out.append(k_replacement);
      ++i;
      // Skip stray continuation bytes belonging to the broken sequence.
      while (i < bytes.size() && is_continuation(static_cast<unsigned char>(bytes[i]))) {
        ++i;
      }
      continue;
    }
    out.append(bytes.substr(i, len));
    i += len;
  }
  return out;
}

}  // namespace ngdef
