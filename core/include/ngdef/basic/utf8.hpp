// ngdef/basic/utf8.hpp - Lossy UTF-8 decoding
#pragma once

#include <string>
#include <string_view>

namespace ngdef
{

/**
 * Return `bytes` with every invalid UTF-8 sequence replaced by U+FFFD.
 *
 * Overlong encodings, surrogates and truncated sequences are invalid. Valid
 * input is returned unchanged.
 */
[[nodiscard]] std::string decode_utf8_lossy(std::string_view bytes);

}  // namespace ngdef
