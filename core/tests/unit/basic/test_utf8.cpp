#include <gtest/gtest.h>

#include <string>

#include "ngdef/basic/utf8.hpp"

using ngdef::decode_utf8_lossy;

namespace
{

const std::string k_replacement = "\xEF\xBF\xBD";

}  // namespace

TEST(BasicUtf8, ValidInputIsUnchanged)
{
  const std::string s = "plain \xC3\xA9 \xE6\x97\xA5 \xF0\x9F\x98\x80";
  EXPECT_EQ(decode_utf8_lossy(s), s);
  EXPECT_EQ(decode_utf8_lossy(""), "");
}

TEST(BasicUtf8, InvalidBytesAreReplaced)
{
  EXPECT_EQ(decode_utf8_lossy("a\xFF" "b"), "a" + k_replacement + "b");
  // Lone continuation byte
  EXPECT_EQ(decode_utf8_lossy("\x80"), k_replacement);
  // Truncated three-byte sequence at end of input
  EXPECT_EQ(decode_utf8_lossy("x\xE6\x97"), "x" + k_replacement);
}

TEST(BasicUtf8, OverlongAndSurrogatesAreInvalid)
{
  EXPECT_NE(decode_utf8_lossy("\xC0\xAF"), "\xC0\xAF");
  EXPECT_NE(decode_utf8_lossy("\xED\xA0\x80"), "\xED\xA0\x80");
}
