// ngdef/protocol/transport.hpp - Content-Length framed message reader / writer
#pragma once

#include <cstddef>
#include <cstdint>
#include <istream>
#include <ostream>
#include <string>

#include "ngdef/protocol/message.hpp"

namespace ngdef
{

inline constexpr const char * k_content_length_header = "Content-Length";

/// Header lines longer than this are framing errors.
inline constexpr size_t k_max_header_line = 8 * 1024;

/// Bodies are read in chunks of this size, never allocated up front.
inline constexpr size_t k_body_chunk_size = 64 * 1024;

/**
 * Reads one framed message at a time from a byte stream.
 *
 * Header lines are `name: value\r\n`, terminated by a line holding only
 * `\r\n`. Only Content-Length is interpreted. The body is decoded as lossy
 * UTF-8 before JSON decoding.
 *
 * After a malformed header block the reader skips input up to the next
 * `Content-Length:` so one bad frame does not take the rest of the stream
 * with it.
 */
class MessageReader
{
public:
  explicit MessageReader(std::istream & in) : in_(in) {}

  MessageReader(const MessageReader &) = delete;
  MessageReader & operator=(const MessageReader &) = delete;

  /// Read and decode the next message. Never throws.
  [[nodiscard]] MessageResult read();

private:
  enum class LineStatus : uint8_t {
    Ok,
    Eof,
    TooLong,  // rest of the line was consumed and dropped
  };

  LineStatus read_line(std::string & line);
  MessageResult header_failure(std::string message);

  std::istream & in_;
  bool resync_ = false;
};

/**
 * Writes framed messages.
 *
 * Emits `Content-Length: <n>\r\n\r\n<body>` where n is the byte length of
 * the encoded body, then flushes.
 */
class MessageWriter
{
public:
  explicit MessageWriter(std::ostream & out) : out_(out) {}

  MessageWriter(const MessageWriter &) = delete;
  MessageWriter & operator=(const MessageWriter &) = delete;

  /// Returns false if the underlying stream failed.
  [[nodiscard]] bool write(const Message & msg);

private:
  std::ostream & out_;
};

/// Frame an already-encoded body.
[[nodiscard]] std::string frame_body(const std::string & body);

/// Serialize a message body exactly as MessageWriter does.
[[nodiscard]] std::string encode_body(const Message & msg);

}  // namespace ngdef
