// ngdef/protocol/transport.cpp - Framing implementation
#include "ngdef/protocol/transport.hpp"

#include <fmt/core.h>

#include <algorithm>
#include <cctype>
#include <limits>
#include <optional>
#include <string_view>
#include <utility>

#include "ngdef/basic/utf8.hpp"

namespace ngdef
{

namespace
{

std::string_view trim(std::string_view s)
{
  while (!s.empty() && std::isspace(static_cast<unsigned char>(s.front()))) {
    s.remove_prefix(1);
  }
  while (!s.empty() && std::isspace(static_cast<unsigned char>(s.back()))) {
    s.remove_suffix(1);
  }
  return s;
}

std::optional<size_t> parse_content_length(std::string_view value)
{
  value = trim(value);
  if (value.empty()) {
    return std::nullopt;
  }
  size_t n = 0;
  for (const char c : value) {
    if (c < '0' || c > '9') {
      return std::nullopt;
    }
    const auto digit = static_cast<size_t>(c - '0');
    if (n > (std::numeric_limits<size_t>::max() - digit) / 10) {
      return std::nullopt;
    }
    n = n * 10 + digit;
  }
  return n;
}

// RFC 7230 token characters.
bool is_token(std::string_view name)
{
  if (name.empty()) {
    return false;
  }
  for (const char ch : name) {
    const auto c = static_cast<unsigned char>(ch);
    if (std::isalnum(c)) {
      continue;
    }
    if (std::string_view("!#$%&'*+-.^_`|~").find(ch) == std::string_view::npos) {
      return false;
    }
  }
  return true;
}

}  // namespace

MessageReader::LineStatus MessageReader::read_line(std::string & line)
{
  line.clear();
  bool too_long = false;
  char c = 0;
  while (in_.get(c)) {
    if (c == '\n') {
      return too_long ? LineStatus::TooLong : LineStatus::Ok;
    }
    if (line.size() < k_max_header_line) {
      line.push_back(c);
    } else {
      too_long = true;
    }
  }
  // A line cut off by end of stream is dropped.
  return LineStatus::Eof;
}

MessageResult MessageReader::header_failure(std::string message)
{
  resync_ = true;
  return MessageResult::fail(Error::header(std::move(message)));
}

MessageResult MessageReader::read()
{
  std::optional<size_t> content_length;
  std::string line;
  const std::string_view sync_marker = k_content_length_header;

  while (true) {
    const LineStatus status = read_line(line);
    if (status == LineStatus::Eof) {
      return MessageResult::fail(Error::io("end of stream while reading headers"));
    }

    if (resync_) {
      // Drop everything up to the next Content-Length header, which may be
      // glued to the tail of an unread body.
      const auto pos = status == LineStatus::Ok ? line.find(sync_marker) : std::string::npos;
      if (pos == std::string::npos) {
        continue;
      }
      line.erase(0, pos);
      resync_ = false;
    } else if (status == LineStatus::TooLong) {
      return header_failure(fmt::format("header line longer than {} bytes", k_max_header_line));
    }

    // Header terminator: a line consisting only of "\r\n".
    if (line == "\r") {
      break;
    }
    if (!line.empty() && line.back() == '\r') {
      line.pop_back();
    }

    const auto colon = line.find(':');
    if (colon == std::string::npos) {
      return header_failure(fmt::format("header line without ':': '{}'", line));
    }

    const std::string_view name = std::string_view(line).substr(0, colon);
    if (!is_token(name)) {
      return header_failure(fmt::format("invalid header name '{}'", name));
    }
    const std::string_view value = std::string_view(line).substr(colon + 1);
    if (name == k_content_length_header) {
      content_length = parse_content_length(value);
      if (!content_length) {
        return header_failure(fmt::format("invalid Content-Length value '{}'", trim(value)));
      }
    }
  }

  if (!content_length) {
    return header_failure("missing Content-Length header");
  }

  // The declared length is untrusted; grow the buffer only as bytes arrive.
  std::string body;
  size_t remaining = *content_length;
  while (remaining > 0) {
    const size_t want = std::min(remaining, k_body_chunk_size);
    const size_t offset = body.size();
    body.resize(offset + want);
    in_.read(body.data() + offset, static_cast<std::streamsize>(want));
    const auto got = static_cast<size_t>(in_.gcount());
    body.resize(offset + got);
    remaining -= got;
    if (got != want) {
      return MessageResult::fail(Error::io(fmt::format(
        "end of stream after {} of {} body bytes", body.size(), *content_length)));
    }
  }

  return decode_message(decode_utf8_lossy(body));
}

std::string encode_body(const Message & msg)
{
  // Invalid UTF-8 inside string values is replaced rather than thrown.
  return encode_message(msg).dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

std::string frame_body(const std::string & body)
{
  return fmt::format("{}: {}\r\n\r\n{}", k_content_length_header, body.size(), body);
}

bool MessageWriter::write(const Message & msg)
{
  out_ << frame_body(encode_body(msg));
  out_.flush();
  return static_cast<bool>(out_);
}

}  // namespace ngdef
