// ngdef/vfs/file_store.cpp
#include "ngdef/vfs/file_store.hpp"

#include <fstream>
#include <sstream>

namespace ngdef
{

namespace
{

constexpr std::string_view k_file_prefix = "file://";

bool starts_with(std::string_view s, std::string_view prefix)
{
  return s.size() >= prefix.size() && s.substr(0, prefix.size()) == prefix;
}

int hex_to_int(char c)
{
  if (c >= '0' && c <= '9') return c - '0';
  if (c >= 'a' && c <= 'f') return 10 + (c - 'a');
  if (c >= 'A' && c <= 'F') return 10 + (c - 'A');
  return -1;
}

std::string percent_decode(std::string_view s)
{
  std::string out;
  out.reserve(s.size());
  for (size_t i = 0; i < s.size(); ++i) {
    const char c = s[i];
    if (c == '%' && i + 2 < s.size()) {
      const int hi = hex_to_int(s[i + 1]);
      const int lo = hex_to_int(s[i + 2]);
      if (hi >= 0 && lo >= 0) {
        out.push_back(static_cast<char>((hi << 4) | lo));
        i += 2;
        continue;
      }
    }
    out.push_back(c);
  }
  return out;
}

bool is_unreserved(unsigned char c)
{
  return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9') ||
         c == '-' || c == '.' || c == '_' || c == '~' || c == '/';
}

}  // namespace

std::optional<std::string> DiskFileStore::read(const std::string & path) const
{
  std::ifstream f(path, std::ios::in | std::ios::binary);
  if (!f.is_open()) {
    return std::nullopt;
  }
  std::ostringstream ss;
  ss << f.rdbuf();
  if (f.bad()) {
    return std::nullopt;
  }
  return ss.str();
}

std::optional<std::string> file_uri_to_path(std::string_view uri)
{
  if (!starts_with(uri, k_file_prefix)) {
    return std::nullopt;
  }
  const std::string_view rest = uri.substr(k_file_prefix.size());
  // file://hostname/path is not supported here.
  if (rest.empty() || rest.front() != '/') {
    return std::nullopt;
  }
  return percent_decode(rest);
}

std::string path_to_file_uri(std::string_view path)
{
  static constexpr char k_hex[] = "0123456789ABCDEF";
  std::string out(k_file_prefix);
  for (const char ch : path) {
    const auto c = static_cast<unsigned char>(ch);
    if (is_unreserved(c)) {
      out.push_back(ch);
    } else {
      out.push_back('%');
      out.push_back(k_hex[c >> 4]);
      out.push_back(k_hex[c & 0x0F]);
    }
  }
  return out;
}

std::string_view uri_scheme(std::string_view uri) noexcept
{
  const auto colon = uri.find(':');
  if (colon == std::string_view::npos) {
    return {};
  }
  return uri.substr(0, colon);
}

}  // namespace ngdef
