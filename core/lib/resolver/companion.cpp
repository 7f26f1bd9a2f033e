// ngdef/resolver/companion.cpp
#include "ngdef/resolver/companion.hpp"

#include <cctype>
#include <utility>

namespace ngdef::resolver
{

std::string pascal_case_join(std::string_view hyphenated)
{
  std::string out;
  out.reserve(hyphenated.size());

  size_t start = 0;
  while (start <= hyphenated.size()) {
    size_t end = hyphenated.find('-', start);
    if (end == std::string_view::npos) {
      end = hyphenated.size();
    }
    const std::string_view segment = hyphenated.substr(start, end - start);
    if (!segment.empty()) {
      out.push_back(static_cast<char>(std::toupper(static_cast<unsigned char>(segment.front()))));
      out.append(segment.substr(1));
    }
    start = end + 1;
  }
  return out;
}

std::vector<std::string> companion_candidates(std::string_view markup_path)
{
  std::vector<std::string> out;

  if (
    markup_path.size() < k_markup_extension.size() ||
    markup_path.substr(markup_path.size() - k_markup_extension.size()) != k_markup_extension) {
    return out;
  }
  const std::string_view without_ext =
    markup_path.substr(0, markup_path.size() - k_markup_extension.size());

  const auto slash = without_ext.rfind('/');
  if (slash == std::string_view::npos) {
    return out;
  }
  const std::string_view dir = without_ext.substr(0, slash);
  const std::string stem = pascal_case_join(without_ext.substr(slash + 1));
  if (stem.empty()) {
    return out;
  }

  out.reserve(k_companion_suffixes.size());
  for (const auto suffix : k_companion_suffixes) {
    std::string candidate(dir);
    candidate.push_back('/');
    candidate += stem;
    candidate += suffix;
    candidate += k_companion_extension;
    out.push_back(std::move(candidate));
  }
  return out;
}

}  // namespace ngdef::resolver
