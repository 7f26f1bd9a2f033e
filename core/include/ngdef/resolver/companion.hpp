// ngdef/resolver/companion.hpp - Companion source file naming convention
//
// A template `<dir>/foo-bar.html` is backed by one of
//   <dir>/FooBarController.ts
//   <dir>/FooBarDirective.ts
//   <dir>/FooBar.ts
// tried in that order.
//
#pragma once

#include <array>
#include <string>
#include <string_view>
#include <vector>

namespace ngdef::resolver
{

inline constexpr std::string_view k_markup_extension = ".html";
inline constexpr std::string_view k_companion_extension = ".ts";
inline constexpr std::array<std::string_view, 3> k_companion_suffixes = {
  "Controller", "Directive", ""};

/// "foo-bar" -> "FooBar". Empty segments contribute nothing.
[[nodiscard]] std::string pascal_case_join(std::string_view hyphenated);

/**
 * Candidate companion paths for a markup path, in lookup order.
 *
 * Empty if the path does not end in `.html`, has no '/' separator, or has
 * an empty file stem.
 */
[[nodiscard]] std::vector<std::string> companion_candidates(std::string_view markup_path);

}  // namespace ngdef::resolver
