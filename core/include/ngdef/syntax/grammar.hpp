// ngdef/syntax/grammar.hpp - Pluggable grammar frontends
//
// A Grammar bundles a tree-sitter language with parse and query entry points.
// The resolver only talks to this interface, so adding a grammar means adding
// a language entry point and nothing else.
//
#pragma once

#include <tree_sitter/api.h>

#include <string>
#include <string_view>
#include <vector>

#include "ngdef/syntax/ts_ll.hpp"

namespace ngdef::syntax
{

// NOTE: Entry points are provided by the installed tree-sitter grammar
// libraries (see CMakeLists.txt).
extern "C" const TSLanguage * tree_sitter_html();
extern "C" const TSLanguage * tree_sitter_javascript();
extern "C" const TSLanguage * tree_sitter_typescript();

class Grammar
{
public:
  Grammar(std::string name, const TSLanguage * language);

  [[nodiscard]] const std::string & name() const noexcept { return name_; }
  [[nodiscard]] const TSLanguage * language() const noexcept { return language_; }

  /// Parse `text`. The tree is null if tree-sitter gave up.
  [[nodiscard]] ts_ll::Tree parse(std::string_view text) const;

  /// Compile `pattern` and run it over `tree`. Throws RpcError on a bad pattern.
  [[nodiscard]] std::vector<ts_ll::QueryMatch> query(
    const ts_ll::Tree & tree, std::string_view text, std::string_view pattern) const;

  /// Markup (templates)
  [[nodiscard]] static const Grammar & html();
  /// Embedded template expressions
  [[nodiscard]] static const Grammar & javascript();
  /// Companion controller / directive sources
  [[nodiscard]] static const Grammar & typescript();

private:
  std::string name_;
  const TSLanguage * language_ = nullptr;
};

}  // namespace ngdef::syntax
