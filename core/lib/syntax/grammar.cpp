// ngdef/syntax/grammar.cpp
#include "ngdef/syntax/grammar.hpp"

#include <utility>

namespace ngdef::syntax
{

Grammar::Grammar(std::string name, const TSLanguage * language)
: name_(std::move(name)), language_(language)
{
}

ts_ll::Tree Grammar::parse(std::string_view text) const
{
  const ts_ll::Parser parser(language_);
  return parser.parse_string(text);
}

std::vector<ts_ll::QueryMatch> Grammar::query(
  const ts_ll::Tree & tree, std::string_view text, std::string_view pattern) const
{
  const ts_ll::Query q(language_, pattern);
  return q.matches(tree.root_node(), text);
}

const Grammar & Grammar::html()
{
  static const Grammar g("html", tree_sitter_html());
  return g;
}

const Grammar & Grammar::javascript()
{
  static const Grammar g("javascript", tree_sitter_javascript());
  return g;
}

const Grammar & Grammar::typescript()
{
  static const Grammar g("typescript", tree_sitter_typescript());
  return g;
}

}  // namespace ngdef::syntax
