// ngdef/resolver/definition_resolver.cpp
#include "ngdef/resolver/definition_resolver.hpp"

#include <fmt/core.h>

#include <utility>
#include <vector>

#include "ngdef/basic/error.hpp"
#include "ngdef/driver/logging.hpp"
#include "ngdef/resolver/companion.hpp"
#include "ngdef/syntax/queries.hpp"
#include "ngdef/syntax/ts_ll.hpp"

namespace ngdef::resolver
{

namespace
{

bool point_in_closed_span(ts_ll::Node n, TSPoint p)
{
  const TSPoint s = n.start_point();
  const TSPoint e = n.end_point();
  const bool after_start = s.row < p.row || (s.row == p.row && s.column <= p.column);
  const bool before_end = p.row < e.row || (p.row == e.row && p.column <= e.column);
  return after_start && before_end;
}

// Smallest node covering `p`, found by always descending into the first
// child that covers it. Null if no child of the root covers `p`.
ts_ll::Node smallest_covering_node(ts_ll::Node root, TSPoint p)
{
  ts_ll::Node best;
  ts_ll::Cursor cursor(root);
  while (cursor.goto_first_child()) {
    bool found = false;
    do {
      const ts_ll::Node n = cursor.current_node();
      if (ts_ll::covers(n, p)) {
        best = n;
        found = true;
        break;
      }
    } while (cursor.goto_next_sibling());
    if (!found) {
      break;
    }
  }
  return best;
}

// Translate a point inside a fragment back to the enclosing document.
Position to_document(TSPoint fragment_point, TSPoint fragment_origin)
{
  if (fragment_point.row == 0) {
    return Position{fragment_origin.row, fragment_origin.column + fragment_point.column};
  }
  return Position{fragment_origin.row + fragment_point.row, fragment_point.column};
}

bool is_non_public_field(ts_ll::Node definition, std::string_view source)
{
  for (uint32_t i = 0; i < definition.child_count(); ++i) {
    const ts_ll::Node child = definition.child(i);
    if (child.kind() == "accessibility_modifier") {
      const auto text = child.text(source);
      return text == "private" || text == "protected";
    }
  }
  return false;
}

}  // namespace

DefinitionResolver::DefinitionResolver(
  const FileStore & files, std::shared_ptr<spdlog::logger> logger,
  const syntax::Grammar & markup, const syntax::Grammar & expression,
  const syntax::Grammar & source)
: files_(files),
  logger_(logger ? std::move(logger) : null_logger()),
  markup_(markup),
  expression_(expression),
  source_(source)
{
}

std::optional<Location> DefinitionResolver::resolve(std::string_view uri, Position position) const
{
  logger_->debug("definition: uri={} line={} character={}", uri, position.line, position.character);

  const auto path = file_uri_to_path(uri);
  if (!path) {
    throw RpcError(Error::invalid_request(
      fmt::format("unsupported URI '{}' (scheme '{}')", uri, uri_scheme(uri))));
  }

  // 1. Companion candidates
  const auto candidates = companion_candidates(*path);
  if (candidates.empty()) {
    logger_->debug("definition: '{}' has no companion candidates", *path);
    return std::nullopt;
  }

  // 2. Cursor -> vm.<property>
  const auto markup = files_.read(*path);
  if (!markup) {
    throw RpcError(Error::invalid_request(fmt::format("cannot read '{}'", *path)));
  }
  const auto access = find_view_model_access(*markup, position);
  if (!access) {
    return std::nullopt;
  }

  // 3. First readable companion. Later candidates are never consulted,
  //    even if this one has no matching field.
  std::optional<std::string> companion_text;
  std::string companion_path;
  for (const auto & candidate : candidates) {
    companion_text = files_.read(candidate);
    if (companion_text) {
      companion_path = candidate;
      break;
    }
    logger_->trace("definition: companion candidate '{}' not readable", candidate);
  }
  if (!companion_text) {
    logger_->debug("definition: no companion file for '{}'", *path);
    return std::nullopt;
  }
  logger_->debug("definition: companion '{}'", companion_path);

  // 4. Field declaration
  const auto range = find_property_definition(*companion_text, access->property);
  if (!range) {
    logger_->debug(
      "definition: no public field '{}' in '{}'", access->property, companion_path);
    return std::nullopt;
  }

  logger_->debug(
    "definition: '{}' -> {}:{}:{}", access->property, companion_path, range->start.line,
    range->start.character);
  return Location{path_to_file_uri(companion_path), *range};
}

std::optional<ViewModelAccess> DefinitionResolver::find_view_model_access(
  std::string_view markup_text, Position position) const
{
  const ts_ll::Tree markup_tree = markup_.parse(markup_text);
  if (markup_tree.is_null()) {
    logger_->debug("definition: {} parse failed", markup_.name());
    return std::nullopt;
  }

  const TSPoint cursor{position.line, position.character};
  const ts_ll::Node node = smallest_covering_node(markup_tree.root_node(), cursor);
  if (node.is_null()) {
    logger_->debug("definition: no node covers the cursor");
    return std::nullopt;
  }

  const std::string_view fragment = node.text(markup_text);
  logger_->trace("definition: covering {} node '{}'", node.kind(), fragment);

  const ts_ll::Tree fragment_tree = expression_.parse(fragment);
  if (fragment_tree.is_null()) {
    logger_->debug("definition: {} parse failed", expression_.name());
    return std::nullopt;
  }

  const auto matches = expression_.query(fragment_tree, fragment, syntax::k_vm_member_query);
  if (matches.empty()) {
    logger_->debug("definition: no vm member access under the cursor");
    return std::nullopt;
  }

  // Prefer the access whose property name holds the cursor.
  const TSPoint origin = node.start_point();
  const TSPoint relative{
    cursor.row - origin.row, cursor.row == origin.row ? cursor.column - origin.column
                                                      : cursor.column};
  const ts_ll::QueryMatch * chosen = &matches.front();
  for (const auto & m : matches) {
    const ts_ll::Node prop = m.capture(syntax::k_capture_property);
    if (!prop.is_null() && point_in_closed_span(prop, relative)) {
      chosen = &m;
      break;
    }
  }

  const ts_ll::Node prop = chosen->capture(syntax::k_capture_property);
  if (prop.is_null()) {
    return std::nullopt;
  }

  ViewModelAccess access;
  access.property = std::string(prop.text(fragment));
  access.range = Range{
    to_document(prop.start_point(), origin), to_document(prop.end_point(), origin)};
  logger_->debug("definition: captured vm.{}", access.property);
  return access;
}

std::optional<Range> DefinitionResolver::find_property_definition(
  std::string_view source_text, std::string_view property) const
{
  const ts_ll::Tree tree = source_.parse(source_text);
  if (tree.is_null()) {
    logger_->debug("definition: {} parse failed", source_.name());
    return std::nullopt;
  }

  const auto matches = source_.query(tree, source_text, syntax::k_public_field_query);
  for (const auto & m : matches) {
    const ts_ll::Node name = m.capture(syntax::k_capture_name);
    const ts_ll::Node definition = m.capture(syntax::k_capture_definition);
    if (name.is_null() || definition.is_null()) {
      continue;
    }
    if (is_non_public_field(definition, source_text)) {
      continue;
    }
    if (name.text(source_text) == property) {
      return name.range();
    }
  }
  return std::nullopt;
}

}  // namespace ngdef::resolver
