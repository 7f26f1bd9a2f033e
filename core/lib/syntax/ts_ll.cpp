// ngdef/syntax/ts_ll.cpp - Low-level Tree-sitter wrapper implementation
#include "ngdef/syntax/ts_ll.hpp"

#include <fmt/core.h>

#include <utility>

#include "ngdef/basic/error.hpp"

namespace ngdef::ts_ll
{

namespace
{

std::string_view query_error_name(TSQueryError err)
{
  switch (err) {
    case TSQueryErrorNone:
      return "none";
    case TSQueryErrorSyntax:
      return "syntax";
    case TSQueryErrorNodeType:
      return "unknown node type";
    case TSQueryErrorField:
      return "unknown field";
    case TSQueryErrorCapture:
      return "unknown capture";
    case TSQueryErrorStructure:
      return "impossible pattern";
    case TSQueryErrorLanguage:
      return "language mismatch";
  }
  return "unknown";
}

// RAII guard for TSQueryCursor.
class QueryCursor
{
public:
  QueryCursor() : cursor_(ts_query_cursor_new()) {}
  QueryCursor(const QueryCursor &) = delete;
  QueryCursor & operator=(const QueryCursor &) = delete;
  ~QueryCursor()
  {
    if (cursor_) ts_query_cursor_delete(cursor_);
  }

  [[nodiscard]] TSQueryCursor * get() const noexcept { return cursor_; }

private:
  TSQueryCursor * cursor_ = nullptr;
};

bool point_le(TSPoint a, TSPoint b)
{
  return a.row < b.row || (a.row == b.row && a.column <= b.column);
}

bool point_lt(TSPoint a, TSPoint b)
{
  return a.row < b.row || (a.row == b.row && a.column < b.column);
}

}  // namespace

//------------------------------------------------------------------------------
// Parser
//------------------------------------------------------------------------------

Parser::Parser(const TSLanguage * language)
{
  parser_ = ts_parser_new();
  if (parser_ == nullptr) {
    throw RpcError(Error::internal("ts_parser_new() failed"));
  }
  if (language == nullptr || !ts_parser_set_language(parser_, language)) {
    ts_parser_delete(parser_);
    parser_ = nullptr;
    throw RpcError(Error::internal("tree-sitter language could not be loaded"));
  }
}

Parser::~Parser()
{
  if (parser_) ts_parser_delete(parser_);
  parser_ = nullptr;
}

Tree Parser::parse_string(std::string_view source) const
{
  // Tree-sitter consumes bytes; grammars expect UTF-8.
  return Tree(ts_parser_parse_string(
    parser_, /*old_tree*/ nullptr, source.data(), static_cast<uint32_t>(source.size())));
}

//------------------------------------------------------------------------------
// Query
//------------------------------------------------------------------------------

Node QueryMatch::capture(std::string_view name) const noexcept
{
  for (const auto & c : captures) {
    if (c.name == name) {
      return c.node;
    }
  }
  return Node();
}

Query::Query(const TSLanguage * language, std::string_view source)
{
  uint32_t err_off = 0;
  TSQueryError err_type = TSQueryErrorNone;
  query_ = ts_query_new(
    language, source.data(), static_cast<uint32_t>(source.size()), &err_off, &err_type);
  if (query_ == nullptr) {
    throw RpcError(Error::internal(
      "malformed structural query",
      fmt::format("{} error at offset {}", query_error_name(err_type), err_off)));
  }

  const uint32_t pattern_count = ts_query_pattern_count(query_);
  predicates_.resize(pattern_count);

  auto string_value = [&](uint32_t id) {
    uint32_t len = 0;
    const char * s = ts_query_string_value_for_id(query_, id, &len);
    return std::string(s, len);
  };
  auto capture_name = [&](uint32_t id) {
    uint32_t len = 0;
    const char * s = ts_query_capture_name_for_id(query_, id, &len);
    return std::string(s, len);
  };

  for (uint32_t p = 0; p < pattern_count; ++p) {
    uint32_t step_count = 0;
    const TSQueryPredicateStep * steps = ts_query_predicates_for_pattern(query_, p, &step_count);

    uint32_t i = 0;
    while (i < step_count) {
      // Collect one predicate up to its Done step.
      uint32_t end = i;
      while (end < step_count && steps[end].type != TSQueryPredicateStepTypeDone) {
        ++end;
      }

      const uint32_t argc = end - i;
      if (argc != 3 || steps[i].type != TSQueryPredicateStepTypeString) {
        ts_query_delete(query_);
        throw RpcError(Error::internal("unsupported query predicate shape"));
      }

      const std::string op = string_value(steps[i].value_id);
      if (op != "eq?" && op != "not-eq?") {
        ts_query_delete(query_);
        throw RpcError(Error::internal("unsupported query predicate", op));
      }
      if (steps[i + 1].type != TSQueryPredicateStepTypeCapture) {
        ts_query_delete(query_);
        throw RpcError(Error::internal("first argument of #" + op + " must be a capture"));
      }

      TextPredicate pred;
      pred.negate = (op == "not-eq?");
      pred.capture = capture_name(steps[i + 1].value_id);
      if (steps[i + 2].type == TSQueryPredicateStepTypeCapture) {
        pred.other_capture = capture_name(steps[i + 2].value_id);
      } else {
        pred.literal = string_value(steps[i + 2].value_id);
      }
      predicates_[p].push_back(std::move(pred));

      i = end + 1;
    }
  }
}

Query::~Query()
{
  if (query_) ts_query_delete(query_);
}

bool Query::satisfies(
  const QueryMatch & m, const std::vector<TextPredicate> & preds, std::string_view source) const
{
  for (const auto & pred : preds) {
    const Node lhs = m.capture(pred.capture);
    if (lhs.is_null()) {
      continue;
    }
    std::string_view rhs = pred.literal;
    if (!pred.other_capture.empty()) {
      const Node other = m.capture(pred.other_capture);
      if (other.is_null()) {
        continue;
      }
      rhs = other.text(source);
    }
    const bool equal = lhs.text(source) == rhs;
    if (equal == pred.negate) {
      return false;
    }
  }
  return true;
}

std::vector<QueryMatch> Query::matches(Node root, std::string_view source) const
{
  std::vector<QueryMatch> out;
  if (root.is_null()) {
    return out;
  }

  const QueryCursor cursor;
  if (cursor.get() == nullptr) {
    throw RpcError(Error::internal("ts_query_cursor_new() failed"));
  }
  ts_query_cursor_exec(cursor.get(), query_, root.raw());

  TSQueryMatch match;
  while (ts_query_cursor_next_match(cursor.get(), &match)) {
    QueryMatch m;
    m.pattern_index = match.pattern_index;
    for (uint32_t i = 0; i < match.capture_count; ++i) {
      const TSQueryCapture cap = match.captures[i];
      uint32_t name_len = 0;
      const char * name = ts_query_capture_name_for_id(query_, cap.index, &name_len);
      if (name == nullptr || name_len == 0) {
        continue;
      }
      m.captures.push_back(QueryCapture{std::string(name, name_len), Node(cap.node)});
    }
    if (satisfies(m, predicates_[m.pattern_index], source)) {
      out.push_back(std::move(m));
    }
  }
  return out;
}

bool covers(Node n, TSPoint p) noexcept
{
  if (n.is_null()) {
    return false;
  }
  return point_le(n.start_point(), p) && point_lt(p, n.end_point());
}

}  // namespace ngdef::ts_ll
