// ngdef/syntax/ts_ll.hpp - Low-level Tree-sitter wrapper (CST + query access)
#pragma once

#include <tree_sitter/api.h>

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

#include "ngdef/basic/position.hpp"

namespace ngdef::ts_ll
{

//------------------------------------------------------------------------------
// Node - thin wrapper around TSNode
//------------------------------------------------------------------------------
class Node
{
public:
  Node() : node_{} {}
  explicit Node(TSNode n) : node_(n) {}

  [[nodiscard]] bool is_null() const noexcept { return ts_node_is_null(node_); }
  [[nodiscard]] bool has_error() const noexcept { return ts_node_has_error(node_); }

  [[nodiscard]] std::string_view kind() const noexcept
  {
    const char * t = ts_node_type(node_);
    return t ? std::string_view(t) : std::string_view();
  }

  [[nodiscard]] uint32_t start_byte() const noexcept { return ts_node_start_byte(node_); }
  [[nodiscard]] uint32_t end_byte() const noexcept { return ts_node_end_byte(node_); }

  [[nodiscard]] TSPoint start_point() const noexcept { return ts_node_start_point(node_); }
  [[nodiscard]] TSPoint end_point() const noexcept { return ts_node_end_point(node_); }

  /// Zero-based range; columns are byte columns.
  [[nodiscard]] Range range() const noexcept
  {
    const TSPoint s = start_point();
    const TSPoint e = end_point();
    return Range{Position{s.row, s.column}, Position{e.row, e.column}};
  }

  /// Source slice covered by this node. `source` must be the parsed text.
  [[nodiscard]] std::string_view text(std::string_view source) const noexcept
  {
    const uint32_t s = start_byte();
    const uint32_t e = end_byte();
    if (s > e || e > source.size()) {
      return {};
    }
    return source.substr(s, e - s);
  }

  [[nodiscard]] uint32_t child_count() const noexcept { return ts_node_child_count(node_); }
  [[nodiscard]] Node child(uint32_t i) const noexcept { return Node(ts_node_child(node_, i)); }

  [[nodiscard]] Node child_by_field(std::string_view field) const noexcept
  {
    return Node(
      ts_node_child_by_field_name(node_, field.data(), static_cast<uint32_t>(field.size())));
  }

  [[nodiscard]] TSNode raw() const noexcept { return node_; }

private:
  TSNode node_;
};

//------------------------------------------------------------------------------
// Cursor - wrapper around TSTreeCursor
//------------------------------------------------------------------------------
class Cursor
{
public:
  explicit Cursor(Node n) : cursor_(ts_tree_cursor_new(n.raw())) {}
  Cursor(const Cursor &) = delete;
  Cursor & operator=(const Cursor &) = delete;

  ~Cursor() { ts_tree_cursor_delete(&cursor_); }

  [[nodiscard]] Node current_node() const noexcept
  {
    return Node(ts_tree_cursor_current_node(&cursor_));
  }

  [[nodiscard]] bool goto_first_child() noexcept
  {
    return ts_tree_cursor_goto_first_child(&cursor_);
  }
  [[nodiscard]] bool goto_next_sibling() noexcept
  {
    return ts_tree_cursor_goto_next_sibling(&cursor_);
  }

private:
  TSTreeCursor cursor_;
};

//------------------------------------------------------------------------------
// Tree / Parser - RAII wrappers
//------------------------------------------------------------------------------
class Tree
{
public:
  explicit Tree(TSTree * t = nullptr) : tree_(t) {}
  Tree(const Tree &) = delete;
  Tree & operator=(const Tree &) = delete;

  Tree(Tree && other) noexcept : tree_(other.tree_) { other.tree_ = nullptr; }
  Tree & operator=(Tree && other) noexcept
  {
    if (this != &other) {
      reset();
      tree_ = other.tree_;
      other.tree_ = nullptr;
    }
    return *this;
  }

  ~Tree() { reset(); }

  void reset(TSTree * t = nullptr)
  {
    if (tree_) ts_tree_delete(tree_);
    tree_ = t;
  }

  [[nodiscard]] bool is_null() const noexcept { return tree_ == nullptr; }

  [[nodiscard]] Node root_node() const noexcept
  {
    return tree_ ? Node(ts_tree_root_node(tree_)) : Node();
  }

private:
  TSTree * tree_ = nullptr;
};

class Parser
{
public:
  /// Throws RpcError (internal) if the language cannot be loaded.
  explicit Parser(const TSLanguage * language);
  Parser(const Parser &) = delete;
  Parser & operator=(const Parser &) = delete;
  ~Parser();

  /// Parse UTF-8 text. The returned tree is null if parsing was aborted.
  [[nodiscard]] Tree parse_string(std::string_view source) const;

private:
  TSParser * parser_ = nullptr;
};

//------------------------------------------------------------------------------
// Query - compiled structural pattern
//------------------------------------------------------------------------------
struct QueryCapture
{
  std::string name;
  Node node;
};

struct QueryMatch
{
  uint32_t pattern_index = 0;
  std::vector<QueryCapture> captures;

  /// First capture with the given name, or a null node.
  [[nodiscard]] Node capture(std::string_view name) const noexcept;
};

class Query
{
public:
  /// Compile a query. Throws RpcError (internal) on a malformed pattern.
  Query(const TSLanguage * language, std::string_view source);
  Query(const Query &) = delete;
  Query & operator=(const Query &) = delete;
  ~Query();

  /**
   * Run the query over `root`, in document order.
   *
   * Text predicates `#eq?` and `#not-eq?` are evaluated against `source`;
   * matches failing them are dropped. Other predicates are rejected at
   * compile time.
   */
  [[nodiscard]] std::vector<QueryMatch> matches(Node root, std::string_view source) const;

private:
  struct TextPredicate
  {
    bool negate = false;
    std::string capture;
    // Either a literal or a second capture.
    std::string literal;
    std::string other_capture;
  };

  [[nodiscard]] bool satisfies(
    const QueryMatch & m, const std::vector<TextPredicate> & preds,
    std::string_view source) const;

  TSQuery * query_ = nullptr;
  std::vector<std::vector<TextPredicate>> predicates_;  // per pattern
};

/// True if `p` lies in the half-open span [start, end) of `n`.
[[nodiscard]] bool covers(Node n, TSPoint p) noexcept;

}  // namespace ngdef::ts_ll
