#include <gtest/gtest.h>

#include <string>
#include <string_view>

#include "ngdef/basic/error.hpp"
#include "ngdef/syntax/grammar.hpp"
#include "ngdef/syntax/queries.hpp"
#include "ngdef/syntax/ts_ll.hpp"

using ngdef::RpcError;
using ngdef::syntax::Grammar;

TEST(SyntaxGrammar, ParsesEachLanguage)
{
  for (const Grammar * g : {&Grammar::html(), &Grammar::javascript(), &Grammar::typescript()}) {
    const auto tree = g->parse("x");
    ASSERT_FALSE(tree.is_null()) << g->name();
    EXPECT_FALSE(tree.root_node().is_null()) << g->name();
  }
}

TEST(SyntaxGrammar, VmQueryFiltersByObjectName)
{
  const Grammar & js = Grammar::javascript();
  const std::string_view src = "vm.a; ctrl.b; vm.c.d; this.vm.e;";
  const auto tree = js.parse(src);
  const auto matches = js.query(tree, src, ngdef::syntax::k_vm_member_query);

  ASSERT_EQ(matches.size(), 2U);
  EXPECT_EQ(matches[0].capture("property").text(src), "a");
  EXPECT_EQ(matches[1].capture("property").text(src), "c");
  EXPECT_EQ(matches[0].capture("object").text(src), "vm");
  EXPECT_TRUE(matches[0].capture("missing").is_null());
}

TEST(SyntaxGrammar, NotEqPredicateInvertsFilter)
{
  const Grammar & js = Grammar::javascript();
  const std::string_view src = "vm.a; ctrl.b;";
  const auto tree = js.parse(src);
  const auto matches = js.query(
    tree, src,
    "(member_expression object: (identifier) @o property: (property_identifier) @p"
    " (#not-eq? @o \"vm\"))");

  ASSERT_EQ(matches.size(), 1U);
  EXPECT_EQ(matches[0].capture("p").text(src), "b");
}

TEST(SyntaxGrammar, FieldQueryCapturesDefinitionAndName)
{
  const Grammar & ts = Grammar::typescript();
  const std::string_view src = "class A {\n  x = 1;\n  y: string;\n  z() {}\n}\n";
  const auto tree = ts.parse(src);
  const auto matches = ts.query(tree, src, ngdef::syntax::k_public_field_query);

  ASSERT_EQ(matches.size(), 2U);
  EXPECT_EQ(matches[0].capture("name").text(src), "x");
  EXPECT_EQ(matches[0].capture("definition").kind(), "public_field_definition");
  EXPECT_EQ(matches[1].capture("name").text(src), "y");
  EXPECT_EQ(matches[1].capture("name").range().start, (ngdef::Position{2, 2}));
}

TEST(SyntaxGrammar, MalformedQueryIsInternalError)
{
  const Grammar & js = Grammar::javascript();
  const auto tree = js.parse("vm.a;");
  try {
    (void)js.query(tree, "vm.a;", "(member_expression");
    ADD_FAILURE() << "expected RpcError";
  } catch (const RpcError & e) {
    EXPECT_EQ(e.error().code(), ngdef::k_internal_error);
  }
}

TEST(SyntaxGrammar, UnsupportedPredicateIsRejected)
{
  const Grammar & js = Grammar::javascript();
  const auto tree = js.parse("vm.a;");
  EXPECT_THROW(
    (void)js.query(tree, "vm.a;", "((identifier) @i (#match? @i \"^v\"))"), RpcError);
}

TEST(SyntaxTsLl, CoversIsHalfOpen)
{
  const Grammar & html = Grammar::html();
  const std::string_view src = "<p>hi</p>";
  const auto tree = html.parse(src);
  const auto root = tree.root_node();
  ASSERT_GT(root.child_count(), 0U);
  const auto element = root.child(0);
  EXPECT_EQ(element.kind(), "element");

  EXPECT_TRUE(ngdef::ts_ll::covers(element, TSPoint{0, 0}));
  EXPECT_TRUE(ngdef::ts_ll::covers(element, TSPoint{0, 8}));
  EXPECT_FALSE(ngdef::ts_ll::covers(element, TSPoint{0, 9}));
  EXPECT_FALSE(ngdef::ts_ll::covers(element, TSPoint{1, 0}));
}

TEST(SyntaxTsLl, CursorWalksChildrenInOrder)
{
  const Grammar & html = Grammar::html();
  const std::string_view src = "<p>hi</p>";
  const auto tree = html.parse(src);

  ngdef::ts_ll::Cursor cursor(tree.root_node().child(0));
  ASSERT_TRUE(cursor.goto_first_child());
  EXPECT_EQ(cursor.current_node().kind(), "start_tag");
  ASSERT_TRUE(cursor.goto_next_sibling());
  EXPECT_EQ(cursor.current_node().kind(), "text");
  EXPECT_EQ(cursor.current_node().text(src), "hi");
  ASSERT_TRUE(cursor.goto_next_sibling());
  EXPECT_EQ(cursor.current_node().kind(), "end_tag");
  EXPECT_FALSE(cursor.goto_next_sibling());
}

TEST(SyntaxTsLl, TreeIsMovable)
{
  auto a = Grammar::javascript().parse("1;");
  ngdef::ts_ll::Tree b(std::move(a));
  EXPECT_TRUE(a.is_null());
  EXPECT_FALSE(b.is_null());
}
