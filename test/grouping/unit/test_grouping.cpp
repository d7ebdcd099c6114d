/***
 * Name: test_grouping
 * Purpose: Bracket collapsing, flatten round-trip, angle detection and bracket errors.
 */
#include <gtest/gtest.h>
#include <string>
#include <vector>
#include "grouping/Flatten.h"
#include "grouping/TokenGrouper.h"
#include "nestport/exceptions/unbalanced_bracket_error.h"
#include "util/Pipeline.h"

using namespace nestport;
using group::GroupKind;
using TK = lex::TokenKind;

static exceptions::UnbalancedBracketError groupFailure(const std::string& src) {
  try {
    (void)testutil::groupAll(src);
  } catch (const exceptions::UnbalancedBracketError& ex) {
    return ex;
  }
  ADD_FAILURE() << "expected UnbalancedBracketError for: " << src;
  return exceptions::UnbalancedBracketError("", "", 0, 0, "");
}

static std::string texts(const std::vector<lex::Token>& toks) {
  std::string out;
  for (const auto& t : toks) {
    out += t.text;
    out += ' ';
  }
  return out;
}

TEST(TokenGrouper, ClassBodyBecomesOneCurlyGroup) {
  auto root = testutil::groupAll("class A { int x; void m() { if (x) { } } }");
  EXPECT_EQ(root.kind, GroupKind::Root);
  ASSERT_EQ(root.children.size(), 3u);
  EXPECT_TRUE(root.children[0].is(TK::Class));
  EXPECT_TRUE(root.children[1].is(TK::Ident));
  ASSERT_TRUE(root.children[2].isGroup(GroupKind::Curly));
  const auto& body = root.children[2].group();
  EXPECT_EQ(body.open.text, "{");
  EXPECT_EQ(body.close.text, "}");
  // int x ; void m ( ) { ... }
  ASSERT_EQ(body.children.size(), 7u);
  EXPECT_TRUE(body.children[5].isGroup(GroupKind::Round));
  EXPECT_TRUE(body.children[6].isGroup(GroupKind::Curly));
}

TEST(TokenGrouper, RootKeepsEndTokenAsClose) {
  auto root = testutil::groupAll("class A {}\n");
  EXPECT_EQ(root.close.kind, TK::End);
  for (const auto& child : root.children) { EXPECT_FALSE(child.is(TK::End)); }
}

TEST(TokenGrouper, FlattenReproducesTokens) {
  const std::string src =
      "package p;\n"
      "class A<T extends Comparable<T>> {\n"
      "  // note\n"
      "  int[] xs = new int[] {1, 2};\n"
      "  Map<String, List<Integer>> m;\n"
      "  boolean f(int a) { return a < 3 && a > 1; }\n"
      "}\n";
  auto toks = testutil::lexAll(src);
  auto root = group::TokenGrouper::group(toks);
  auto flat = group::flatten(root);
  ASSERT_EQ(flat.size() + 1, toks.size());
  for (std::size_t i = 0; i < flat.size(); ++i) {
    EXPECT_EQ(flat[i].kind, toks[i].kind) << "at " << i;
    EXPECT_EQ(flat[i].text, toks[i].text) << "at " << i;
    EXPECT_EQ(flat[i].line, toks[i].line) << "at " << i;
    EXPECT_EQ(flat[i].col, toks[i].col) << "at " << i;
  }
}

TEST(TokenGrouper, NestedTypeArgumentsFormAngleGroups) {
  auto root = testutil::groupAll("Map<String, List<Integer>> m;");
  ASSERT_EQ(root.children.size(), 4u);
  ASSERT_TRUE(root.children[1].isGroup(GroupKind::Angle));
  const auto& outer = root.children[1].group();
  EXPECT_EQ(outer.close.text, ">");
  bool innerAngle = false;
  for (const auto& child : outer.children) {
    if (child.isGroup(GroupKind::Angle)) innerAngle = true;
  }
  EXPECT_TRUE(innerAngle);
}

TEST(TokenGrouper, ComparisonStaysAnOperator) {
  auto root = testutil::groupAll("{ return a < b && c > d; }");
  ASSERT_EQ(root.children.size(), 1u);
  const auto& body = root.children[0].group();
  bool sawLt = false;
  for (const auto& child : body.children) {
    EXPECT_FALSE(child.isGroup(GroupKind::Angle));
    if (child.is(TK::Lt)) sawLt = true;
  }
  EXPECT_TRUE(sawLt);
}

TEST(TokenGrouper, MatchAngleRejectsExpressions) {
  auto toks = testutil::lexAll("a < b + 1 > c");
  EXPECT_EQ(group::TokenGrouper::matchAngle(toks, 1), std::string::npos);
  auto generic = testutil::lexAll("List<int[]> x");
  EXPECT_EQ(group::TokenGrouper::matchAngle(generic, 1), 5u);
}

TEST(TokenGrouper, DescribeNamesTheOpeningBracket) {
  auto root = testutil::groupAll("x (a) [b]");
  ASSERT_EQ(root.children.size(), 3u);
  EXPECT_EQ(group::describe(root.children[0]), "x");
  EXPECT_EQ(group::describe(root.children[1]), "(");
  EXPECT_EQ(group::describe(root.children[2]), "[");
}

TEST(TokenGrouper, BracketsInsideLiteralsAndCommentsIgnored) {
  auto root = testutil::groupAll("class A { String s = \"}\"; /* { */ char c = '('; }");
  ASSERT_EQ(root.children.size(), 3u);
  EXPECT_TRUE(root.children[2].isGroup(GroupKind::Curly));
  EXPECT_EQ(texts(group::flatten(root)).substr(0, 10), "class A { ");
}

TEST(TokenGrouperErrors, UnmatchedClose) {
  auto ex = groupFailure("class A { }\n}");
  EXPECT_EQ(ex.detail(), "unmatched closing bracket");
  EXPECT_EQ(ex.line(), 2);
  EXPECT_EQ(ex.col(), 1);
  EXPECT_EQ(ex.text(), "}");
}

TEST(TokenGrouperErrors, MismatchedCloseNamesTheOpen) {
  auto ex = groupFailure("class A {\n  void m( }\n");
  EXPECT_EQ(ex.detail(), "closing bracket does not match '(' opened at 2:9");
  EXPECT_EQ(ex.line(), 2);
  EXPECT_EQ(ex.col(), 11);
}

TEST(TokenGrouperErrors, UnclosedReportsInnermostOpen) {
  auto ex = groupFailure("class A {\n  void m() {\n    int x;\n");
  EXPECT_EQ(ex.detail(), "unclosed bracket at end of input");
  EXPECT_EQ(ex.line(), 2);
  EXPECT_EQ(ex.col(), 12);
  EXPECT_EQ(ex.text(), "{");
}

TEST(GroupKind, Names) {
  EXPECT_STREQ(group::to_string(GroupKind::Curly), "Curly");
  EXPECT_STREQ(group::to_string(GroupKind::Angle), "Angle");
}
