/***
 * Name: test_body_dispatcher
 * Purpose: Member dispatch over class bodies: ordering, spans, enums and unrecognized members.
 */
#include <gtest/gtest.h>
#include <memory>
#include <string>
#include <vector>
#include "ast/Nodes.h"
#include "nestport/exceptions/matcher_consumption_mismatch_error.h"
#include "nestport/exceptions/unrecognized_member_error.h"
#include "observability/AstPrinter.h"
#include "parser/BodyDispatcher.h"
#include "util/Pipeline.h"

using namespace nestport;
using ast::NodeKind;

static exceptions::UnrecognizedMemberError dispatchFailure(const std::string& src) {
  try {
    (void)testutil::parseSrc(src);
  } catch (const exceptions::UnrecognizedMemberError& ex) {
    return ex;
  }
  ADD_FAILURE() << "expected UnrecognizedMemberError for: " << src;
  return exceptions::UnrecognizedMemberError("", "", 0, 0, "");
}

// Accepts any identifier-led member and spans it through the next element; parse takes `extra` more
class SkewedMatcher final : public parse::Matcher {
 public:
  explicit SkewedMatcher(std::size_t extra) : extra_(extra) {}
  const char* name() const override { return "skewed"; }

  std::unique_ptr<ast::Node> parse(parse::TokenInputStream& stream, const parse::BodyContext&) const override {
    for (std::size_t i = 0; i < 2 + extra_; ++i) { stream.advance(); }
    return std::make_unique<ast::FieldDecl>();
  }

 protected:
  bool recognize(parse::TokenInputStream& peek, const parse::BodyContext&) const override {
    return peek.at(lex::TokenKind::Ident);
  }
  void finish(parse::TokenInputStream& peek) const override {
    peek.advance();
    peek.advance();
  }

 private:
  std::size_t extra_;
};

static std::vector<std::unique_ptr<parse::Matcher>> onlyMatcher(std::size_t extra) {
  std::vector<std::unique_ptr<parse::Matcher>> matchers;
  matchers.push_back(std::make_unique<SkewedMatcher>(extra));
  return matchers;
}

TEST(BodyDispatcher, MembersInSourceOrder) {
  auto file = testutil::parseSrc(
      "class A {\n"
      "  int x;\n"
      "  void m() {}\n"
      "  A() {}\n"
      "  static {}\n"
      "  {}\n"
      "  class B {}\n"
      "}\n");
  ASSERT_EQ(file->classes.size(), 1u);
  const auto& body = file->classes[0]->body;
  ASSERT_EQ(body.members.size(), 6u);
  EXPECT_EQ(body.members[0]->kind, NodeKind::FieldDecl);
  EXPECT_EQ(body.members[1]->kind, NodeKind::MethodDecl);
  EXPECT_EQ(body.members[2]->kind, NodeKind::ConstructorDecl);
  EXPECT_EQ(body.members[3]->kind, NodeKind::StaticInitializer);
  EXPECT_EQ(body.members[4]->kind, NodeKind::InstanceInitializer);
  EXPECT_EQ(body.members[5]->kind, NodeKind::NestedClassDecl);
  EXPECT_EQ(body.members[2]->line, 4);
}

TEST(BodyDispatcher, SpansCoverEachMember) {
  auto file = testutil::parseSrc("class A { int x; void m() {} }");
  const auto& body = file->classes[0]->body;
  ASSERT_EQ(body.members.size(), 2u);
  EXPECT_EQ(body.members[0]->spanBegin, 0u);
  EXPECT_EQ(body.members[0]->spanEnd, 3u);
  EXPECT_EQ(body.members[1]->spanBegin, 3u);
  EXPECT_EQ(body.members[1]->spanEnd, 7u);
}

TEST(BodyDispatcher, NestedAndAnonymousClasses) {
  auto file = testutil::parseSrc("class A { class B { void m() {} } B x = new B() { void m() { } }; }");
  const auto& a = *file->classes[0];
  ASSERT_EQ(a.body.nestedClasses.size(), 1u);
  EXPECT_EQ(a.body.nestedClasses[0]->name, "B");
  EXPECT_EQ(a.body.nestedClasses[0]->body.methods.size(), 1u);
  ASSERT_EQ(a.body.fields.size(), 1u);
  const auto& init = a.body.fields[0]->declarators[0].init;
  ASSERT_NE(init, nullptr);
  const auto* anon = init->soleAnonymous();
  ASSERT_NE(anon, nullptr);
  EXPECT_EQ(anon->base.name, "B");
  ASSERT_EQ(anon->body.methods.size(), 1u);
  EXPECT_EQ(anon->body.methods[0]->name, "m");
}

TEST(BodyDispatcher, LocalClassesStayInsideMethodBodies) {
  auto file = testutil::parseSrc(
      "class A {\n"
      "  void m() {\n"
      "    int y = 0;\n"
      "    { y++; }\n"
      "    class Local { int z; }\n"
      "  }\n"
      "}\n");
  const auto& body = file->classes[0]->body;
  ASSERT_EQ(body.members.size(), 1u);
  EXPECT_TRUE(body.nestedClasses.empty());
  EXPECT_TRUE(body.instanceInitializers.empty());
  ASSERT_NE(body.methods[0]->body, nullptr);
  EXPECT_TRUE(body.methods[0]->body->anonymousClasses().empty());
}

TEST(BodyDispatcher, CommentsAndStraySemicolons) {
  auto file = testutil::parseSrc(
      "class A {\n"
      "  /** doc */\n"
      "  int x; // trailing\n"
      "  ;;\n"
      "  /* between */ void m() {};\n"
      "}\n");
  const auto& body = file->classes[0]->body;
  ASSERT_EQ(body.members.size(), 2u);
  EXPECT_EQ(body.members[0]->kind, NodeKind::FieldDecl);
  EXPECT_EQ(body.members[1]->kind, NodeKind::MethodDecl);
}

TEST(BodyDispatcher, EnumConstantsThenMembers) {
  auto file = testutil::parseSrc(
      "enum Color {\n"
      "  RED, GREEN(2) { int shade() { return 2; } }, BLUE;\n"
      "  private final int v;\n"
      "  Color() { v = 0; }\n"
      "  Color(int v) { this.v = v; }\n"
      "}\n");
  const auto& cls = *file->classes[0];
  EXPECT_EQ(cls.classKind, ast::ClassKind::Enum);
  ASSERT_EQ(cls.body.enumConstants.size(), 3u);
  EXPECT_EQ(cls.body.enumConstants[0]->name, "RED");
  EXPECT_EQ(cls.body.enumConstants[1]->name, "GREEN");
  ASSERT_NE(cls.body.enumConstants[1]->classBody, nullptr);
  EXPECT_EQ(cls.body.enumConstants[2]->name, "BLUE");
  EXPECT_EQ(cls.body.fields.size(), 1u);
  EXPECT_EQ(cls.body.constructors.size(), 2u);
}

TEST(BodyDispatcher, EnumWithoutMembers) {
  auto file = testutil::parseSrc("enum E { A, B, }");
  const auto& body = file->classes[0]->body;
  ASSERT_EQ(body.enumConstants.size(), 2u);
  EXPECT_EQ(body.members.size(), 2u);
}

TEST(BodyDispatcher, DirectDispatchOverGroup) {
  auto root = testutil::groupAll("{ int a; int b; }");
  ASSERT_EQ(root.children.size(), 1u);
  ast::ClassBody body;
  parse::BodyContext ctx;
  ctx.className = "X";
  parse::BodyDispatcher::dispatchGroup(root.children[0].group(), body, ctx);
  EXPECT_EQ(body.fields.size(), 2u);
}

TEST(BodyDispatcher, DeterministicAcrossRuns) {
  const std::string src =
      "package p;\n"
      "class A<T> implements Runnable {\n"
      "  private java.util.List<T> items = new java.util.ArrayList<T>() { };\n"
      "  public void run() { new Thread(new Runnable() { public void run() {} }).start(); }\n"
      "  interface Cb { void call(int n); }\n"
      "}\n";
  obs::AstPrinter printer;
  const auto first = printer.print(*testutil::parseSrc(src));
  const auto second = printer.print(*testutil::parseSrc(src));
  EXPECT_EQ(first, second);
  EXPECT_NE(first.find("AnonymousClassExpr base=Runnable"), std::string::npos);
}

TEST(BodyDispatcherErrors, UnrecognizedMemberIsLocated) {
  auto ex = dispatchFailure("class A {\n  int x;\n  42;\n  void m() {}\n}\n");
  EXPECT_EQ(ex.detail(), "no member declaration matches in body of 'A'");
  EXPECT_EQ(ex.text(), "42");
  EXPECT_EQ(ex.line(), 3);
  EXPECT_EQ(ex.col(), 3);
}

TEST(BodyDispatcherErrors, DanglingAnnotation) {
  auto ex = dispatchFailure("class A {\n  int x;\n  @Deprecated\n}\n");
  EXPECT_EQ(ex.text(), "@");
  EXPECT_EQ(ex.line(), 3);
}

TEST(BodyDispatcherErrors, GroupIsReportedByItsBracket) {
  auto ex = dispatchFailure("class A { (x); }");
  EXPECT_EQ(ex.text(), "(");
  EXPECT_EQ(ex.col(), 11);
}

TEST(BodyDispatcherErrors, InsideAnonymousClass) {
  auto ex = dispatchFailure("class A { Object o = new Object() { return; }; }");
  EXPECT_EQ(ex.detail(), "no member declaration matches in anonymous class body");
  EXPECT_EQ(ex.text(), "return");
}

TEST(BodyDispatcherErrors, InsideNestedClass) {
  auto ex = dispatchFailure("class A { class B { x + 1; } }");
  EXPECT_EQ(ex.detail(), "no member declaration matches in body of 'B'");
}

TEST(BodyDispatcher, SuppliedMatchersAreUsed) {
  auto root = testutil::groupAll("{ a ; b ; }");
  ast::ClassBody body;
  auto stream = parse::TokenInputStream::over(root.children[0].group());
  parse::BodyDispatcher::dispatch(stream, body, parse::BodyContext{}, onlyMatcher(0));
  ASSERT_EQ(body.members.size(), 2u);
  EXPECT_EQ(body.members[0]->spanBegin, 0u);
  EXPECT_EQ(body.members[0]->spanEnd, 2u);
  EXPECT_EQ(body.members[1]->spanEnd, 4u);
}

TEST(BodyDispatcherErrors, ParseOverrunningExtentIsReported) {
  auto root = testutil::groupAll("{\n  a ; b ;\n}");
  ast::ClassBody body;
  auto stream = parse::TokenInputStream::over(root.children[0].group());
  try {
    parse::BodyDispatcher::dispatch(stream, body, parse::BodyContext{}, onlyMatcher(1));
    FAIL() << "expected MatcherConsumptionMismatchError";
  } catch (const exceptions::MatcherConsumptionMismatchError& ex) {
    EXPECT_EQ(ex.detail(), "matcher 'skewed' consumed through element 3 but its extent ends at element 2");
    EXPECT_EQ(ex.text(), "a");
    EXPECT_EQ(ex.line(), 2);
    EXPECT_EQ(ex.col(), 3);
  }
  EXPECT_TRUE(body.members.empty());
}
