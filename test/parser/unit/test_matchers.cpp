/***
 * Name: test_matchers
 * Purpose: Each member matcher recognizes its construct, rejects others, and parses exactly its extent.
 */
#include <gtest/gtest.h>
#include <string>
#include <vector>
#include "ast/Nodes.h"
#include "parser/MatcherSet.h"
#include "parser/matchers/ConstructorMatcher.h"
#include "parser/matchers/EnumConstantMatcher.h"
#include "parser/matchers/FieldMatcher.h"
#include "parser/matchers/InitializerMatchers.h"
#include "parser/matchers/MethodMatcher.h"
#include "parser/matchers/NestedClassMatcher.h"
#include "util/Pipeline.h"

using namespace nestport;
using parse::BodyContext;
using parse::Matcher;
using parse::TokenInputStream;

static BodyContext classCtx(const std::string& name = "A") {
  BodyContext ctx;
  ctx.className = name;
  return ctx;
}

static BodyContext enumCtx() {
  BodyContext ctx;
  ctx.className = "Color";
  ctx.classKind = ast::ClassKind::Enum;
  ctx.enumConstantSection = true;
  return ctx;
}

// Parses `src` as a member sequence with `m`; checks that parse stops where extent said it would
template <typename NodeT>
static std::unique_ptr<NodeT> parseWith(const Matcher& m, const std::string& src, const BodyContext& ctx) {
  auto root = testutil::groupAll(src);
  auto s = TokenInputStream::over(root);
  EXPECT_TRUE(m.isMatch(s.peekStream(), ctx)) << m.name() << " should match: " << src;
  const auto extent = m.extent(s.peekStream(), ctx);
  auto node = m.parse(s, ctx);
  EXPECT_EQ(s.position(), extent) << m.name() << " on: " << src;
  return std::unique_ptr<NodeT>(static_cast<NodeT*>(node.release()));
}

static bool matches(const Matcher& m, const std::string& src, const BodyContext& ctx) {
  auto root = testutil::groupAll(src);
  auto s = TokenInputStream::over(root);
  const bool hit = m.isMatch(s.peekStream(), ctx);
  EXPECT_EQ(hit, m.extent(s.peekStream(), ctx) != Matcher::npos) << m.name() << " on: " << src;
  return hit;
}

TEST(FieldMatcher, MultipleDeclarators) {
  parse::FieldMatcher m;
  auto field = parseWith<ast::FieldDecl>(m, "private static final int X = 1, Y; int after;", classCtx());
  ASSERT_NE(field, nullptr);
  EXPECT_EQ(field->modifiers.access, ast::Access::Private);
  EXPECT_TRUE(field->modifiers.isStatic());
  EXPECT_TRUE(field->modifiers.isFinal());
  EXPECT_EQ(field->type.name, "int");
  ASSERT_EQ(field->declarators.size(), 2u);
  EXPECT_EQ(field->declarators[0].name, "X");
  ASSERT_NE(field->declarators[0].init, nullptr);
  EXPECT_EQ(field->declarators[1].name, "Y");
  EXPECT_EQ(field->declarators[1].init, nullptr);
}

TEST(FieldMatcher, ArrayDimsAndGenerics) {
  parse::FieldMatcher m;
  auto field = parseWith<ast::FieldDecl>(m, "Map<String, List<Integer>>[] table[];", classCtx());
  ASSERT_NE(field, nullptr);
  EXPECT_EQ(field->type.name, "Map");
  ASSERT_EQ(field->type.args.size(), 2u);
  EXPECT_EQ(field->type.args[1].name, "List");
  EXPECT_EQ(field->type.arrayDims, 1);
  EXPECT_EQ(field->declarators[0].extraDims, 1);
}

TEST(FieldMatcher, InitializerMayContainAnonymousClass) {
  parse::FieldMatcher m;
  auto field = parseWith<ast::FieldDecl>(m, "Runnable r = new Runnable() { public void run() { } };", classCtx());
  ASSERT_NE(field, nullptr);
  const auto* anon = field->declarators[0].init->soleAnonymous();
  ASSERT_NE(anon, nullptr);
  EXPECT_EQ(anon->base.name, "Runnable");
  EXPECT_EQ(anon->body.methods.size(), 1u);
}

TEST(FieldMatcher, RejectsOtherMembers) {
  parse::FieldMatcher m;
  EXPECT_FALSE(matches(m, "void m() { }", classCtx()));
  EXPECT_FALSE(matches(m, "int m() { return 0; }", classCtx()));
  EXPECT_FALSE(matches(m, "class Inner { }", classCtx()));
  EXPECT_FALSE(matches(m, "static { }", classCtx()));
  EXPECT_FALSE(matches(m, "A() { }", classCtx()));
}

TEST(MethodMatcher, GenericMethodWithThrows) {
  parse::MethodMatcher m;
  auto method = parseWith<ast::MethodDecl>(
      m, "public <T extends Number> List<T> get(final int i, String... rest) throws IOException, X { return null; }",
      classCtx());
  ASSERT_NE(method, nullptr);
  EXPECT_EQ(method->name, "get");
  ASSERT_EQ(method->typeParams.size(), 1u);
  EXPECT_EQ(method->typeParams[0].name, "T");
  ASSERT_EQ(method->typeParams[0].bounds.size(), 1u);
  EXPECT_EQ(method->returnType.text(), "List<T>");
  ASSERT_EQ(method->params.size(), 2u);
  EXPECT_TRUE(method->params[0].modifiers.isFinal());
  EXPECT_TRUE(method->params[1].isVarArgs);
  EXPECT_EQ(method->throwsList.size(), 2u);
  ASSERT_NE(method->body, nullptr);
}

TEST(MethodMatcher, InterfaceMethodWithoutBodyIsAbstract) {
  parse::MethodMatcher m;
  BodyContext ctx = classCtx("Shape");
  ctx.classKind = ast::ClassKind::Interface;
  auto method = parseWith<ast::MethodDecl>(m, "double area();", ctx);
  ASSERT_NE(method, nullptr);
  EXPECT_EQ(method->body, nullptr);
  EXPECT_TRUE(method->modifiers.isAbstract());
  EXPECT_TRUE(method->returnType.primitive);
}

TEST(MethodMatcher, AnnotationsAndVoid) {
  parse::MethodMatcher m;
  auto method = parseWith<ast::MethodDecl>(m, "@Override @SuppressWarnings(\"x\") void run() { }", classCtx());
  ASSERT_NE(method, nullptr);
  ASSERT_EQ(method->modifiers.annotations.size(), 2u);
  EXPECT_EQ(method->modifiers.annotations[0], "@Override");
  EXPECT_EQ(method->modifiers.annotations[1], "@SuppressWarnings(\"x\")");
  EXPECT_TRUE(method->returnType.isVoid());
}

TEST(MethodMatcher, RejectsOtherMembers) {
  parse::MethodMatcher m;
  EXPECT_FALSE(matches(m, "int x;", classCtx()));
  EXPECT_FALSE(matches(m, "A(int x) { }", classCtx()));
  EXPECT_FALSE(matches(m, "{ }", classCtx()));
  EXPECT_FALSE(matches(m, "interface I { }", classCtx()));
}

TEST(NestedClassMatcher, ParsesHeaderAndBody) {
  parse::NestedClassMatcher m;
  auto cls = parseWith<ast::NestedClassDecl>(
      m, "protected static class Inner<K> extends Base<K> implements Runnable, Cloneable { int y; }", classCtx());
  ASSERT_NE(cls, nullptr);
  EXPECT_EQ(cls->name, "Inner");
  EXPECT_EQ(cls->kind, ast::NodeKind::NestedClassDecl);
  EXPECT_EQ(cls->modifiers.access, ast::Access::Protected);
  ASSERT_EQ(cls->typeParams.size(), 1u);
  ASSERT_EQ(cls->extends.size(), 1u);
  EXPECT_EQ(cls->extends[0].text(), "Base<K>");
  EXPECT_EQ(cls->implements.size(), 2u);
  EXPECT_EQ(cls->body.fields.size(), 1u);
}

TEST(NestedClassMatcher, InterfacesAndEnums) {
  parse::NestedClassMatcher m;
  EXPECT_TRUE(matches(m, "interface Listener { void on(); }", classCtx()));
  EXPECT_TRUE(matches(m, "public enum Mode { ON, OFF }", classCtx()));
  EXPECT_FALSE(matches(m, "int x;", classCtx()));
  EXPECT_FALSE(matches(m, "Inner() { }", classCtx("Inner")));
}

TEST(StaticInitializerMatcher, OnlyStaticBlocks) {
  parse::StaticInitializerMatcher m;
  auto init = parseWith<ast::StaticInitializer>(m, "static { X = 2; }", classCtx());
  ASSERT_NE(init, nullptr);
  ASSERT_NE(init->body, nullptr);
  EXPECT_FALSE(init->body->empty());
  EXPECT_FALSE(matches(m, "{ X = 2; }", classCtx()));
  EXPECT_FALSE(matches(m, "static int X;", classCtx()));
}

TEST(InstanceInitializerMatcher, BareBlock) {
  parse::InstanceInitializerMatcher m;
  auto init = parseWith<ast::InstanceInitializer>(m, "{ count++; }", classCtx());
  ASSERT_NE(init, nullptr);
  EXPECT_FALSE(matches(m, "static { }", classCtx()));
  EXPECT_FALSE(matches(m, "int x;", classCtx()));
}

TEST(ConstructorMatcher, NeedsEnclosingClassName) {
  parse::ConstructorMatcher m;
  auto ctor = parseWith<ast::ConstructorDecl>(m, "public A(int x) throws E { this.x = x; }", classCtx("A"));
  ASSERT_NE(ctor, nullptr);
  EXPECT_EQ(ctor->name, "A");
  EXPECT_EQ(ctor->params.size(), 1u);
  EXPECT_EQ(ctor->throwsList.size(), 1u);
  EXPECT_FALSE(matches(m, "public A(int x) { }", classCtx("B")));
  EXPECT_FALSE(matches(m, "A() { }", classCtx("")));
  EXPECT_FALSE(matches(m, "void A() { }", classCtx("A")));
}

TEST(EnumConstantMatcher, ArgumentsAndBody) {
  parse::EnumConstantMatcher m;
  auto constant = parseWith<ast::EnumConstant>(m, "@Deprecated RED(1, \"r\") { int f() { return 1; } }, GREEN", enumCtx());
  ASSERT_NE(constant, nullptr);
  EXPECT_EQ(constant->name, "RED");
  ASSERT_EQ(constant->annotations.size(), 1u);
  ASSERT_NE(constant->classBody, nullptr);
  EXPECT_EQ(constant->args, nullptr);
  ASSERT_NE(constant->classBody->args, nullptr);
  EXPECT_EQ(constant->classBody->base.name, "Color");
  EXPECT_EQ(constant->classBody->body.methods.size(), 1u);
}

TEST(EnumConstantMatcher, PlainConstant) {
  parse::EnumConstantMatcher m;
  auto constant = parseWith<ast::EnumConstant>(m, "BLUE;", enumCtx());
  ASSERT_NE(constant, nullptr);
  EXPECT_EQ(constant->args, nullptr);
  EXPECT_EQ(constant->classBody, nullptr);
}

TEST(EnumConstantMatcher, OnlyInsideConstantSection) {
  parse::EnumConstantMatcher m;
  auto ctx = enumCtx();
  EXPECT_TRUE(matches(m, "RED,", ctx));
  EXPECT_FALSE(matches(m, "int x;", ctx));
  ctx.enumConstantSection = false;
  EXPECT_FALSE(matches(m, "RED,", ctx));
  EXPECT_FALSE(matches(m, "RED,", classCtx()));
}

TEST(MatcherSet, PriorityOrder) {
  const auto& set = parse::memberMatchers();
  std::vector<std::string> names;
  for (const auto& m : set) names.emplace_back(m->name());
  std::vector<std::string> want = {"field", "method", "nested class", "static initializer", "instance initializer",
                                   "constructor"};
  EXPECT_EQ(names, want);
  EXPECT_STREQ(parse::enumConstantMatcher().name(), "enum constant");
}

TEST(MatcherSet, AtMostOneMatcherPerConstruct) {
  const std::vector<std::string> members = {
      "int x;", "int x = 1, y;", "void m() { }", "abstract int n();", "class C { }", "static { }", "{ }",
      "A(int a) { }", "<T> T id(T t) { return t; }", "@Override public String toString() { return \"\"; }"};
  for (const auto& src : members) {
    int hits = 0;
    for (const auto& m : parse::memberMatchers()) {
      if (matches(*m, src, classCtx("A"))) ++hits;
    }
    EXPECT_EQ(hits, 1) << src;
  }
}
