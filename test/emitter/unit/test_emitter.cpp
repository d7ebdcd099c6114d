/***
 * Name: test_emitter
 * Purpose: Emitted C++ header text for classes, members, initializers and anonymous classes.
 */
#include <gtest/gtest.h>
#include <string>
#include "nestport/exceptions/emission_error.h"
#include "util/Pipeline.h"

using namespace nestport;

static bool contains(const std::string& hay, const std::string& needle) { return hay.find(needle) != std::string::npos; }

static std::size_t at(const std::string& hay, const std::string& needle) {
  const auto pos = hay.find(needle);
  EXPECT_NE(pos, std::string::npos) << "missing: " << needle << "\n---\n" << hay;
  return pos;
}

TEST(Emitter, BannerIncludesAndPragma) {
  emit::EmitOptions options;
  options.sourceName = "A.java";
  const auto out = testutil::emitSrc("class A {}", options);
  EXPECT_EQ(out.rfind("// Generated by nestport from A.java. Do not edit.\n#pragma once\n", 0), 0u);
  EXPECT_TRUE(contains(out, "#include \"nestport/runtime.h\"\n"));
  EXPECT_TRUE(contains(out, "class A : public Object {\n"));
}

TEST(Emitter, BannerWithoutSourceName) {
  const auto out = testutil::emitSrc("class A {}");
  EXPECT_EQ(out.rfind("// Generated by nestport. Do not edit.\n", 0), 0u);
}

TEST(Emitter, NestedClassAndAnonymousSubclass) {
  const auto out = testutil::emitSrc("class A { class B { void m() {} } B x = new B() { void m() { } }; }");
  // forward declarations in declaration order
  const auto fwdA = at(out, "class A;\n");
  const auto fwdB = at(out, "class A_B;\n");
  const auto fwdAnon = at(out, "class A_1;\n");
  EXPECT_LT(fwdA, fwdB);
  EXPECT_LT(fwdB, fwdAnon);

  // definitions: base before derived, inner before owner
  const auto defB = at(out, "class A_B : public Object {\n");
  const auto defAnon = at(out, "class A_1 : public A_B {\n");
  const auto defA = at(out, "class A : public Object {\n");
  EXPECT_LT(defB, defAnon);
  EXPECT_LT(defAnon, defA);

  EXPECT_TRUE(contains(out, "    virtual void m();\n"));
  EXPECT_TRUE(contains(out, "    using B = A_B;\n"));
  EXPECT_TRUE(contains(out, "    void m() override;\n"));
  EXPECT_TRUE(contains(out, "    explicit A_1(Args&&... args) : A_B(std::forward<Args>(args)...) {}\n"));
  EXPECT_TRUE(contains(out, "    friend class A_1;\n"));
  EXPECT_TRUE(contains(out, "    A_B* x{};\n"));
  EXPECT_TRUE(contains(out, "    A();\n"));
  EXPECT_TRUE(contains(out, "    void initInstance();\n"));
  EXPECT_TRUE(contains(out, "inline auto A::initInstance() -> void {\n    x = new A_1();\n}\n"));
  EXPECT_TRUE(contains(out, "inline A::A() {\n    initInstance();\n}\n"));
  EXPECT_TRUE(contains(out, "inline auto A_1::m() -> void {\n}\n"));
}

TEST(Emitter, PrimitiveAndReferenceTypes) {
  const auto out = testutil::emitSrc(
      "class T { int a; long b; boolean c; char d; byte e; short f; double g; String s; int[][] m; "
      "java.util.List<String> l; }");
  EXPECT_TRUE(contains(out, "    int32_t a{};\n"));
  EXPECT_TRUE(contains(out, "    int64_t b{};\n"));
  EXPECT_TRUE(contains(out, "    bool c{};\n"));
  EXPECT_TRUE(contains(out, "    char16_t d{};\n"));
  EXPECT_TRUE(contains(out, "    int8_t e{};\n"));
  EXPECT_TRUE(contains(out, "    int16_t f{};\n"));
  EXPECT_TRUE(contains(out, "    double g{};\n"));
  EXPECT_TRUE(contains(out, "    String* s{};\n"));
  EXPECT_TRUE(contains(out, "    Array<Array<int32_t>*>* m{};\n"));
  EXPECT_TRUE(contains(out, "    java::util::List<String*>* l{};\n"));
}

TEST(Emitter, AccessLabels) {
  const auto out = testutil::emitSrc("class A { private int p; protected int q; public int r; int s; private void h() {} }");
  // members start in the private section, so the first label is elided
  EXPECT_TRUE(contains(out, "{\n    int32_t p{};\nprotected:\n    int32_t q{};\npublic:\n    int32_t r{};\n    int32_t s{};\n"));
  EXPECT_TRUE(contains(out, "private:\n    void h();\n"));
}

TEST(Emitter, StaticMembersAndMethodBodies) {
  const auto out = testutil::emitSrc(
      "class Util {\n"
      "  static int count = 3;\n"
      "  static int twice(int v) {\n"
      "    return v * 2;\n"
      "  }\n"
      "}\n");
  EXPECT_TRUE(contains(out, "    inline static int32_t count{};\n"));
  EXPECT_TRUE(contains(out, "    static int32_t twice(int32_t v);\n"));
  EXPECT_TRUE(contains(out, "    static void initStatic();\n"));
  EXPECT_TRUE(contains(out, "inline auto Util::initStatic() -> void {\n    count = 3;\n}\n"));
  EXPECT_TRUE(contains(out, "inline auto Util::twice(int32_t v) -> int32_t {\n    return v * 2;\n}\n"));
  EXPECT_TRUE(contains(out, "[[maybe_unused]] inline const bool Util_staticInit = (Util::initStatic(), true);\n"));
}

TEST(Emitter, InitializerBlocksMergeInSourceOrder) {
  const auto out = testutil::emitSrc(
      "class A {\n"
      "  static int s;\n"
      "  static { s = 1; }\n"
      "  int i = 2;\n"
      "  { i += 3; }\n"
      "  A(int k) { i = k; }\n"
      "}\n");
  EXPECT_TRUE(contains(out, "inline auto A::initInstance() -> void {\n    i = 2;\n    {\n        i += 3;\n    }\n}\n"));
  EXPECT_TRUE(contains(out, "inline auto A::initStatic() -> void {\n    {\n        s = 1;\n    }\n}\n"));
  EXPECT_TRUE(contains(out, "inline A::A(int32_t k) {\n    initInstance();\n    i = k;\n}\n"));
  // a declared constructor suppresses the synthesized default
  EXPECT_FALSE(contains(out, "    A();\n"));
}

TEST(Emitter, SuperAndThisCallsBecomeMemInitializers) {
  const auto out = testutil::emitSrc(
      "class Base { Base(int x) {} }\n"
      "class D extends Base {\n"
      "  int k = 1;\n"
      "  D(int x) { super(x); k++; }\n"
      "  D() { this(7); }\n"
      "}\n");
  EXPECT_TRUE(contains(out, "inline D::D(int32_t x) : Base(x) {\n    initInstance();\n    k++;\n}\n"));
  EXPECT_TRUE(contains(out, "inline D::D() : D(7) {\n}\n"));
}

TEST(Emitter, InterfacesHaveNoRootBaseAndPureMethods) {
  const auto out = testutil::emitSrc("interface Shape { double area(); int SIDES = 4; }\nclass Sq implements Shape { public double area() { return 1.0; } }");
  EXPECT_TRUE(contains(out, "class Shape {\n"));
  EXPECT_TRUE(contains(out, "    virtual double area() = 0;\n"));
  EXPECT_TRUE(contains(out, "    inline static int32_t SIDES{};\n"));
  EXPECT_TRUE(contains(out, "class Sq : public Object, public Shape {\n"));
  EXPECT_TRUE(contains(out, "    double area() override;\n"));
}

TEST(Emitter, EnumConstantsAndBodies) {
  const auto out = testutil::emitSrc(
      "enum Color {\n"
      "  RED, GREEN(2) { int shade() { return 2; } };\n"
      "  private final int v;\n"
      "  private Color() { v = 0; }\n"
      "  private Color(int v) { this.v = v; }\n"
      "}\n");
  EXPECT_TRUE(contains(out, "    inline static Color* RED{};\n"));
  EXPECT_TRUE(contains(out, "    inline static Color* GREEN{};\n"));
  EXPECT_TRUE(contains(out, "class Color_1 : public Color {\n"));
  EXPECT_TRUE(contains(out, "protected:\n    Color();\n"));
  EXPECT_TRUE(contains(out, "    RED = new Color();\n    GREEN = new Color_1(2);\n"));
  EXPECT_TRUE(contains(out, "Color_staticInit = (Color::initStatic(), true);"));
  EXPECT_LT(at(out, "class Color : public Object {\n"), at(out, "class Color_1 : public Color {\n"));
}

TEST(Emitter, GenericClass) {
  const auto out = testutil::emitSrc("class Box<T> { T value; T get() { return value; } <U> U as(U u) { return u; } }");
  EXPECT_TRUE(contains(out, "template <typename T> class Box;\n"));
  EXPECT_TRUE(contains(out, "template <typename T>\nclass Box : public Object {\n"));
  EXPECT_TRUE(contains(out, "    T value{};\n"));
  EXPECT_TRUE(contains(out, "    virtual T get();\n"));
  EXPECT_TRUE(contains(out, "    template <typename U>\n    U as(U u);\n"));
  EXPECT_TRUE(contains(out, "template <typename T>\nauto Box<T>::get() -> T {\n"));
  EXPECT_FALSE(contains(out, "Box_staticInit"));
}

TEST(Emitter, GenericNestedTypeAliasUsesFreshParameters) {
  const auto out = testutil::emitSrc("class O<T> { interface I<T> { T get(); } I<String> i; }");
  EXPECT_TRUE(contains(out, "template <typename T>\nclass O_I {\n"));
  EXPECT_TRUE(contains(out, "    template <typename... Ts> using I = O_I<Ts...>;\n"));
  EXPECT_TRUE(contains(out, "    template <typename> friend class O_I;\n"));
  EXPECT_FALSE(contains(out, "template <typename T> using"));
}

TEST(Emitter, AbstractGenericMethodsThrowWhenReached) {
  const auto out = testutil::emitSrc("abstract class S { abstract <T> T first(); }\ninterface F { <R> R make(); }");
  EXPECT_TRUE(contains(out, "#include <stdexcept>\n"));
  EXPECT_TRUE(contains(out, "    template <typename T>\n    T first();\n"));
  EXPECT_TRUE(contains(out, "template <typename T>\nauto S::first() -> T {\n"
                            "    throw std::logic_error(\"abstract generic method 'S::first' has no implementation\");\n}\n"));
  EXPECT_TRUE(contains(out, "template <typename R>\nauto F::make() -> R {\n"));
  EXPECT_FALSE(contains(out, "first() = 0"));
}

TEST(Emitter, VarArgsParameter) {
  const auto out = testutil::emitSrc("class A { void all(int... xs) {} }");
  EXPECT_TRUE(contains(out, "    virtual void all(Array<int32_t>* xs);\n"));
}

TEST(Emitter, PackageBecomesNamespace) {
  const auto out = testutil::emitSrc("package a.b;\nclass A {}");
  EXPECT_TRUE(contains(out, "\nnamespace a::b {\n"));
  EXPECT_TRUE(contains(out, "\n} // namespace a::b\n"));
}

TEST(Emitter, AnonymousClassInMethodBodyIsLowered) {
  const auto out = testutil::emitSrc(
      "class A {\n"
      "  void start() {\n"
      "    new Thread(new Runnable() {\n"
      "      public void run() { }\n"
      "    }).start();\n"
      "  }\n"
      "}\n");
  EXPECT_TRUE(contains(out, "class A_1 : public Runnable {\n"));
  EXPECT_TRUE(contains(out, "new Thread(new A_1()).start();"));
}

TEST(EmitterErrors, UnresolvedBaseSurfaces) {
  EXPECT_THROW((void)testutil::emitSrc("class A extends Missing {}"), exceptions::EmissionError);
}
