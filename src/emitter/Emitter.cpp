/***
 * Name: nestport::emit::Emitter (impl)
 * Purpose: Class definitions and out-of-class member definitions.
 */
#include "emitter/Emitter.h"
#include "ast/Nodes.h"
#include "emitter/BodyWriter.h"
#include "emitter/LoweringPlan.h"
#include "emitter/TypeRenderer.h"
#include <algorithm>
#include <sstream>
#include <vector>

namespace nestport::emit {

using TK = lex::TokenKind;

namespace {

std::string accessLabel(const ast::Access access) {
  switch (access) {
    case ast::Access::Private: return "private";
    case ast::Access::Protected: return "protected";
    case ast::Access::Public:
    case ast::Access::Package: return "public";
  }
  return "public";
}

// `super(...);` or `this(...);` opening a constructor body
struct LeadingCall {
  bool found{false};
  bool delegates{false};
  std::vector<lex::Token> args;
  std::size_t consumed{0};
};

std::vector<std::string> paramNames(const std::vector<ast::TypeParam>& list) {
  std::vector<std::string> out;
  for (const auto& param : list) { out.push_back(param.name); }
  return out;
}

LeadingCall leadingCall(const ast::OpaqueBody& body) {
  LeadingCall call;
  if (body.segments.empty()) { return call; }
  const auto& toks = body.segments.front().tokens;
  std::size_t idx = 0;
  while (idx < toks.size() && toks[idx].kind == TK::Comment) { ++idx; }
  if (idx + 1 >= toks.size()) { return call; }
  const bool isSuper = toks[idx].kind == TK::Super;
  const bool isThis = toks[idx].kind == TK::Keyword && toks[idx].text == "this";
  if ((!isSuper && !isThis) || toks[idx + 1].kind != TK::LParen) { return call; }
  int depth = 0;
  std::size_t close = idx + 1;
  for (; close < toks.size(); ++close) {
    if (toks[close].kind == TK::LParen) { ++depth; }
    if (toks[close].kind == TK::RParen && --depth == 0) { break; }
  }
  if (close + 1 >= toks.size() || toks[close + 1].kind != TK::Semi) { return call; }
  call.found = true;
  call.delegates = isThis;
  call.args.assign(toks.begin() + static_cast<std::ptrdiff_t>(idx + 2), toks.begin() + static_cast<std::ptrdiff_t>(close));
  call.consumed = close + 2;
  return call;
}

class UnitWriter {
 public:
  UnitWriter(const ast::File& file, const LoweringPlan& plan, const EmitOptions& options)
      : file_(file), plan_(plan), options_(options), body_(plan, options.indentWidth) {}

  std::string run() {
    banner();
    for (const auto* info : plan_.declarationOrder()) { forwardDecl(*info); }
    for (const auto* info : plan_.emissionOrder()) { definition(*info); }
    for (const auto* info : plan_.emissionOrder()) { outOfLine(*info); }
    staticTriggers();
    if (!file_.packageName.empty()) { os_ << "\n} // namespace " << TypeRenderer::qualified(file_.packageName) << "\n"; }
    return os_.str();
  }

 private:
  const ast::File& file_;
  const LoweringPlan& plan_;
  const EmitOptions& options_;
  BodyWriter body_;
  std::ostringstream os_;

  std::string ind(const int depth) const { return body_.indent(depth); }

  void banner() {
    os_ << "// Generated by nestport";
    if (!options_.sourceName.empty()) { os_ << " from " << options_.sourceName; }
    os_ << ". Do not edit.\n";
    os_ << "#pragma once\n\n";
    os_ << "#include <cstdint>\n";
    os_ << "#include <stdexcept>\n";
    os_ << "#include <utility>\n";
    os_ << "#include \"" << options_.runtimeHeader << "\"\n";
    if (!file_.packageName.empty()) { os_ << "\nnamespace " << TypeRenderer::qualified(file_.packageName) << " {\n"; }
    os_ << "\n";
  }

  void forwardDecl(const ClassInfo& info) {
    if (info.isTemplate()) { os_ << templateHead(info.typeParams) << " "; }
    os_ << "class " << info.emittedName << ";\n";
  }

  // Member type-variable scope for a class (and optionally a generic member)
  static std::vector<std::string> vars(const ClassInfo& info, const std::vector<ast::TypeParam>& extra = {}) {
    auto out = info.typeParams;
    for (const auto& param : extra) { out.push_back(param.name); }
    return out;
  }

  static bool isStaticField(const ClassInfo& info, const ast::FieldDecl& field) {
    return field.modifiers.isStatic() || info.isInterface();
  }

  bool needsInitInstance(const ClassInfo& info) const {
    if (!info.body->instanceInitializers.empty()) { return true; }
    for (const auto& field : info.body->fields) {
      if (isStaticField(info, *field)) { continue; }
      for (const auto& decl : field->declarators) {
        if (decl.init) { return true; }
      }
    }
    return false;
  }

  bool needsInitStatic(const ClassInfo& info) const {
    if (!info.body->staticInitializers.empty() || !info.body->enumConstants.empty()) { return true; }
    for (const auto& field : info.body->fields) {
      if (!isStaticField(info, *field)) { continue; }
      for (const auto& decl : field->declarators) {
        if (decl.init) { return true; }
      }
    }
    return false;
  }

  std::vector<std::string> baseNames(const ClassInfo& info) const {
    const TypeRenderer types{plan_, info.parent, info.typeParams};
    std::vector<std::string> out;
    if (info.isAnonymous()) {
      out.push_back(types.className(info.anon->base));
      return out;
    }
    for (const auto& ref : info.decl->extends) { out.push_back(types.className(ref)); }
    if (info.decl->extends.empty() && !info.isInterface()) { out.push_back(options_.rootClass); }
    for (const auto& ref : info.decl->implements) { out.push_back(types.className(ref)); }
    return out;
  }

  // Superclass used by `super(...)` mem-initializers
  std::string superName(const ClassInfo& info) const {
    const auto bases = baseNames(info);
    return bases.empty() ? options_.rootClass : bases.front();
  }

  static bool isAbstract(const ClassInfo& info, const ast::MethodDecl& m) {
    return !m.body && !m.modifiers.isStatic() && (m.modifiers.isAbstract() || info.isInterface());
  }

  static bool declaresMethod(const ClassInfo& cls, const ast::MethodDecl& method) {
    for (const auto& other : cls.body->methods) {
      if (other->name == method.name && other->arity() == method.arity() &&
          !other->modifiers.isStatic() && other->modifiers.access != ast::Access::Private) {
        return true;
      }
    }
    return false;
  }

  static bool overrides(const ClassInfo& info, const ast::MethodDecl& method, const int depth = 0) {
    for (const auto* base : info.inFileBases) {
      if (declaresMethod(*base, method)) { return true; }
      if (depth < 64 && overrides(*base, method, depth + 1)) { return true; }
    }
    return false;
  }

  std::string params(const TypeRenderer& types, const std::vector<ast::Parameter>& list) const {
    std::string out;
    for (std::size_t i = 0; i < list.size(); ++i) {
      if (i != 0) { out += ", "; }
      auto type = types.type(list[i].type);
      if (list[i].isVarArgs) { type = "Array<" + type + ">*"; }
      out += type + " " + list[i].name;
    }
    return out;
  }

  void label(std::string& current, const std::string& wanted) {
    if (current == wanted) { return; }
    os_ << wanted << ":\n";
    current = wanted;
  }

  void definition(const ClassInfo& info) {
    const TypeRenderer types{plan_, &info, info.typeParams};
    if (info.isTemplate()) { os_ << templateHead(info.typeParams) << "\n"; }
    os_ << "class " << info.emittedName;
    const auto bases = baseNames(info);
    for (std::size_t i = 0; i < bases.size(); ++i) { os_ << (i == 0 ? " : public " : ", public ") << bases[i]; }
    os_ << " {\n";

    for (const auto* other : plan_.declarationOrder()) {
      if (other == &info || other->topLevel != info.topLevel) { continue; }
      os_ << ind(1);
      if (other->isTemplate()) {
        std::string head = "template <";
        for (std::size_t i = 0; i < other->typeParams.size(); ++i) { head += i == 0 ? "typename" : ", typename"; }
        os_ << head << "> ";
      }
      os_ << "friend class " << other->emittedName << ";\n";
    }

    std::string current = "private";
    aliases(info, current);
    if (info.isAnonymous()) { forwardingConstructor(info, current); }

    for (const auto* member : info.body->members) {
      switch (member->kind) {
        case ast::NodeKind::FieldDecl: field(info, types, static_cast<const ast::FieldDecl&>(*member), current); break;
        case ast::NodeKind::MethodDecl: method(info, static_cast<const ast::MethodDecl&>(*member), current); break;
        case ast::NodeKind::ConstructorDecl:
          constructorDecl(info, static_cast<const ast::ConstructorDecl&>(*member), current);
          break;
        case ast::NodeKind::EnumConstant:
          label(current, "public");
          os_ << ind(1) << "inline static " << info.emittedName << "* "
              << static_cast<const ast::EnumConstant&>(*member).name << "{};\n";
          break;
        default: break; // nested types are hoisted; initializers are merged into initStatic/initInstance
      }
    }

    const bool initInstance = needsInitInstance(info);
    if (!info.isAnonymous() && info.body->constructors.empty() && initInstance) {
      label(current, "public");
      os_ << ind(1) << info.emittedName << "();\n";
    }
    if (needsInitStatic(info)) {
      label(current, "public");
      os_ << ind(1) << "static void initStatic();\n";
    }
    if (initInstance) {
      label(current, "private");
      os_ << ind(1) << "void initInstance();\n";
    }
    os_ << "};\n\n";
  }

  // Nested types visible from `info`, innermost scope first
  void aliases(const ClassInfo& info, std::string& current) {
    std::vector<std::string> seen;
    for (const auto* scope = &info; scope != nullptr; scope = scope->parent) {
      for (const auto* child : scope->inner) {
        if (child->isAnonymous()) { continue; }
        if (std::find(seen.begin(), seen.end(), child->simpleName) != seen.end()) { continue; }
        seen.push_back(child->simpleName);
        label(current, "public");
        os_ << ind(1);
        // Alias parameters must not reuse names already bound by an enclosing class template
        if (child->isTemplate()) {
          os_ << "template <typename... Ts> using " << child->simpleName << " = " << child->emittedName << "<Ts...>;\n";
          continue;
        }
        os_ << "using " << child->simpleName << " = " << child->emittedName << ";\n";
      }
    }
  }

  void forwardingConstructor(const ClassInfo& info, std::string& current) {
    label(current, "public");
    const auto base = baseNames(info).front();
    os_ << ind(1) << "template <typename... Args>\n";
    os_ << ind(1) << "explicit " << info.emittedName << "(Args&&... args) : " << base
        << "(std::forward<Args>(args)...) {";
    os_ << (needsInitInstance(info) ? " initInstance(); }\n" : "}\n");
  }

  void field(const ClassInfo& info, const TypeRenderer& types, const ast::FieldDecl& decl, std::string& current) {
    label(current, accessLabel(info.isInterface() ? ast::Access::Public : decl.modifiers.access));
    for (const auto& var : decl.declarators) {
      auto type = decl.type;
      type.arrayDims += var.extraDims;
      os_ << ind(1) << (isStaticField(info, decl) ? "inline static " : "") << types.type(type) << " " << var.name
          << "{};\n";
    }
  }

  void method(const ClassInfo& info, const ast::MethodDecl& m, std::string& current) {
    const TypeRenderer types{plan_, &info, vars(info, m.typeParams)};
    const auto& mods = m.modifiers;
    const bool isStatic = mods.isStatic();
    const bool isPrivate = mods.access == ast::Access::Private;
    const bool generic = !m.typeParams.empty();
    const bool abstract = isAbstract(info, m);
    const bool over = !isStatic && !isPrivate && !generic && overrides(info, m);
    const bool virt = !isStatic && !isPrivate && !generic && (abstract || !mods.isFinal() || over);

    label(current, accessLabel(info.isInterface() ? ast::Access::Public : mods.access));
    if (generic) { os_ << ind(1) << templateHead(paramNames(m.typeParams)) << "\n"; }
    os_ << ind(1);
    if (isStatic) {
      os_ << "static ";
    } else if (virt && !over) {
      os_ << "virtual ";
    }
    os_ << types.type(m.returnType) << " " << m.name << "(" << params(types, m.params) << ")";
    if (over) { os_ << " override"; }
    if (over && mods.isFinal()) { os_ << " final"; }
    if (abstract && virt) { os_ << " = 0"; }
    os_ << ";\n";
  }

  void constructorDecl(const ClassInfo& info, const ast::ConstructorDecl& ctor, std::string& current) {
    const TypeRenderer types{plan_, &info, vars(info, ctor.typeParams)};
    // Enum constant bodies derive from the enum, so its private constructors must stay reachable
    auto access = ctor.modifiers.access;
    if (info.isEnum() && access == ast::Access::Private) { access = ast::Access::Protected; }
    label(current, accessLabel(access));
    if (!ctor.typeParams.empty()) { os_ << ind(1) << templateHead(paramNames(ctor.typeParams)) << "\n"; }
    os_ << ind(1) << info.emittedName << "(" << params(types, ctor.params) << ");\n";
  }

  // --- out-of-class definitions ---

  std::string qualifier(const ClassInfo& info) const {
    return info.emittedName + templateArgs(info.typeParams) + "::";
  }

  void definitionHead(const ClassInfo& info, const std::vector<ast::TypeParam>& memberParams) {
    if (info.isTemplate()) { os_ << templateHead(info.typeParams) << "\n"; }
    if (!memberParams.empty()) { os_ << templateHead(paramNames(memberParams)) << "\n"; }
    if (!info.isTemplate() && memberParams.empty()) { os_ << "inline "; }
  }

  void blockBody(const ast::OpaqueBody* body, const int depth, const std::size_t skip = 0) {
    if (body == nullptr || body->empty()) { return; }
    const auto text = body_.block(*body, depth, skip);
    if (!text.empty()) { os_ << text << "\n"; }
  }

  void outOfLine(const ClassInfo& info) {
    if (needsInitStatic(info)) { initStatic(info); }
    if (needsInitInstance(info)) { initInstance(info); }
    if (!info.isAnonymous() && info.body->constructors.empty() && needsInitInstance(info)) {
      definitionHead(info, {});
      os_ << qualifier(info) << info.emittedName << "() {\n" << ind(1) << "initInstance();\n}\n\n";
    }
    for (const auto& ctor : info.body->constructors) { constructorDef(info, *ctor); }
    for (const auto& m : info.body->methods) {
      if (m->body) {
        methodDef(info, *m);
      } else if (!m->typeParams.empty() && isAbstract(info, *m)) {
        abstractTemplateDef(info, *m);
      }
    }
  }

  void initStatic(const ClassInfo& info) {
    definitionHead(info, {});
    os_ << "auto " << qualifier(info) << "initStatic() -> void {\n";
    for (const auto* member : info.body->members) {
      if (member->kind == ast::NodeKind::EnumConstant) {
        const auto& constant = static_cast<const ast::EnumConstant&>(*member);
        os_ << ind(1) << constant.name << " = new ";
        if (constant.classBody) {
          const auto* sub = plan_.find(constant.classBody.get());
          os_ << (sub != nullptr ? sub->emittedName : info.emittedName) << "(";
          if (constant.classBody->args) { os_ << body_.expression(*constant.classBody->args, 2); }
        } else {
          os_ << info.emittedName << "(";
          if (constant.args) { os_ << body_.expression(*constant.args, 2); }
        }
        os_ << ");\n";
      } else if (member->kind == ast::NodeKind::FieldDecl) {
        const auto& decl = static_cast<const ast::FieldDecl&>(*member);
        if (isStaticField(info, decl)) { assignments(decl); }
      } else if (member->kind == ast::NodeKind::StaticInitializer) {
        nestedBlock(static_cast<const ast::StaticInitializer&>(*member).body.get());
      }
    }
    os_ << "}\n\n";
  }

  void initInstance(const ClassInfo& info) {
    definitionHead(info, {});
    os_ << "auto " << qualifier(info) << "initInstance() -> void {\n";
    for (const auto* member : info.body->members) {
      if (member->kind == ast::NodeKind::FieldDecl) {
        const auto& decl = static_cast<const ast::FieldDecl&>(*member);
        if (!isStaticField(info, decl)) { assignments(decl); }
      } else if (member->kind == ast::NodeKind::InstanceInitializer) {
        nestedBlock(static_cast<const ast::InstanceInitializer&>(*member).body.get());
      }
    }
    os_ << "}\n\n";
  }

  void assignments(const ast::FieldDecl& decl) {
    for (const auto& var : decl.declarators) {
      if (!var.init) { continue; }
      os_ << ind(1) << var.name << " = " << body_.expression(*var.init, 2) << ";\n";
    }
  }

  void nestedBlock(const ast::OpaqueBody* body) {
    os_ << ind(1) << "{\n";
    blockBody(body, 2);
    os_ << ind(1) << "}\n";
  }

  void constructorDef(const ClassInfo& info, const ast::ConstructorDecl& ctor) {
    const TypeRenderer types{plan_, &info, vars(info, ctor.typeParams)};
    definitionHead(info, ctor.typeParams);
    os_ << qualifier(info) << info.emittedName << "(" << params(types, ctor.params) << ")";
    LeadingCall call;
    if (ctor.body) { call = leadingCall(*ctor.body); }
    if (call.found) {
      os_ << " : " << (call.delegates ? info.emittedName + templateArgs(info.typeParams) : superName(info)) << "("
          << body_.expression(call.args, 1) << ")";
    }
    os_ << " {\n";
    if (!call.delegates && needsInitInstance(info)) { os_ << ind(1) << "initInstance();\n"; }
    blockBody(ctor.body.get(), 1, call.found ? call.consumed : 0);
    os_ << "}\n\n";
  }

  void methodDef(const ClassInfo& info, const ast::MethodDecl& m) {
    const TypeRenderer types{plan_, &info, vars(info, m.typeParams)};
    definitionHead(info, m.typeParams);
    os_ << "auto " << qualifier(info) << m.name << "(" << params(types, m.params) << ") -> "
        << types.type(m.returnType) << " {\n";
    blockBody(m.body.get(), 1);
    os_ << "}\n\n";
  }

  // Member templates cannot be pure virtual; calls that reach the base definition throw
  void abstractTemplateDef(const ClassInfo& info, const ast::MethodDecl& m) {
    const TypeRenderer types{plan_, &info, vars(info, m.typeParams)};
    definitionHead(info, m.typeParams);
    os_ << "auto " << qualifier(info) << m.name << "(" << params(types, m.params) << ") -> "
        << types.type(m.returnType) << " {\n";
    os_ << ind(1) << "throw std::logic_error(\"abstract generic method '" << info.emittedName << "::" << m.name
        << "' has no implementation\");\n";
    os_ << "}\n\n";
  }

  void staticTriggers() {
    for (const auto* info : plan_.emissionOrder()) {
      if (info->isTemplate() || !needsInitStatic(*info)) { continue; }
      os_ << "[[maybe_unused]] inline const bool " << info->emittedName << "_staticInit = (" << info->emittedName
          << "::initStatic(), true);\n";
    }
  }
};

} // namespace

std::string Emitter::emit(const ast::File& file) const {
  const auto plan = LoweringPlan::build(file, options_);
  UnitWriter writer{file, plan, options_};
  return writer.run();
}

} // namespace nestport::emit
