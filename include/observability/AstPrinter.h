/***
 * Name: nestport::obs::AstPrinter
 * Purpose: Visitor-based AST pretty-printer for diagnostics/logging (--dump-ast).
 * Inputs:
 *   - ast::File
 * Outputs:
 *   - Formatted string with node kinds and salient fields.
 * Theory of Operation:
 *   Implements ast::VisitorBase to traverse nodes, collecting a textual
 *   representation with indentation reflecting tree depth. Class members are
 *   printed in source order; opaque spans only show the anonymous classes
 *   they contain.
 */
#pragma once

#include <string>
#include <sstream>
#include "ast/Nodes.h"
#include "ast/VisitorBase.h"

namespace nestport::obs {

class AstPrinter : public ast::VisitorBase {
 public:
  std::string print(const ast::File& f) {
    ss_.str(""); ss_.clear(); depth_ = 0;
    f.accept(*this);
    return ss_.str();
  }

  void visit(const ast::File& f) override {
    line(std::string("File package=") + (f.packageName.empty() ? "<default>" : f.packageName));
    depth_++;
    for (const auto& imp : f.imports) { line(std::string("Import ") + (imp.isStatic ? "static " : "") + imp.name + (imp.isWildcard ? ".*" : "")); }
    for (const auto& c : f.classes) c->accept(*this);
    depth_--;
  }
  void visit(const ast::ClassDecl& c) override { classLine("ClassDecl", c); }
  void visit(const ast::NestedClassDecl& c) override { classLine("NestedClassDecl", c); }
  void visit(const ast::FieldDecl& f) override {
    line("FieldDecl " + mods(f.modifiers) + f.type.text());
    depth_++;
    for (const auto& d : f.declarators) {
      line("Declarator " + d.name);
      if (d.init) { depth_++; d.init->accept(*this); depth_--; }
    }
    depth_--;
  }
  void visit(const ast::MethodDecl& m) override {
    line("MethodDecl " + mods(m.modifiers) + m.returnType.text() + " " + m.name + (m.body ? "" : " (no body)"));
    depth_++; for (const auto& p : m.params) p.accept(*this); if (m.body) m.body->accept(*this); depth_--;
  }
  void visit(const ast::ConstructorDecl& c) override {
    line("ConstructorDecl " + mods(c.modifiers) + c.name);
    depth_++; for (const auto& p : c.params) p.accept(*this); if (c.body) c.body->accept(*this); depth_--;
  }
  void visit(const ast::AnonymousClassExpr& a) override { line("AnonymousClassExpr base=" + a.base.text()); members(a.body); }
  void visit(const ast::StaticInitializer& s) override { line("StaticInitializer"); depth_++; if (s.body) s.body->accept(*this); depth_--; }
  void visit(const ast::InstanceInitializer& s) override { line("InstanceInitializer"); depth_++; if (s.body) s.body->accept(*this); depth_--; }
  void visit(const ast::Parameter& p) override { line("Parameter " + p.type.text() + (p.isVarArgs ? "... " : " ") + p.name); }
  void visit(const ast::OpaqueBody& b) override {
    std::size_t tokens = 0;
    for (const auto& seg : b.segments) tokens += seg.tokens.size();
    line("OpaqueBody tokens=" + std::to_string(tokens));
    depth_++; for (const auto* a : b.anonymousClasses()) a->accept(*this); depth_--;
  }
  void visit(const ast::EnumConstant& e) override {
    line("EnumConstant " + e.name);
    depth_++; if (e.args) e.args->accept(*this); if (e.classBody) e.classBody->accept(*this); depth_--;
  }

 private:
  static std::string mods(const ast::Modifiers& m) {
    std::string out;
    for (const auto& a : m.annotations) { out += a; out += ' '; }
    for (const auto& k : m.keywords) { out += k; out += ' '; }
    return out;
  }
  void classLine(const char* kind, const ast::ClassDecl& c) {
    std::string text = std::string(kind) + " " + ast::to_string(c.classKind) + " " + c.name;
    for (const auto& e : c.extends) text += " extends " + e.text();
    for (const auto& i : c.implements) text += " implements " + i.text();
    line(text);
    members(c.body);
  }
  void members(const ast::ClassBody& body) { depth_++; for (const auto* m : body.members) m->accept(*this); depth_--; }
  void indent() { for (int i = 0; i < depth_; ++i) ss_ << "  "; }
  void line(const std::string& s) { indent(); ss_ << s << "\n"; }
  std::ostringstream ss_{};
  int depth_{0};
};

} // namespace nestport::obs
