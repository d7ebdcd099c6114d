/***
 * Name: nestport::emit::LoweringPlan
 * Purpose: Decide names, reference edges, base resolution and output order for
 *          every class the emitter produces.
 * Inputs:
 *   - File AST, EmitOptions (known external types)
 * Outputs:
 *   - One ClassInfo per top-level, nested and anonymous class
 *   - Declaration order (source pre-order) and emission order (bases first)
 * Theory of Operation:
 *   A visitor walks the AST in source order assigning emitted names: nested
 *   classes are Outer_Inner; anonymous classes are numbered per top-level
 *   class, <TopLevel>_<n>. Each class records its nested and anonymous
 *   children as reference edges. Base names are then resolved through the
 *   lexical scope chain (member types, types inherited from in-file bases,
 *   the scope's own name), the file's top-level classes, explicit imports and
 *   the known external types; anything else raises EmissionError. The
 *   emission order hoists children before their enclosing class and places a
 *   base before its subclasses, deferring a subclass whose base is still
 *   being emitted. Inheritance cycles raise EmissionError.
 */
#pragma once

#include <memory>
#include <string>
#include <unordered_map>
#include <vector>
#include "ast/Nodes.h"
#include "emitter/EmitOptions.h"

namespace nestport::emit {

struct ClassInfo {
  const ast::Node* node{nullptr};
  const ast::ClassDecl* decl{nullptr};          // named classes
  const ast::AnonymousClassExpr* anon{nullptr};  // anonymous classes and enum constant bodies
  const ast::ClassBody* body{nullptr};
  std::string simpleName{};                      // empty for anonymous classes
  std::string emittedName{};
  ClassInfo* parent{nullptr};                    // lexically enclosing class
  ClassInfo* topLevel{nullptr};
  std::vector<ClassInfo*> inner{};               // reference edges in source order
  std::vector<const ClassInfo*> inFileBases{};
  std::vector<std::string> typeParams{};

  bool isAnonymous() const { return anon != nullptr; }
  bool isInterface() const { return decl != nullptr && decl->classKind == ast::ClassKind::Interface; }
  bool isEnum() const { return decl != nullptr && decl->classKind == ast::ClassKind::Enum; }
  bool isTemplate() const { return !typeParams.empty(); }
};

class LoweringPlan {
 public:
  // Throws EmissionError for unresolved bases and inheritance cycles
  static LoweringPlan build(const ast::File& file, const EmitOptions& options);

  const std::vector<const ClassInfo*>& declarationOrder() const { return declared_; }
  const std::vector<const ClassInfo*>& emissionOrder() const { return emission_; }
  const ClassInfo* find(const ast::Node* node) const;

  // In-file class a (possibly dotted) type name denotes from `scope`; nullptr otherwise
  const ClassInfo* resolve(const std::string& name, const ClassInfo* scope) const;

 private:
  std::vector<std::unique_ptr<ClassInfo>> classes_;
  std::vector<const ClassInfo*> topLevel_;
  std::vector<const ClassInfo*> declared_;
  std::vector<const ClassInfo*> emission_;
  std::unordered_map<const ast::Node*, const ClassInfo*> byNode_;

  friend class PlanBuilder;
  const ClassInfo* member(const ClassInfo* owner, const std::string& name, int depth) const;
  void resolveBases(const ast::File& file, const EmitOptions& options);
  void checkCycles() const;
  void orderEmission();
};

} // namespace nestport::emit
