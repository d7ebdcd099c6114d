/**
 * @file
 * @brief AST geometry visitor declarations.
 */
#pragma once

#include <cstdint>
#include "ast/ClassBody.h"
#include "ast/VisitorBase.h"

namespace nestport::ast {

struct GeometryVisitor final : public VisitorBase {
  uint64_t nodes{0};
  uint64_t maxDepth{0};
  uint64_t depth{0};

  void bump();
  void members(const ClassBody& body);

  struct DepthScope {
    uint64_t& d;
    explicit DepthScope(uint64_t& ref);
    ~DepthScope();
    DepthScope(const DepthScope&) = delete;
    DepthScope& operator=(const DepthScope&) = delete;
    DepthScope(DepthScope&&) = delete;
    DepthScope& operator=(DepthScope&&) = delete;
  };

  void visit(const File& file) override;
  void visit(const ClassDecl& cls) override;
  void visit(const NestedClassDecl& cls) override;
  void visit(const FieldDecl& field) override;
  void visit(const MethodDecl& method) override;
  void visit(const ConstructorDecl& ctor) override;
  void visit(const AnonymousClassExpr& anon) override;
  void visit(const StaticInitializer& init) override;
  void visit(const InstanceInitializer& init) override;
  void visit(const Parameter& param) override;
  void visit(const OpaqueBody& body) override;
  void visit(const EnumConstant& constant) override;
};

} // namespace nestport::ast
