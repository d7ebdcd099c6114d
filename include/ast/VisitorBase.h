#pragma once

#include "ast/NodeKind.h"

namespace nestport::ast {

// Forward declarations to break include cycles
struct File; struct ClassDecl; struct NestedClassDecl; struct FieldDecl; struct MethodDecl;
struct ConstructorDecl; struct AnonymousClassExpr; struct StaticInitializer; struct InstanceInitializer;
struct Parameter; struct OpaqueBody; struct EnumConstant;

// Virtual visitor interface for AST traversal. Every node kind is pure virtual so
// a visitor that forgets one fails to compile.
struct VisitorBase {
  virtual ~VisitorBase() = default;
  virtual void visit(const File&) = 0;
  virtual void visit(const ClassDecl&) = 0;
  virtual void visit(const NestedClassDecl&) = 0;
  virtual void visit(const FieldDecl&) = 0;
  virtual void visit(const MethodDecl&) = 0;
  virtual void visit(const ConstructorDecl&) = 0;
  virtual void visit(const AnonymousClassExpr&) = 0;
  virtual void visit(const StaticInitializer&) = 0;
  virtual void visit(const InstanceInitializer&) = 0;
  virtual void visit(const Parameter&) = 0;
  virtual void visit(const OpaqueBody&) = 0;
  virtual void visit(const EnumConstant&) = 0;
};

} // namespace nestport::ast
