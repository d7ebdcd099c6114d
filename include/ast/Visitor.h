#pragma once

#include "ast/Nodes.h"
#include "ast/VisitorBase.h"

namespace nestport::ast {

// Central tag switch; no default so a new NodeKind without a case is flagged by -Wswitch
template <typename V>
void dispatch(const Node& n, V& v) {
    switch (n.kind) {
        case NodeKind::File: v.visit(static_cast<const File&>(n)); break;
        case NodeKind::ClassDecl: v.visit(static_cast<const ClassDecl&>(n)); break;
        case NodeKind::NestedClassDecl: v.visit(static_cast<const NestedClassDecl&>(n)); break;
        case NodeKind::FieldDecl: v.visit(static_cast<const FieldDecl&>(n)); break;
        case NodeKind::MethodDecl: v.visit(static_cast<const MethodDecl&>(n)); break;
        case NodeKind::ConstructorDecl: v.visit(static_cast<const ConstructorDecl&>(n)); break;
        case NodeKind::AnonymousClassExpr: v.visit(static_cast<const AnonymousClassExpr&>(n)); break;
        case NodeKind::StaticInitializer: v.visit(static_cast<const StaticInitializer&>(n)); break;
        case NodeKind::InstanceInitializer: v.visit(static_cast<const InstanceInitializer&>(n)); break;
        case NodeKind::Parameter: v.visit(static_cast<const Parameter&>(n)); break;
        case NodeKind::OpaqueBody: v.visit(static_cast<const OpaqueBody&>(n)); break;
        case NodeKind::EnumConstant: v.visit(static_cast<const EnumConstant&>(n)); break;
    }
}

} // namespace nestport::ast
