#pragma once

namespace nestport::ast {
    enum class NodeKind {
        File,
        ClassDecl,
        NestedClassDecl,
        FieldDecl,
        MethodDecl,
        ConstructorDecl,
        AnonymousClassExpr,
        StaticInitializer,
        InstanceInitializer,
        Parameter,
        OpaqueBody,
        EnumConstant
    };

    inline const char *to_string(const NodeKind element) {
        switch (element) {
            case NodeKind::File: return "File";
            case NodeKind::ClassDecl: return "ClassDecl";
            case NodeKind::NestedClassDecl: return "NestedClassDecl";
            case NodeKind::FieldDecl: return "FieldDecl";
            case NodeKind::MethodDecl: return "MethodDecl";
            case NodeKind::ConstructorDecl: return "ConstructorDecl";
            case NodeKind::AnonymousClassExpr: return "AnonymousClassExpr";
            case NodeKind::StaticInitializer: return "StaticInitializer";
            case NodeKind::InstanceInitializer: return "InstanceInitializer";
            case NodeKind::Parameter: return "Parameter";
            case NodeKind::OpaqueBody: return "OpaqueBody";
            case NodeKind::EnumConstant: return "EnumConstant";
        }
        return "unknown";
    }
} // namespace nestport::ast
