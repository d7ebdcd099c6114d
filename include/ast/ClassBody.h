/**
 * @file
 * @brief Member lists owned by a class, an enum or an anonymous class.
 */
#pragma once

#include <memory>
#include <vector>
#include "ast/Node.h"

namespace nestport::ast {
    struct FieldDecl; struct MethodDecl; struct ConstructorDecl; struct NestedClassDecl;
    struct StaticInitializer; struct InstanceInitializer; struct EnumConstant;

    struct ClassBody {
        std::vector<std::unique_ptr<FieldDecl>> fields;
        std::vector<std::unique_ptr<MethodDecl>> methods;
        std::vector<std::unique_ptr<ConstructorDecl>> constructors;
        std::vector<std::unique_ptr<NestedClassDecl>> nestedClasses;
        std::vector<std::unique_ptr<StaticInitializer>> staticInitializers;
        std::vector<std::unique_ptr<InstanceInitializer>> instanceInitializers;
        std::vector<std::unique_ptr<EnumConstant>> enumConstants;
        std::vector<const Node*> members; // every member above, in source order (non-owning)

        ClassBody();
        ~ClassBody();
        ClassBody(ClassBody&&) noexcept;
        ClassBody& operator=(ClassBody&&) noexcept;

        // Route a parsed member into its list; returns false for non-member kinds
        bool add(std::unique_ptr<Node> member);
    };
} // namespace nestport::ast
