#pragma once

#include <string>
#include <vector>
#include "ast/ClassBody.h"
#include "ast/Mixins.h"
#include "ast/Modifiers.h"
#include "ast/Node.h"
#include "ast/TypeRef.h"

namespace nestport::ast {
    enum class ClassKind { Class, Interface, Enum };

    inline const char *to_string(const ClassKind k) {
        switch (k) {
            case ClassKind::Class: return "class";
            case ClassKind::Interface: return "interface";
            case ClassKind::Enum: return "enum";
        }
        return "class";
    }

    struct ClassDecl : Node, HasName {
        ClassKind classKind{ClassKind::Class};
        Modifiers modifiers{};
        std::vector<TypeParam> typeParams;
        std::vector<TypeRef> extends;     // at most one for classes; any number for interfaces
        std::vector<TypeRef> implements;
        ClassBody body;
        explicit ClassDecl(std::string n) : Node(NodeKind::ClassDecl), HasName{std::move(n)} {}

    protected:
        ClassDecl(const NodeKind k, std::string n) : Node(k), HasName{std::move(n)} {}
    };
} // namespace nestport::ast
