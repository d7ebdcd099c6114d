#pragma once

#include <memory>
#include <string>
#include <vector>
#include "ast/Modifiers.h"
#include "ast/Node.h"
#include "ast/OpaqueBody.h"
#include "ast/TypeRef.h"

namespace nestport::ast {
    struct FieldDeclarator {
        std::string name;
        int extraDims{0};                  // int x[] style
        std::unique_ptr<OpaqueBody> init{}; // optional
        int line{0};
        int col{0};
    };

    // One declaration statement; `int a = 1, b;` yields two declarators
    struct FieldDecl final : Node {
        Modifiers modifiers{};
        TypeRef type{};
        std::vector<FieldDeclarator> declarators;
        FieldDecl() : Node(NodeKind::FieldDecl) {}
    };
} // namespace nestport::ast
