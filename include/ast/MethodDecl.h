#pragma once

#include <memory>
#include <string>
#include <vector>
#include "ast/Mixins.h"
#include "ast/Modifiers.h"
#include "ast/Node.h"
#include "ast/OpaqueBody.h"
#include "ast/Parameter.h"
#include "ast/TypeRef.h"

namespace nestport::ast {
    struct MethodDecl final : Node, HasName, HasParams<Parameter> {
        Modifiers modifiers{};
        std::vector<TypeParam> typeParams;
        TypeRef returnType{};
        std::vector<TypeRef> throwsList;
        std::unique_ptr<OpaqueBody> body{}; // null for abstract/interface methods
        MethodDecl() : Node(NodeKind::MethodDecl) {}
    };
} // namespace nestport::ast
