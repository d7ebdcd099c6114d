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
    struct ConstructorDecl final : Node, HasName, HasParams<Parameter> {
        Modifiers modifiers{};
        std::vector<TypeParam> typeParams;
        std::vector<TypeRef> throwsList;
        std::unique_ptr<OpaqueBody> body{};
        ConstructorDecl() : Node(NodeKind::ConstructorDecl) {}
    };
} // namespace nestport::ast
