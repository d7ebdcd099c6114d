#pragma once

#include <memory>
#include "ast/ClassBody.h"
#include "ast/Node.h"
#include "ast/OpaqueBody.h"
#include "ast/TypeRef.h"

namespace nestport::ast {
    // `new Base(args) { members }`; Base is resolved by name at emission
    struct AnonymousClassExpr final : Node {
        TypeRef base{};
        std::unique_ptr<OpaqueBody> args{}; // interior of the argument list
        ClassBody body;
        int endLine{0}; // line of the closing brace
        AnonymousClassExpr() : Node(NodeKind::AnonymousClassExpr) {}
    };
} // namespace nestport::ast
