#pragma once

#include <memory>
#include <string>
#include <vector>
#include "ast/AnonymousClassExpr.h"
#include "ast/Mixins.h"
#include "ast/Node.h"
#include "ast/OpaqueBody.h"

namespace nestport::ast {
    struct EnumConstant final : Node, HasName {
        std::vector<std::string> annotations;
        // Null when written without parentheses, or moved into classBody->args
        std::unique_ptr<OpaqueBody> args{};
        std::unique_ptr<AnonymousClassExpr> classBody{};  // constant-specific body; base is the enum
        EnumConstant() : Node(NodeKind::EnumConstant) {}
    };
} // namespace nestport::ast
