#pragma once

#include <string>
#include "ast/Mixins.h"
#include "ast/Modifiers.h"
#include "ast/Node.h"
#include "ast/TypeRef.h"

namespace nestport::ast {
    struct Parameter final : Node, HasName {
        Modifiers modifiers{};  // final and annotations only
        TypeRef type{};         // C-style trailing dims are folded into type.arrayDims
        bool isVarArgs{false};  // Type... name
        Parameter() : Node(NodeKind::Parameter) {}
    };
} // namespace nestport::ast
