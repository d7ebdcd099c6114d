#pragma once

#include <string>
#include "ast/ClassDecl.h"

namespace nestport::ast {
    // Member type declaration; same shape as a top-level class
    struct NestedClassDecl final : ClassDecl {
        explicit NestedClassDecl(std::string n) : ClassDecl(NodeKind::NestedClassDecl, std::move(n)) {}
    };
} // namespace nestport::ast
