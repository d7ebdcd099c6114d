#pragma once

#include <memory>
#include "ast/Node.h"
#include "ast/OpaqueBody.h"

namespace nestport::ast {
    struct StaticInitializer final : Node {
        std::unique_ptr<OpaqueBody> body{};
        StaticInitializer() : Node(NodeKind::StaticInitializer) {}
    };
} // namespace nestport::ast
