#pragma once

#include <memory>
#include "ast/Node.h"
#include "ast/OpaqueBody.h"

namespace nestport::ast {
    struct InstanceInitializer final : Node {
        std::unique_ptr<OpaqueBody> body{};
        InstanceInitializer() : Node(NodeKind::InstanceInitializer) {}
    };
} // namespace nestport::ast
