/**
 * @file
 * @brief AST geometry summary declarations.
 */
#pragma once

#include <cstdint>
#include "ast/File.h"


namespace nestport::ast {
    // Compute a simple geometry summary for a file
    struct GeometrySummary {
        uint64_t nodes{0};
        uint64_t maxDepth{0};
    };

    GeometrySummary ComputeGeometry(const File& file);

} // namespace nestport::ast
