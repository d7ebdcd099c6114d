/**
 * @file
 * @brief AST geometry computation implementation.
 */
/***
 * Name: nestport::ast::ComputeGeometry
 * Purpose: Traverse a file AST and compute node count and max depth.
 */
#include "ast/GeometrySummary.h"
#include "ast/GeometryVisitor.h"

namespace nestport::ast {

GeometrySummary ComputeGeometry(const File& file) {
  GeometryVisitor visitor;
  file.accept(visitor);
  return GeometrySummary{visitor.nodes, visitor.maxDepth};
}

} // namespace nestport::ast
