/***
 * Name: nestport::ast::Node
 * Purpose: Common base of every AST node: kind tag, provenance and element span.
 * Theory of Operation:
 *   Location is that of the node's first token. The span indexes the element
 *   sequence the node was parsed from (a class interior for members, the root
 *   group for top-level declarations) so dispatch results can be checked
 *   against matcher extents.
 */
#pragma once

#include <cstddef>
#include <string>
#include "ast/NodeKind.h"

namespace nestport::ast {

struct VisitorBase;

struct Node {
    explicit Node(const NodeKind k) : kind(k) {}
    virtual ~Node() = default;

    // Routes through the central NodeKind switch in ast/Visitor.h
    virtual void accept(VisitorBase& v) const;

    NodeKind kind;
    std::string file{};
    int line{0};
    int col{0};
    std::size_t spanBegin{0};
    std::size_t spanEnd{0};  // exclusive
};

} // namespace nestport::ast
