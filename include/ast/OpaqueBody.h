/**
 * @file
 * @brief Token span the core does not interpret (initializers, arguments, bodies).
 */
#pragma once

#include <memory>
#include <vector>
#include "ast/Node.h"
#include "lexer/Token.h"

namespace nestport::ast {
    struct AnonymousClassExpr; // fwd

    // Tokens re-emitted verbatim, optionally followed by one anonymous class
    // expression found at that point of the span.
    struct OpaqueSegment {
        std::vector<lex::Token> tokens;
        std::unique_ptr<AnonymousClassExpr> anonymous;

        OpaqueSegment();
        ~OpaqueSegment();
        OpaqueSegment(OpaqueSegment&&) noexcept;
        OpaqueSegment& operator=(OpaqueSegment&&) noexcept;
    };

    struct OpaqueBody final : Node {
        std::vector<OpaqueSegment> segments;
        OpaqueBody() : Node(NodeKind::OpaqueBody) {}

        bool empty() const;
        // The anonymous class when the span is exactly one `new T(...) {...}` expression
        const AnonymousClassExpr* soleAnonymous() const;
        std::vector<const AnonymousClassExpr*> anonymousClasses() const;
    };
} // namespace nestport::ast
