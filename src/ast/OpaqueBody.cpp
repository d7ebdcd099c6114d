/***
 * Name: nestport::ast::OpaqueBody
 * Purpose: Out-of-line special members and queries for opaque token spans.
 */
#include "ast/OpaqueBody.h"
#include "ast/AnonymousClassExpr.h"

namespace nestport::ast {

OpaqueSegment::OpaqueSegment() = default;
OpaqueSegment::~OpaqueSegment() = default;
OpaqueSegment::OpaqueSegment(OpaqueSegment&&) noexcept = default;
OpaqueSegment& OpaqueSegment::operator=(OpaqueSegment&&) noexcept = default;

bool OpaqueBody::empty() const {
    for (const auto& seg : segments) {
        if (!seg.tokens.empty() || seg.anonymous) { return false; }
    }
    return true;
}

const AnonymousClassExpr* OpaqueBody::soleAnonymous() const {
    if (segments.size() != 1) { return nullptr; }
    const auto& seg = segments.front();
    if (!seg.anonymous) { return nullptr; }
    // The segment holds the tokens before the expression; none may precede `new`
    for (const auto& tok : seg.tokens) {
        if (tok.kind != lex::TokenKind::Comment) { return nullptr; }
    }
    return seg.anonymous.get();
}

std::vector<const AnonymousClassExpr*> OpaqueBody::anonymousClasses() const {
    std::vector<const AnonymousClassExpr*> out;
    for (const auto& seg : segments) {
        if (seg.anonymous) { out.push_back(seg.anonymous.get()); }
    }
    return out;
}

} // namespace nestport::ast
