/**
 * Name: nestport::group::Element
 * Purpose: One entry of a grouped token sequence: either a Token or a TokenGroup.
 */
#pragma once

#include <memory>
#include "grouping/GroupKind.h"
#include "lexer/Token.h"

namespace nestport::group {

struct TokenGroup; // fwd

class Element {
public:
    explicit Element(lex::Token token);
    explicit Element(std::unique_ptr<TokenGroup> group);
    ~Element();
    Element(Element&& other) noexcept;
    Element& operator=(Element&& other) noexcept;
    Element(const Element&) = delete;
    Element& operator=(const Element&) = delete;

    bool isGroup() const { return group_ != nullptr; }
    bool isGroup(GroupKind kind) const;
    bool isToken() const { return group_ == nullptr; }
    // True when this is a plain token of the given kind
    bool is(lex::TokenKind kind) const { return group_ == nullptr && token_.kind == kind; }

    // Precondition: isToken()
    const lex::Token& token() const { return token_; }
    // Precondition: isGroup()
    const TokenGroup& group() const { return *group_; }

    // The token itself, or the opening bracket of a group
    const lex::Token& firstToken() const;

private:
    lex::Token token_{};
    std::unique_ptr<TokenGroup> group_{};
};

} // namespace nestport::group
