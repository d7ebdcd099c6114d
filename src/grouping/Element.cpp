/**
 * Name: nestport::group::Element
 * Purpose: Out-of-line members needing the complete TokenGroup type.
 */
#include "grouping/Element.h"
#include "grouping/TokenGroup.h"
#include <utility>

namespace nestport::group {

Element::Element(lex::Token token) : token_(std::move(token)) {}

Element::Element(std::unique_ptr<TokenGroup> group) : group_(std::move(group)) {}

Element::~Element() = default;

Element::Element(Element&& other) noexcept = default;

Element& Element::operator=(Element&& other) noexcept = default;

bool Element::isGroup(const GroupKind kind) const { return group_ != nullptr && group_->kind == kind; }

const lex::Token& Element::firstToken() const { return group_ ? group_->open : token_; }

} // namespace nestport::group
