/***
 * Name: nestport::ast::Node::accept
 */
#include "ast/Node.h"
#include "ast/Visitor.h"

namespace nestport::ast {

void Node::accept(VisitorBase& visitor) const { dispatch(*this, visitor); }

} // namespace nestport::ast
