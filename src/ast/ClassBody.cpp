/***
 * Name: nestport::ast::ClassBody
 * Purpose: Route parsed members into typed lists while keeping source order.
 */
#include "ast/ClassBody.h"
#include "ast/Nodes.h"

namespace nestport::ast {

ClassBody::ClassBody() = default;
ClassBody::~ClassBody() = default;
ClassBody::ClassBody(ClassBody&&) noexcept = default;
ClassBody& ClassBody::operator=(ClassBody&&) noexcept = default;

namespace {
template <typename T>
void adopt(std::unique_ptr<Node>& member, std::vector<std::unique_ptr<T>>& into, std::vector<const Node*>& order) {
    std::unique_ptr<T> typed{static_cast<T*>(member.release())};
    order.push_back(typed.get());
    into.push_back(std::move(typed));
}
} // namespace

bool ClassBody::add(std::unique_ptr<Node> member) {
    if (!member) { return false; }
    switch (member->kind) {
        case NodeKind::FieldDecl: adopt(member, fields, members); return true;
        case NodeKind::MethodDecl: adopt(member, methods, members); return true;
        case NodeKind::ConstructorDecl: adopt(member, constructors, members); return true;
        case NodeKind::NestedClassDecl: adopt(member, nestedClasses, members); return true;
        case NodeKind::StaticInitializer: adopt(member, staticInitializers, members); return true;
        case NodeKind::InstanceInitializer: adopt(member, instanceInitializers, members); return true;
        case NodeKind::EnumConstant: adopt(member, enumConstants, members); return true;
        case NodeKind::File:
        case NodeKind::ClassDecl:
        case NodeKind::AnonymousClassExpr:
        case NodeKind::Parameter:
        case NodeKind::OpaqueBody:
            return false;
    }
    return false;
}

} // namespace nestport::ast
