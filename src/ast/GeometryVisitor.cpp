/**
 * @file
 * @brief AST geometry visitor implementation.
 */
/***
 * Name: nestport::ast::GeometryVisitor
 * Purpose: AST visitor computing node count and max depth.
 * Theory of Operation: Members are walked through ClassBody::members so the
 *   count follows source order; anonymous classes inside opaque spans and enum
 *   constant bodies count one level below the node that holds them.
 */
#include "ast/GeometryVisitor.h"

#include "ast/Nodes.h"

#include <algorithm>

namespace nestport::ast {
    void GeometryVisitor::bump() {
        ++nodes;
        maxDepth = std::max(maxDepth, depth);
    }

    GeometryVisitor::DepthScope::DepthScope(uint64_t &ref) : d(ref) { ++d; }
    GeometryVisitor::DepthScope::~DepthScope() { --d; }

    void GeometryVisitor::members(const ClassBody &body) {
        for (const auto *member: body.members) {
            const DepthScope scope{depth};
            member->accept(*this);
        }
    }

    void GeometryVisitor::visit(const File &file) {
        bump();
        for (const auto &cls: file.classes) {
            const DepthScope scope{depth};
            cls->accept(*this);
        }
    }

    void GeometryVisitor::visit(const ClassDecl &cls) {
        bump();
        members(cls.body);
    }

    void GeometryVisitor::visit(const NestedClassDecl &cls) {
        bump();
        members(cls.body);
    }

    void GeometryVisitor::visit(const FieldDecl &field) {
        bump();
        for (const auto &decl: field.declarators) {
            if (decl.init) {
                const DepthScope scope{depth};
                decl.init->accept(*this);
            }
        }
    }

    void GeometryVisitor::visit(const MethodDecl &method) {
        bump();
        for (const auto &param: method.params) {
            const DepthScope scope{depth};
            param.accept(*this);
        }
        if (method.body) {
            const DepthScope scope{depth};
            method.body->accept(*this);
        }
    }

    void GeometryVisitor::visit(const ConstructorDecl &ctor) {
        bump();
        for (const auto &param: ctor.params) {
            const DepthScope scope{depth};
            param.accept(*this);
        }
        if (ctor.body) {
            const DepthScope scope{depth};
            ctor.body->accept(*this);
        }
    }

    void GeometryVisitor::visit(const AnonymousClassExpr &anon) {
        bump();
        if (anon.args) {
            const DepthScope scope{depth};
            anon.args->accept(*this);
        }
        members(anon.body);
    }

    void GeometryVisitor::visit(const StaticInitializer &init) {
        bump();
        if (init.body) {
            const DepthScope scope{depth};
            init.body->accept(*this);
        }
    }

    void GeometryVisitor::visit(const InstanceInitializer &init) {
        bump();
        if (init.body) {
            const DepthScope scope{depth};
            init.body->accept(*this);
        }
    }

    void GeometryVisitor::visit(const Parameter &) { bump(); }

    void GeometryVisitor::visit(const OpaqueBody &body) {
        bump();
        for (const auto *anon: body.anonymousClasses()) {
            const DepthScope scope{depth};
            anon->accept(*this);
        }
    }

    void GeometryVisitor::visit(const EnumConstant &constant) {
        bump();
        if (constant.args) {
            const DepthScope scope{depth};
            constant.args->accept(*this);
        }
        if (constant.classBody) {
            const DepthScope scope{depth};
            constant.classBody->accept(*this);
        }
    }
} // namespace nestport::ast
