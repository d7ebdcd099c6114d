/**
 * @file
 * @brief AST root for one source file.
 */
#pragma once

#include <memory>
#include <string>
#include <vector>
#include "ast/ClassDecl.h"
#include "ast/Node.h"

namespace nestport::ast {
    struct ImportDecl {
        std::string name;      // dotted, without the trailing ".*"
        bool isStatic{false};
        bool isWildcard{false};
    };

    struct File final : Node {
        std::string packageName{}; // empty for the default package
        std::vector<ImportDecl> imports;
        std::vector<std::unique_ptr<ClassDecl>> classes;
        File() : Node(NodeKind::File) {}
    };
} // namespace nestport::ast
