/**
 * @file
 * @brief Umbrella include for every AST node type.
 */
#pragma once

#include "ast/Node.h"
#include "ast/NodeKind.h"
#include "ast/Modifiers.h"
#include "ast/TypeRef.h"
#include "ast/Parameter.h"
#include "ast/OpaqueBody.h"
#include "ast/ClassBody.h"
#include "ast/FieldDecl.h"
#include "ast/MethodDecl.h"
#include "ast/ConstructorDecl.h"
#include "ast/ClassDecl.h"
#include "ast/NestedClassDecl.h"
#include "ast/AnonymousClassExpr.h"
#include "ast/StaticInitializer.h"
#include "ast/InstanceInitializer.h"
#include "ast/EnumConstant.h"
#include "ast/File.h"
