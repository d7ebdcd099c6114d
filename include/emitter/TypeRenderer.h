/***
 * Name: nestport::emit::TypeRenderer
 * Purpose: Map syntactic type references to C++ type spellings.
 * Inputs:
 *   - LoweringPlan (in-file class names), the class whose scope applies,
 *     and the type variables in scope
 * Outputs:
 *   - C++ type text: fixed-width primitives, `Name*` for references,
 *     `Array<T>*` for arrays, bare type variables
 */
#pragma once

#include <string>
#include <utility>
#include <vector>
#include "ast/TypeRef.h"
#include "emitter/LoweringPlan.h"

namespace nestport::emit {

class TypeRenderer {
 public:
  TypeRenderer(const LoweringPlan& plan, const ClassInfo* scope, std::vector<std::string> typeVars)
      : plan_(plan), scope_(scope), typeVars_(std::move(typeVars)) {}

  // Spelling of a value of this type (field, parameter, return)
  std::string type(const ast::TypeRef& ref) const;
  // Class name without the pointer, as used in base specifiers
  std::string className(const ast::TypeRef& ref) const;

  static std::string primitive(const std::string& name);
  // "a.b.C" -> "a::b::C"
  static std::string qualified(const std::string& dotted);

 private:
  const LoweringPlan& plan_;
  const ClassInfo* scope_;
  std::vector<std::string> typeVars_;

  bool isTypeVar(const ast::TypeRef& ref) const;
};

// "template <typename T, typename U>" or empty
std::string templateHead(const std::vector<std::string>& params);
// "<T, U>" or empty
std::string templateArgs(const std::vector<std::string>& params);

} // namespace nestport::emit
