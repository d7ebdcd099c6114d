/***
 * Name: nestport::emit::EmitOptions
 * Purpose: Knobs for C++ emission.
 */
#pragma once

#include <set>
#include <string>

namespace nestport::emit {

struct EmitOptions {
  // Simple or fully qualified names accepted as bases without an in-file declaration
  std::set<std::string> knownExternalTypes{defaultKnownTypes()};
  // Header declaring Object, String, Array<T> and the other runtime types
  std::string runtimeHeader{"nestport/runtime.h"};
  // Implicit root of every class without an extends clause
  std::string rootClass{"Object"};
  // Shown in the banner comment
  std::string sourceName{};
  int indentWidth{4};

  static std::set<std::string> defaultKnownTypes();
};

} // namespace nestport::emit
