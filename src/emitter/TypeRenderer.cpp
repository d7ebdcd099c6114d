/***
 * Name: nestport::emit::TypeRenderer (impl)
 */
#include "emitter/TypeRenderer.h"
#include <algorithm>

namespace nestport::emit {

std::string TypeRenderer::primitive(const std::string& name) {
  if (name == "boolean") { return "bool"; }
  if (name == "byte") { return "int8_t"; }
  if (name == "char") { return "char16_t"; }
  if (name == "short") { return "int16_t"; }
  if (name == "int") { return "int32_t"; }
  if (name == "long") { return "int64_t"; }
  // float, double and void keep their spelling
  return name;
}

std::string TypeRenderer::qualified(const std::string& dotted) {
  std::string out;
  out.reserve(dotted.size() + 4);
  for (const char ch : dotted) {
    if (ch == '.') {
      out += "::";
    } else {
      out += ch;
    }
  }
  return out;
}

bool TypeRenderer::isTypeVar(const ast::TypeRef& ref) const {
  return ref.args.empty() && std::find(typeVars_.begin(), typeVars_.end(), ref.name) != typeVars_.end();
}

std::string TypeRenderer::className(const ast::TypeRef& ref) const {
  std::string out;
  if (const auto* info = plan_.resolve(ref.name, scope_)) {
    out = info->emittedName;
  } else {
    out = qualified(ref.name);
  }
  if (!ref.args.empty()) {
    out += '<';
    for (std::size_t i = 0; i < ref.args.size(); ++i) {
      if (i != 0) { out += ", "; }
      out += type(ref.args[i]);
    }
    out += '>';
  }
  return out;
}

std::string TypeRenderer::type(const ast::TypeRef& ref) const {
  using W = ast::TypeRef::Wildcard;
  if (ref.wildcard != W::None) {
    if (ref.wildcard != W::Unbounded && !ref.args.empty()) { return type(ref.args.front()); }
    return "Object*";
  }
  std::string out;
  if (ref.primitive) {
    out = primitive(ref.name);
  } else if (isTypeVar(ref)) {
    out = ref.name;
  } else {
    out = className(ref) + "*";
  }
  for (int i = 0; i < ref.arrayDims; ++i) { out = "Array<" + out + ">*"; }
  return out;
}

std::string templateHead(const std::vector<std::string>& params) {
  if (params.empty()) { return {}; }
  std::string out = "template <";
  for (std::size_t i = 0; i < params.size(); ++i) {
    if (i != 0) { out += ", "; }
    out += "typename " + params[i];
  }
  return out + ">";
}

std::string templateArgs(const std::vector<std::string>& params) {
  if (params.empty()) { return {}; }
  std::string out = "<";
  for (std::size_t i = 0; i < params.size(); ++i) {
    if (i != 0) { out += ", "; }
    out += params[i];
  }
  return out + ">";
}

} // namespace nestport::emit
