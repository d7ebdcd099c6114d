/***
 * Name: nestport::ast::TypeRef
 * Purpose: Source-like rendering of syntactic type references.
 */
#include "ast/TypeRef.h"

namespace nestport::ast {

std::string TypeRef::simpleName() const {
    const auto dot = name.rfind('.');
    return dot == std::string::npos ? name : name.substr(dot + 1);
}

std::string TypeRef::text() const {
    std::string out;
    switch (wildcard) {
        case Wildcard::Unbounded: return "?";
        case Wildcard::Extends: return "? extends " + (args.empty() ? std::string("Object") : args.front().text());
        case Wildcard::Super: return "? super " + (args.empty() ? std::string("Object") : args.front().text());
        case Wildcard::None: break;
    }
    out = name;
    if (!args.empty()) {
        out += '<';
        for (std::size_t i = 0; i < args.size(); ++i) {
            if (i != 0) { out += ", "; }
            out += args[i].text();
        }
        out += '>';
    }
    for (int i = 0; i < arrayDims; ++i) { out += "[]"; }
    return out;
}

} // namespace nestport::ast
