/**
 * @file
 * @brief Syntactic type reference (no resolution happens at parse time).
 */
#pragma once

#include <string>
#include <vector>

namespace nestport::ast {

    struct TypeRef {
        enum class Wildcard { None, Unbounded, Extends, Super };

        std::string name{};            // dotted as written: "int", "Map", "java.util.List", "Outer.Inner"
        std::vector<TypeRef> args{};   // type arguments of the last segment carrying them
        int arrayDims{0};
        bool primitive{false};         // primitive keyword or void
        Wildcard wildcard{Wildcard::None}; // for Extends/Super the bound is args[0]
        std::string file{};            // first token of the reference; line 0 when synthesized
        int line{0};
        int col{0};

        bool isVoid() const { return primitive && name == "void"; }
        // Last dotted segment ("Inner" for "Outer.Inner")
        std::string simpleName() const;
        // Source-like rendering, e.g. "Map<String, List<Integer>>[]"
        std::string text() const;
    };

    struct TypeParam {
        std::string name{};
        std::vector<TypeRef> bounds{};
    };

} // namespace nestport::ast
