/**
 * @file
 * @brief Modifier run preceding a member or type declaration.
 */
#pragma once

#include <algorithm>
#include <string>
#include <string_view>
#include <vector>

namespace nestport::ast {

    enum class Access { Package, Public, Protected, Private };

    struct Modifiers {
        Access access{Access::Package};
        std::vector<std::string> keywords{};    // in source order, access keywords included
        std::vector<std::string> annotations{}; // "@Name" or "@Name(...)" as written

        bool has(const std::string_view keyword) const {
            return std::find(keywords.begin(), keywords.end(), keyword) != keywords.end();
        }
        bool isStatic() const { return has("static"); }
        bool isFinal() const { return has("final"); }
        bool isAbstract() const { return has("abstract"); }
    };

    inline const char *to_string(const Access access) {
        switch (access) {
            case Access::Package: return "package";
            case Access::Public: return "public";
            case Access::Protected: return "protected";
            case Access::Private: return "private";
        }
        return "package";
    }

} // namespace nestport::ast
