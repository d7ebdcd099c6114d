/***
 * Name: nestport::ast mixins
 * Purpose: Fields shared by declaration nodes: a simple name and a parameter list.
 */
#pragma once

#include <cstddef>
#include <string>
#include <vector>

namespace nestport::ast {

struct HasName {
    std::string name;
};

template <typename ParamT>
struct HasParams {
    std::vector<ParamT> params;

    // Overload identity used for override detection; varargs count as one parameter
    std::size_t arity() const { return params.size(); }
};

} // namespace nestport::ast
