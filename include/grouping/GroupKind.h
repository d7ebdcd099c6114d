/**
 * Name: nestport::group::GroupKind
 * Purpose: Bracket kinds a TokenGroup can represent.
 */
#pragma once

namespace nestport::group {

enum class GroupKind {
    Root, // synthetic top level; has no bracket tokens
    Curly, // { }
    Round, // ( )
    Square, // [ ]
    Angle // < > (type arguments / type parameters only)
};

const char* to_string(GroupKind k);

} // namespace nestport::group
