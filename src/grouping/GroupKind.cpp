/**
 * Name: nestport::group::GroupKind helpers
 * Purpose: Implementation for GroupKind utilities.
 */
#include "grouping/GroupKind.h"

namespace nestport::group {

const char* to_string(const GroupKind k) {
    switch (k) {
        case GroupKind::Root: return "Root";
        case GroupKind::Curly: return "Curly";
        case GroupKind::Round: return "Round";
        case GroupKind::Square: return "Square";
        case GroupKind::Angle: return "Angle";
    }
    return "Unknown";
}

} // namespace nestport::group
