#include "orthoplan/architecture.h"

namespace Orthoplan::Engine {

const char* ToString(WallType type) {
    switch (type) {
        case WallType::EXTERIOR: return "exterior";
        case WallType::INTERIOR: return "interior";
    }
    return "unknown";
}

const char* ToString(OpeningType type) {
    switch (type) {
        case OpeningType::DOOR: return "door";
        case OpeningType::WINDOW: return "window";
    }
    return "unknown";
}

} // namespace Orthoplan::Engine
