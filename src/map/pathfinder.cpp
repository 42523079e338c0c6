#include "map/pathfinder.hpp"

namespace tilemap::map {

const char* stop_reason_name(StopReason reason) {
    switch (reason) {
    case StopReason::Found:
        return "Found";
    case StopReason::Exhausted:
        return "Exhausted";
    case StopReason::NodeLimit:
        return "NodeLimit";
    case StopReason::Cancelled:
        return "Cancelled";
    }
    return "Unknown";
}

} // namespace tilemap::map
