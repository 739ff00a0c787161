#include "common/types.h"

namespace aep {

std::string getStatusString(FlightStatus status) {
    switch (status) {
        case FlightStatus::IN_FLIGHT:  return "IN_FLIGHT";
        case FlightStatus::REVERSING:  return "REVERSING";
        case FlightStatus::DIVERTED:   return "DIVERTED";
        case FlightStatus::LANDED:     return "LANDED";
        default:                       return "UNKNOWN";
    }
}

std::string getReasonString(DiversionReason reason) {
    switch (reason) {
        case DiversionReason::DELAY_BOUND:     return "DELAY_BOUND";
        case DiversionReason::CLOSURE:         return "CLOSURE";
        case DiversionReason::AIRPORT_CLOSING: return "AIRPORT_CLOSING";
        default:                               return "UNKNOWN";
    }
}

} // namespace aep
