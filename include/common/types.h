#ifndef AEP_TYPES_H
#define AEP_TYPES_H

#include <cstddef>
#include <string>
#include <variant>

namespace aep {

enum class FlightStatus {
    IN_FLIGHT,
    REVERSING,
    DIVERTED,
    LANDED
};

enum class DiversionReason {
    DELAY_BOUND,      // time since radar contact exceeded the bound
    CLOSURE,          // no landing slot after the closure window within the bound
    AIRPORT_CLOSING   // cannot land before the end of the simulated period
};

// Phase payloads. Each carries only what is valid in that phase.
struct InFlight {
    double velocity_kt;
};

struct Reversing {
    int since_minute;
};

struct Landed {
    int landing_minute;
};

struct Diverted {
    int diversion_minute;
    DiversionReason reason;
};

using FlightPhase = std::variant<InFlight, Reversing, Landed, Diverted>;

// One frame of an aircraft trajectory, stamped at the end of the minute
struct HistoryFrame {
    int minute;
    double position_nm;
    double velocity_kt;
    FlightStatus status;

    bool operator==(const HistoryFrame& other) const {
        return minute == other.minute &&
               position_nm == other.position_nm &&
               velocity_kt == other.velocity_kt &&
               status == other.status;
    }
    bool operator!=(const HistoryFrame& other) const { return !(*this == other); }
};

// Applies to positions strictly above floor_nm (the lowest band also covers 0)
struct SpeedBand {
    double floor_nm;
    double max_speed_kt;
    double min_speed_kt;
};

struct SpeedLimits {
    double max_kt;
    double min_kt;
};

// Runway closed for landings during [start_minute, end_minute)
struct ClosureWindow {
    bool enabled{false};
    int start_minute{0};
    int end_minute{0};

    bool covers(int minute) const {
        return enabled && minute >= start_minute && minute < end_minute;
    }
    bool hasEnded(int minute) const {
        return !enabled || minute >= end_minute;
    }
    int duration() const { return enabled ? end_minute - start_minute : 0; }
};

// Per-minute census recorded by the driver
struct StateCounts {
    int minute;
    size_t in_flight;
    size_t reversing;
    size_t landed;
    size_t diverted;
};

std::string getStatusString(FlightStatus status);
std::string getReasonString(DiversionReason reason);

} // namespace aep

#endif // AEP_TYPES_H
