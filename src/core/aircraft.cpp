#include "core/aircraft.h"
#include "common/constants.h"
#include "common/errors.h"
#include "common/logger.h"
#include <algorithm>
#include <iomanip>
#include <sstream>
#include <utility>

namespace aep {

Aircraft::Aircraft(int id,
                   int appearance_minute,
                   std::shared_ptr<const SimulationConfig> config)
    : id_(id)
    , appearance_minute_(appearance_minute)
    , config_(std::move(config))
    , expected_arrival_minute_(appearance_minute)
    , position_nm_(0.0)
    , phase_(InFlight{0.0})
    , ever_reversed_(false)
    , reversal_count_(0) {
    if (!config_) {
        throw std::invalid_argument("Aircraft requires a configuration");
    }
    position_nm_ = config_->initial_distance_nm;
    phase_ = InFlight{permittedSpeed().max_kt};

    // Landing happens during the last step, so an aircraft that moves from
    // its appearance minute on lands at appearance + steps - 1.
    expected_arrival_minute_ =
        appearance_minute_ + expectedTimeToLand(config_->initial_distance_nm) - 1;

    std::ostringstream oss;
    oss << "Radar contact " << getCallsign()
        << std::fixed << std::setprecision(1)
        << " at minute " << appearance_minute_
        << ", " << position_nm_ << " nm, expected arrival minute "
        << expected_arrival_minute_;
    Logger::getInstance().debug(oss.str());
}

std::string Aircraft::getCallsign() const {
    std::ostringstream oss;
    oss << "AEP" << std::setfill('0') << std::setw(3) << id_;
    return oss.str();
}

double Aircraft::getVelocity() const {
    if (const auto* flying = std::get_if<InFlight>(&phase_)) {
        return flying->velocity_kt;
    }
    if (isReversing()) {
        return -config_->reversal_speed_kt;
    }
    return 0.0;
}

FlightStatus Aircraft::getStatus() const {
    switch (phase_.index()) {
        case 0:  return FlightStatus::IN_FLIGHT;
        case 1:  return FlightStatus::REVERSING;
        case 2:  return FlightStatus::LANDED;
        default: return FlightStatus::DIVERTED;
    }
}

bool Aircraft::isOnThreshold() const {
    return position_nm_ <= constants::LANDED_TOLERANCE_NM;
}

SpeedLimits Aircraft::permittedSpeed() const {
    return permittedSpeed(position_nm_);
}

SpeedLimits Aircraft::permittedSpeed(double position_nm) const {
    return config_->speed_table.limitsAt(position_nm);
}

int Aircraft::expectedTimeToLand() const {
    return expectedTimeToLand(position_nm_);
}

int Aircraft::expectedTimeToLand(double position_nm) const {
    const double dt = config_->time_step_min;
    double remaining = position_nm;
    int steps = 0;
    while (remaining > constants::LANDED_TOLERANCE_NM &&
           steps < constants::MAX_LANDING_STEPS) {
        remaining -= permittedSpeed(remaining).max_kt / 60.0 * dt;
        ++steps;
    }
    return steps;
}

bool Aircraft::advance(int minute, double dt_min) {
    if (isTerminal()) {
        return false;
    }

    if (const auto* flying = std::get_if<InFlight>(&phase_)) {
        double travelled = flying->velocity_kt / 60.0 * dt_min;
        position_nm_ = std::max(0.0, position_nm_ - travelled);
        if (isOnThreshold()) {
            position_nm_ = 0.0;
            std::ostringstream oss;
            oss << getCallsign() << " over the threshold at minute " << minute;
            Logger::getInstance().debug(oss.str());
        }
    } else {
        position_nm_ += config_->reversal_speed_kt / 60.0 * dt_min;
    }
    return true;
}

void Aircraft::setVelocity(double velocity_kt) {
    auto* flying = std::get_if<InFlight>(&phase_);
    if (!flying) {
        throw InvariantViolation("velocity change on " + getCallsign() +
                                 " while " + getStatusString(getStatus()));
    }
    flying->velocity_kt = velocity_kt;
}

void Aircraft::hold() {
    setVelocity(0.0);
}

void Aircraft::startReversal(int minute, const std::string& cause) {
    if (!isInFlight()) {
        throw InvariantViolation("reversal of " + getCallsign() +
                                 " while " + getStatusString(getStatus()));
    }
    phase_ = Reversing{minute};
    ever_reversed_ = true;
    ++reversal_count_;
    logTransition("Reversal (" + cause + ")", minute);
}

void Aircraft::reinsert(int minute) {
    if (!isReversing()) {
        throw InvariantViolation("reinsertion of " + getCallsign() +
                                 " while " + getStatusString(getStatus()));
    }
    phase_ = InFlight{permittedSpeed().max_kt};
    logTransition("Reinsertion", minute);
}

void Aircraft::land(int minute) {
    if (!isInFlight() || !isOnThreshold()) {
        throw InvariantViolation("landing of " + getCallsign() +
                                 " while not on the threshold in flight");
    }
    position_nm_ = 0.0;
    phase_ = Landed{minute};
    logTransition("Landed", minute);
}

void Aircraft::divert(int minute, DiversionReason reason) {
    requireActive("diversion");
    phase_ = Diverted{minute, reason};
    logTransition("Diverted (" + getReasonString(reason) + ")", minute);
}

void Aircraft::recordFrame(int minute) {
    history_.push_back(HistoryFrame{minute, position_nm_, getVelocity(), getStatus()});
}

void Aircraft::requireActive(const char* operation) const {
    if (isTerminal()) {
        throw InvariantViolation(std::string(operation) + " of " + getCallsign() +
                                 " after " + getStatusString(getStatus()));
    }
}

void Aircraft::logTransition(const std::string& event, int minute) const {
    std::ostringstream oss;
    oss << "=== " << event << " === " << getCallsign()
        << std::fixed << std::setprecision(2)
        << " minute " << minute
        << " position " << position_nm_ << " nm"
        << " velocity " << getVelocity() << " kt";
    Logger::getInstance().debug(oss.str());
}

} // namespace aep
