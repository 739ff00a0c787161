#ifndef AEP_AIRCRAFT_H
#define AEP_AIRCRAFT_H

#include "common/types.h"
#include "core/simulation_config.h"
#include <memory>
#include <string>
#include <vector>

namespace aep {

class Aircraft {
public:
    Aircraft(int id,
             int appearance_minute,
             std::shared_ptr<const SimulationConfig> config);
    ~Aircraft() = default;

    int getId() const { return id_; }
    std::string getCallsign() const;
    int getAppearanceMinute() const { return appearance_minute_; }
    int getExpectedArrivalMinute() const { return expected_arrival_minute_; }

    double getPosition() const { return position_nm_; }
    // Signed: positive approaching, negative reversing, zero once terminal
    double getVelocity() const;
    FlightStatus getStatus() const;
    const FlightPhase& getPhase() const { return phase_; }

    bool isInFlight() const { return std::holds_alternative<InFlight>(phase_); }
    bool isReversing() const { return std::holds_alternative<Reversing>(phase_); }
    bool isActive() const { return isInFlight() || isReversing(); }
    bool isTerminal() const { return !isActive(); }
    bool isOnThreshold() const;

    // nullptr unless in that phase
    const Landed* landing() const { return std::get_if<Landed>(&phase_); }
    const Diverted* diversion() const { return std::get_if<Diverted>(&phase_); }
    const Reversing* reversal() const { return std::get_if<Reversing>(&phase_); }

    bool everReversed() const { return ever_reversed_; }
    int getReversalCount() const { return reversal_count_; }

    // Kinematics
    SpeedLimits permittedSpeed() const;
    SpeedLimits permittedSpeed(double position_nm) const;
    int expectedTimeToLand() const;
    int expectedTimeToLand(double position_nm) const;

    // One step of motion. Returns false (and does nothing) once terminal.
    bool advance(int minute, double dt_min);

    // Phase transitions; each throws InvariantViolation when illegal
    void setVelocity(double velocity_kt);
    void hold();
    void startReversal(int minute, const std::string& cause);
    void reinsert(int minute);
    void land(int minute);
    void divert(int minute, DiversionReason reason);

    void recordFrame(int minute);
    const std::vector<HistoryFrame>& getHistory() const { return history_; }

private:
    void requireActive(const char* operation) const;
    void logTransition(const std::string& event, int minute) const;

    const int id_;
    const int appearance_minute_;
    std::shared_ptr<const SimulationConfig> config_;
    int expected_arrival_minute_;

    double position_nm_;
    FlightPhase phase_;
    bool ever_reversed_;
    int reversal_count_;
    std::vector<HistoryFrame> history_;
};

} // namespace aep

#endif // AEP_AIRCRAFT_H
