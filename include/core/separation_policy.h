#ifndef AEP_SEPARATION_POLICY_H
#define AEP_SEPARATION_POLICY_H

#include "common/random_source.h"
#include "core/flight_queue.h"
#include "core/simulation_config.h"
#include <memory>
#include <vector>

namespace aep {

class SeparationPolicy {
public:
    // What the policy did during one minute
    struct MinuteOutcome {
        std::vector<std::shared_ptr<Aircraft>> landed;  // at most one
        size_t wind_aborts{0};
        size_t separation_reversals{0};
        size_t slowdowns{0};
        size_t reinsertions{0};
        bool leader_held{false};

        size_t congestionEvents() const { return separation_reversals + slowdowns; }
    };

    explicit SeparationPolicy(std::shared_ptr<const SimulationConfig> config);
    ~SeparationPolicy() = default;

    // Forget the previous landing; called at the start of every run
    void reset();

    // Wind trials (when enabled), then landing, separation and reinsertion
    MinuteOutcome apply(FlightQueue& queue, int minute, RandomSource& random);

    size_t applyWindTrials(FlightQueue& queue, int minute, RandomSource& random);
    std::shared_ptr<Aircraft> tryLanding(FlightQueue& queue, int minute, bool& held);
    void enforceSeparation(FlightQueue& queue, int minute, MinuteOutcome& outcome);
    size_t reinsertReversing(FlightQueue& queue, int minute);

    // Minutes the trailer needs at its permitted speed to reach the leader's position
    double separationMinutes(const Aircraft& leader, const Aircraft& trailer) const;

    bool runwayAvailable(int minute) const;
    bool hasLanding() const { return has_last_landing_; }
    int getLastLandingMinute() const { return last_landing_minute_; }

private:
    bool canReinsert(const FlightQueue& queue, const Aircraft& candidate) const;

    std::shared_ptr<const SimulationConfig> config_;
    bool has_last_landing_;
    int last_landing_minute_;
};

} // namespace aep

#endif // AEP_SEPARATION_POLICY_H
