#ifndef AEP_DIVERSION_POLICY_H
#define AEP_DIVERSION_POLICY_H

#include "core/flight_queue.h"
#include "core/simulation_config.h"
#include <memory>
#include <vector>

namespace aep {

// Decides when an airborne aircraft gives up on AEP and goes to an alternate.
class DiversionPolicy {
public:
    explicit DiversionPolicy(std::shared_ptr<const SimulationConfig> config);

    // True when `aircraft` must divert at `minute`; `reason` is set accordingly.
    // Rules are checked in order: delay bound, runway closure, end of period.
    bool shouldDivert(const Aircraft& aircraft, int minute, DiversionReason& reason) const;

    // Diverts every qualifying queue member and removes it from the queue
    std::vector<std::shared_ptr<Aircraft>> apply(FlightQueue& queue, int minute) const;

    // Minute the aircraft would land if nothing held it back
    int projectedLanding(const Aircraft& aircraft, int minute) const;

private:
    bool exceedsDelayBound(const Aircraft& aircraft, int minute) const;
    bool blockedByClosure(const Aircraft& aircraft, int minute) const;
    bool missesClosingTime(const Aircraft& aircraft, int minute) const;

    std::shared_ptr<const SimulationConfig> config_;
};

} // namespace aep

#endif // AEP_DIVERSION_POLICY_H
