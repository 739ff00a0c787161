#include "core/diversion_policy.h"
#include "common/logger.h"
#include <sstream>
#include <stdexcept>
#include <utility>

namespace aep {

DiversionPolicy::DiversionPolicy(std::shared_ptr<const SimulationConfig> config)
    : config_(std::move(config)) {
    if (!config_) {
        throw std::invalid_argument("DiversionPolicy requires a configuration");
    }
}

int DiversionPolicy::projectedLanding(const Aircraft& aircraft, int minute) const {
    return minute + aircraft.expectedTimeToLand();
}

bool DiversionPolicy::exceedsDelayBound(const Aircraft& aircraft, int minute) const {
    return minute - aircraft.getAppearanceMinute() > config_->max_delay_min;
}

bool DiversionPolicy::blockedByClosure(const Aircraft& aircraft, int minute) const {
    const ClosureWindow& closure = config_->closure;
    if (!closure.enabled || closure.hasEnded(minute)) {
        return false;
    }

    int projected = projectedLanding(aircraft, minute);
    if (projected < closure.start_minute || projected >= closure.end_minute) {
        return false;
    }

    // Earliest landing is the reopening minute; divert now if that is already too late
    return closure.end_minute - aircraft.getAppearanceMinute() > config_->max_delay_min;
}

bool DiversionPolicy::missesClosingTime(const Aircraft& aircraft, int minute) const {
    return config_->divert_at_closing &&
           projectedLanding(aircraft, minute) > config_->horizon_min - 1;
}

bool DiversionPolicy::shouldDivert(const Aircraft& aircraft, int minute,
                                   DiversionReason& reason) const {
    if (!aircraft.isActive()) {
        return false;
    }
    if (exceedsDelayBound(aircraft, minute)) {
        reason = DiversionReason::DELAY_BOUND;
        return true;
    }
    if (blockedByClosure(aircraft, minute)) {
        reason = DiversionReason::CLOSURE;
        return true;
    }
    if (missesClosingTime(aircraft, minute)) {
        reason = DiversionReason::AIRPORT_CLOSING;
        return true;
    }
    return false;
}

std::vector<std::shared_ptr<Aircraft>> DiversionPolicy::apply(FlightQueue& queue, int minute) const {
    std::vector<std::shared_ptr<Aircraft>> diverted;
    const auto entries = queue.entries();

    for (const auto& ac : entries) {
        DiversionReason reason = DiversionReason::DELAY_BOUND;
        if (!shouldDivert(*ac, minute, reason)) continue;

        ac->divert(minute, reason);
        queue.remove(ac->getId());
        diverted.push_back(ac);

        std::ostringstream oss;
        oss << ac->getCallsign() << " diverted to alternate at minute " << minute
            << " (" << getReasonString(reason) << ", airborne "
            << minute - ac->getAppearanceMinute() << " min)";
        Logger::getInstance().log(oss.str());
    }
    return diverted;
}

} // namespace aep
