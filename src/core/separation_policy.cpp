#include "core/separation_policy.h"
#include "common/constants.h"
#include "common/logger.h"
#include <algorithm>
#include <iomanip>
#include <sstream>
#include <stdexcept>
#include <utility>

namespace aep {

SeparationPolicy::SeparationPolicy(std::shared_ptr<const SimulationConfig> config)
    : config_(std::move(config))
    , has_last_landing_(false)
    , last_landing_minute_(0) {
    if (!config_) {
        throw std::invalid_argument("SeparationPolicy requires a configuration");
    }
}

void SeparationPolicy::reset() {
    has_last_landing_ = false;
    last_landing_minute_ = 0;
}

SeparationPolicy::MinuteOutcome
SeparationPolicy::apply(FlightQueue& queue, int minute, RandomSource& random) {
    MinuteOutcome outcome;

    if (config_->wind_enabled) {
        outcome.wind_aborts = applyWindTrials(queue, minute, random);
    }

    auto landed = tryLanding(queue, minute, outcome.leader_held);
    if (landed) {
        outcome.landed.push_back(landed);
    }

    enforceSeparation(queue, minute, outcome);
    outcome.reinsertions = reinsertReversing(queue, minute);
    return outcome;
}

size_t SeparationPolicy::applyWindTrials(FlightQueue& queue, int minute, RandomSource& random) {
    size_t aborts = 0;
    for (const auto& ac : queue.entries()) {
        if (!ac->isInFlight()) continue;

        if (config_->wind_final_approach_only &&
            ac->expectedTimeToLand() > constants::FINAL_APPROACH_WINDOW_MIN) {
            continue;
        }

        if (random.bernoulli(config_->wind_abort_probability)) {
            ac->startReversal(minute, "wind");
            ++aborts;
        }
    }
    return aborts;
}

bool SeparationPolicy::runwayAvailable(int minute) const {
    if (config_->closure.covers(minute)) {
        return false;
    }
    return !has_last_landing_ ||
           minute - last_landing_minute_ >= config_->landing_gap_min;
}

std::shared_ptr<Aircraft>
SeparationPolicy::tryLanding(FlightQueue& queue, int minute, bool& held) {
    held = false;
    auto leader = queue.leader();
    if (!leader || !leader->isOnThreshold()) {
        return nullptr;
    }

    if (!runwayAvailable(minute)) {
        leader->hold();
        held = true;
        return nullptr;
    }

    leader->land(minute);
    queue.remove(leader->getId());
    has_last_landing_ = true;
    last_landing_minute_ = minute;

    Logger::getInstance().log(leader->getCallsign() + " landed at minute " +
                              std::to_string(minute));
    return leader;
}

void SeparationPolicy::enforceSeparation(FlightQueue& queue, int minute, MinuteOutcome& outcome) {
    // Index-based walk over a stable snapshot: transitions below never reorder entries.
    const auto entries = queue.entries();
    std::shared_ptr<Aircraft> predecessor;

    for (size_t i = 0; i < entries.size(); ++i) {
        const auto& ac = entries[i];
        if (!ac->isInFlight()) continue;

        SpeedLimits limits = ac->permittedSpeed();

        if (!predecessor) {
            // Queue leader: governed by the landing gap, not by spacing
            if (!ac->isOnThreshold()) {
                ac->setVelocity(limits.max_kt);
            }
            predecessor = ac;
            continue;
        }

        double gap = separationMinutes(*predecessor, *ac);
        if (gap < config_->min_separation_min) {
            std::ostringstream cause;
            cause << std::fixed << std::setprecision(2)
                  << gap << " min behind " << predecessor->getCallsign();
            ac->startReversal(minute, cause.str());
            ++outcome.separation_reversals;
            continue;
        }

        if (gap < config_->spacing_buffer_min) {
            double current = std::min(ac->getVelocity(), limits.max_kt);
            ac->setVelocity(std::max(current - config_->speed_step_kt, limits.min_kt));
            ++outcome.slowdowns;
        } else {
            ac->setVelocity(limits.max_kt);
        }
        predecessor = ac;
    }
}

size_t SeparationPolicy::reinsertReversing(FlightQueue& queue, int minute) {
    size_t reinserted = 0;
    const auto entries = queue.entries();
    for (size_t i = 0; i < entries.size(); ++i) {
        const auto& ac = entries[i];
        const auto* reversing = ac->reversal();
        // At least one full minute of reversal before coming back
        if (!reversing || reversing->since_minute >= minute) continue;

        if (canReinsert(queue, *ac)) {
            ac->reinsert(minute);
            ++reinserted;
        }
    }
    return reinserted;
}

bool SeparationPolicy::canReinsert(const FlightQueue& queue, const Aircraft& candidate) const {
    const Aircraft* ahead = nullptr;
    const Aircraft* behind = nullptr;

    for (const auto& other : queue.entries()) {
        if (other.get() == &candidate || !other->isInFlight()) continue;

        if (other->getPosition() <= candidate.getPosition()) {
            if (!ahead || other->getPosition() > ahead->getPosition()) {
                ahead = other.get();
            }
        } else if (!behind || other->getPosition() < behind->getPosition()) {
            behind = other.get();
        }
    }

    if (ahead && separationMinutes(*ahead, candidate) < config_->reinsertion_buffer_min) {
        return false;
    }
    if (behind && separationMinutes(candidate, *behind) < config_->reinsertion_buffer_min) {
        return false;
    }
    return true;
}

double SeparationPolicy::separationMinutes(const Aircraft& leader, const Aircraft& trailer) const {
    double distance = trailer.getPosition() - leader.getPosition();
    double speed = trailer.permittedSpeed().max_kt;
    return distance / speed * 60.0;
}

} // namespace aep
