#include "core/flight_queue.h"
#include "common/errors.h"
#include "common/logger.h"
#include <algorithm>
#include <cmath>
#include <sstream>
#include <unordered_set>

namespace aep {

bool FlightQueue::precedes(const AircraftPtr& a, const AircraftPtr& b) {
    if (a->getPosition() != b->getPosition()) {
        return a->getPosition() < b->getPosition();
    }
    return a->getId() < b->getId();
}

void FlightQueue::insert(const AircraftPtr& aircraft) {
    if (!aircraft) return;

    if (contains(aircraft->getId())) {
        throw InvariantViolation("aircraft " + aircraft->getCallsign() + " queued twice");
    }
    if (aircraft->isTerminal()) {
        throw InvariantViolation("terminal aircraft " + aircraft->getCallsign() + " cannot be queued");
    }

    auto it = std::upper_bound(entries_.begin(), entries_.end(), aircraft, precedes);
    entries_.insert(it, aircraft);
    Logger::getInstance().debug("Queued " + aircraft->getCallsign() +
                                " (" + std::to_string(entries_.size()) + " airborne)");
}

bool FlightQueue::remove(int aircraft_id) {
    auto it = std::find_if(entries_.begin(), entries_.end(),
        [aircraft_id](const AircraftPtr& ac) {
            return ac->getId() == aircraft_id;
        });
    if (it == entries_.end()) {
        return false;
    }
    entries_.erase(it);
    return true;
}

void FlightQueue::resort() {
    std::stable_sort(entries_.begin(), entries_.end(), precedes);
}

size_t FlightQueue::removeTerminal() {
    size_t before = entries_.size();
    entries_.erase(
        std::remove_if(entries_.begin(), entries_.end(),
            [](const AircraftPtr& ac) { return ac->isTerminal(); }),
        entries_.end());
    return before - entries_.size();
}

FlightQueue::AircraftPtr FlightQueue::leader() const {
    for (const auto& ac : entries_) {
        if (ac->isInFlight()) {
            return ac;
        }
    }
    return nullptr;
}

std::vector<FlightQueue::AircraftPtr> FlightQueue::selectActive(int minute) const {
    std::vector<AircraftPtr> active;
    active.reserve(entries_.size());
    for (const auto& ac : entries_) {
        if (ac->isActive() && ac->getAppearanceMinute() <= minute) {
            active.push_back(ac);
        }
    }
    return active;
}

bool FlightQueue::contains(int aircraft_id) const {
    return std::any_of(entries_.begin(), entries_.end(),
        [aircraft_id](const AircraftPtr& ac) {
            return ac->getId() == aircraft_id;
        });
}

void FlightQueue::detectInconsistencies() const {
    std::unordered_set<int> seen;
    for (size_t i = 0; i < entries_.size(); ++i) {
        const auto& ac = entries_[i];
        if (!ac) {
            throw InvariantViolation("null queue entry at index " + std::to_string(i));
        }

        if (!seen.insert(ac->getId()).second) {
            throw InvariantViolation("duplicate queue entry for " + ac->getCallsign());
        }

        if (ac->isTerminal()) {
            throw InvariantViolation(ac->getCallsign() + " is " +
                                     getStatusString(ac->getStatus()) +
                                     " but still in the active queue");
        }

        if (i > 0 && precedes(ac, entries_[i - 1])) {
            std::ostringstream oss;
            oss << "queue out of order: " << entries_[i - 1]->getCallsign()
                << " at " << entries_[i - 1]->getPosition() << " nm ahead of "
                << ac->getCallsign() << " at " << ac->getPosition() << " nm";
            throw InvariantViolation(oss.str());
        }
    }

    // Entries are sorted, so coincident in-flight positions are adjacent
    // among the in-flight subsequence.
    AircraftPtr previous_in_flight;
    for (const auto& ac : entries_) {
        if (!ac->isInFlight()) continue;
        if (previous_in_flight &&
            std::fabs(ac->getPosition() - previous_in_flight->getPosition()) <= POSITION_TOLERANCE_NM) {
            std::ostringstream oss;
            oss << previous_in_flight->getCallsign() << " and " << ac->getCallsign()
                << " share position " << ac->getPosition()
                << " nm while both in flight";
            throw InvariantViolation(oss.str());
        }
        previous_in_flight = ac;
    }
}

} // namespace aep
