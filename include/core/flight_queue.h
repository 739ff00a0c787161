#ifndef AEP_FLIGHT_QUEUE_H
#define AEP_FLIGHT_QUEUE_H

#include "core/aircraft.h"
#include <memory>
#include <vector>

namespace aep {

// Airborne aircraft ordered by distance to the runway, closest first.
// Ties are broken by id so the order is total and reproducible.
class FlightQueue {
public:
    using AircraftPtr = std::shared_ptr<Aircraft>;

    FlightQueue() = default;

    // Order-preserving insertion; O(log n) search plus O(n) shift
    void insert(const AircraftPtr& aircraft);
    bool remove(int aircraft_id);

    // Restore ordering after positions changed
    void resort();

    // Drop entries that reached Landed or Diverted; returns how many
    size_t removeTerminal();

    // Closest in-flight aircraft, or nullptr
    AircraftPtr leader() const;

    // Members neither landed nor diverted that have appeared by `minute`
    std::vector<AircraftPtr> selectActive(int minute) const;

    const std::vector<AircraftPtr>& entries() const { return entries_; }
    size_t size() const { return entries_.size(); }
    bool empty() const { return entries_.empty(); }
    bool contains(int aircraft_id) const;

    // Throws InvariantViolation on duplicate ids, broken ordering, two
    // in-flight aircraft sharing a position, or a terminal aircraft still queued
    void detectInconsistencies() const;

    static constexpr double POSITION_TOLERANCE_NM = 1e-9;

private:
    static bool precedes(const AircraftPtr& a, const AircraftPtr& b);

    std::vector<AircraftPtr> entries_;
};

} // namespace aep

#endif // AEP_FLIGHT_QUEUE_H
