#ifndef AEP_SIMULATION_H
#define AEP_SIMULATION_H

#include "common/random_source.h"
#include "core/aircraft.h"
#include "core/diversion_policy.h"
#include "core/flight_queue.h"
#include "core/separation_policy.h"
#include "core/simulation_config.h"
#include <cstdint>
#include <memory>
#include <vector>

namespace aep {

// Everything one run produced; the input to the metrics reducer
struct RunRecord {
    int run_index{0};
    uint32_t seed{0};
    int horizon_min{0};
    double initial_distance_nm{0.0};
    ClosureWindow closure;                          // configured or storm-placed
    std::vector<std::shared_ptr<Aircraft>> aircraft; // in id order
    std::vector<int> landing_minutes;
    std::vector<StateCounts> minute_counts;

    size_t landed_count{0};
    size_t diverted_count{0};
    size_t airborne_at_horizon{0};
    size_t congestion_events{0};
    size_t separation_reversals{0};
    size_t wind_aborts{0};
    size_t reinsertions{0};
};

class Simulation {
public:
    Simulation(std::shared_ptr<const SimulationConfig> config,
               std::shared_ptr<RandomSource> random);
    // Seeds from config.seed, or from std::random_device when no seed is set
    explicit Simulation(std::shared_ptr<const SimulationConfig> config);
    ~Simulation() = default;

    // Runs [0, horizon) minute by minute. Throws InvariantViolation if a
    // consistency check fails while check_invariants is on.
    RunRecord run(int run_index = 0);

    // One run per replication, replication i seeded with seed + i
    static std::vector<RunRecord> runReplications(std::shared_ptr<const SimulationConfig> config);

private:
    void prepareRun(int run_index);
    void admitArrivals(int minute);
    void advanceAll(int minute);
    void stepMinute(int minute);
    void recordMinute(int minute, const std::vector<std::shared_ptr<Aircraft>>& present);
    void checkInvariants(int minute) const;
    void logRunSummary() const;

    std::shared_ptr<const SimulationConfig> config_;
    std::shared_ptr<RandomSource> random_;
    uint32_t seed_;

    // Per-run state
    std::shared_ptr<SimulationConfig> run_config_;
    std::unique_ptr<SeparationPolicy> separation_;
    std::unique_ptr<DiversionPolicy> diversion_;
    FlightQueue queue_;
    std::vector<std::shared_ptr<Aircraft>> pending_;  // not yet on radar, by appearance
    size_t next_pending_;
    RunRecord record_;
};

} // namespace aep

#endif // AEP_SIMULATION_H
