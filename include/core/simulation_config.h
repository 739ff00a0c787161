#ifndef AEP_SIMULATION_CONFIG_H
#define AEP_SIMULATION_CONFIG_H

#include "common/types.h"
#include <cstdint>
#include <string>
#include <vector>

namespace aep {

// Distance-to-runway -> permitted speed lookup
class SpeedTable {
public:
    SpeedTable();  // default bands
    explicit SpeedTable(std::vector<SpeedBand> bands);

    SpeedLimits limitsAt(double position_nm) const;
    double maxSpeedAt(double position_nm) const { return limitsAt(position_nm).max_kt; }
    double minSpeedAt(double position_nm) const { return limitsAt(position_nm).min_kt; }

    const std::vector<SpeedBand>& bands() const { return bands_; }
    bool empty() const { return bands_.empty(); }

    // Throws InvalidConfiguration
    void validate() const;

    static SpeedTable defaults();

private:
    std::vector<SpeedBand> bands_;  // sorted by floor, outermost first
};

struct SimulationConfig {
    SimulationConfig();

    // Kinematics
    double initial_distance_nm;
    SpeedTable speed_table;
    double reversal_speed_kt;
    double speed_step_kt;

    // Separation (minutes)
    double min_separation_min;
    double spacing_buffer_min;
    double reinsertion_buffer_min;
    int landing_gap_min;

    // Weather and diversion
    bool wind_enabled;
    double wind_abort_probability;
    bool wind_final_approach_only;
    ClosureWindow closure;
    int storm_duration_min;          // 0: no randomly placed storm
    int max_delay_min;
    bool divert_at_closing;

    // Run control
    int horizon_min;
    double time_step_min;
    double arrival_rate_per_min;
    bool has_seed;
    uint32_t seed;
    int replications;
    bool check_invariants;
    std::vector<int> arrival_schedule;  // explicit appearance minutes; empty: sample

    // Throws InvalidConfiguration on the first problem found
    void validate() const;

    std::string describe() const;
};

} // namespace aep

#endif // AEP_SIMULATION_CONFIG_H
