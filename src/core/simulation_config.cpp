#include "core/simulation_config.h"
#include "common/constants.h"
#include "common/errors.h"
#include <algorithm>
#include <iomanip>
#include <sstream>
#include <utility>

namespace aep {

SpeedTable::SpeedTable()
    : SpeedTable(defaults()) {
}

SpeedTable::SpeedTable(std::vector<SpeedBand> bands)
    : bands_(std::move(bands)) {
    std::sort(bands_.begin(), bands_.end(),
              [](const SpeedBand& a, const SpeedBand& b) {
                  return a.floor_nm > b.floor_nm;
              });
}

SpeedTable SpeedTable::defaults() {
    std::vector<SpeedBand> bands;
    for (int i = 0; i < constants::DEFAULT_SPEED_BAND_COUNT; ++i) {
        bands.push_back(SpeedBand{constants::DEFAULT_BAND_FLOOR_NM[i],
                                  constants::DEFAULT_BAND_MAX_KT[i],
                                  constants::DEFAULT_BAND_MIN_KT[i]});
    }
    return SpeedTable(bands);
}

SpeedLimits SpeedTable::limitsAt(double position_nm) const {
    if (bands_.empty()) {
        throw InvalidConfiguration("speed band table is empty");
    }
    for (const auto& band : bands_) {
        if (position_nm > band.floor_nm) {
            return SpeedLimits{band.max_speed_kt, band.min_speed_kt};
        }
    }
    const auto& lowest = bands_.back();
    return SpeedLimits{lowest.max_speed_kt, lowest.min_speed_kt};
}

void SpeedTable::validate() const {
    if (bands_.empty()) {
        throw InvalidConfiguration("speed band table is empty");
    }
    for (size_t i = 0; i < bands_.size(); ++i) {
        const auto& band = bands_[i];
        if (band.floor_nm < 0.0) {
            throw InvalidConfiguration("speed band floor must not be negative");
        }
        if (band.min_speed_kt <= 0.0 || band.min_speed_kt > band.max_speed_kt) {
            std::ostringstream oss;
            oss << "speed band above " << band.floor_nm
                << " nm needs 0 < v_min <= v_max";
            throw InvalidConfiguration(oss.str());
        }
        if (i > 0 && bands_[i - 1].floor_nm == band.floor_nm) {
            std::ostringstream oss;
            oss << "duplicate speed band floor " << band.floor_nm << " nm";
            throw InvalidConfiguration(oss.str());
        }
    }
}

SimulationConfig::SimulationConfig()
    : initial_distance_nm(constants::INITIAL_DISTANCE_NM)
    , speed_table(SpeedTable::defaults())
    , reversal_speed_kt(constants::REVERSAL_SPEED_KT)
    , speed_step_kt(constants::SPEED_STEP_KT)
    , min_separation_min(constants::MIN_SEPARATION_MIN)
    , spacing_buffer_min(constants::SPACING_BUFFER_MIN)
    , reinsertion_buffer_min(constants::REINSERTION_BUFFER_MIN)
    , landing_gap_min(constants::LANDING_GAP_MIN)
    , wind_enabled(false)
    , wind_abort_probability(constants::WIND_ABORT_PROBABILITY)
    , wind_final_approach_only(false)
    , closure()
    , storm_duration_min(0)
    , max_delay_min(constants::MAX_DELAY_MIN)
    , divert_at_closing(false)
    , horizon_min(constants::HORIZON_MIN)
    , time_step_min(constants::TIME_STEP_MIN)
    , arrival_rate_per_min(constants::ARRIVAL_RATE_PER_MIN)
    , has_seed(false)
    , seed(0)
    , replications(constants::REPLICATIONS)
    , check_invariants(true) {
}

void SimulationConfig::validate() const {
    if (arrival_rate_per_min <= 0.0) {
        throw InvalidConfiguration("arrival rate must be positive");
    }
    if (horizon_min <= 0) {
        throw InvalidConfiguration("horizon must be positive");
    }
    if (time_step_min <= 0.0) {
        throw InvalidConfiguration("time step must be positive");
    }
    if (initial_distance_nm <= 0.0) {
        throw InvalidConfiguration("initial distance must be positive");
    }
    if (reversal_speed_kt <= 0.0) {
        throw InvalidConfiguration("reversal speed must be positive");
    }
    if (speed_step_kt < 0.0) {
        throw InvalidConfiguration("speed step must not be negative");
    }
    if (min_separation_min < 0.0) {
        throw InvalidConfiguration("minimum separation must not be negative");
    }
    if (spacing_buffer_min < min_separation_min) {
        throw InvalidConfiguration("spacing buffer must not be below the minimum separation");
    }
    if (reinsertion_buffer_min <= min_separation_min) {
        throw InvalidConfiguration("reinsertion buffer must exceed the minimum separation");
    }
    if (landing_gap_min < 0) {
        throw InvalidConfiguration("landing gap must not be negative");
    }
    if (max_delay_min <= 0) {
        throw InvalidConfiguration("maximum delay must be positive");
    }
    if (wind_abort_probability < 0.0 || wind_abort_probability > 1.0) {
        throw InvalidConfiguration("wind abort probability must be within [0, 1]");
    }
    if (closure.enabled) {
        if (closure.end_minute <= closure.start_minute) {
            std::ostringstream oss;
            oss << "closure window [" << closure.start_minute << ", "
                << closure.end_minute << ") is inverted or empty";
            throw InvalidConfiguration(oss.str());
        }
        if (closure.start_minute < 0 || closure.start_minute >= horizon_min) {
            throw InvalidConfiguration("closure window must start inside the horizon");
        }
    }
    if (storm_duration_min < 0) {
        throw InvalidConfiguration("storm duration must not be negative");
    }
    if (storm_duration_min > horizon_min) {
        throw InvalidConfiguration("storm duration exceeds the horizon");
    }
    if (closure.enabled && storm_duration_min > 0) {
        throw InvalidConfiguration("closure window and storm duration are mutually exclusive");
    }
    if (replications < 1) {
        throw InvalidConfiguration("replications must be at least 1");
    }
    std::vector<int> minutes(arrival_schedule);
    std::sort(minutes.begin(), minutes.end());
    for (size_t i = 0; i < minutes.size(); ++i) {
        if (minutes[i] < 0 || minutes[i] >= horizon_min) {
            std::ostringstream oss;
            oss << "arrival minute " << minutes[i] << " outside [0, " << horizon_min << ")";
            throw InvalidConfiguration(oss.str());
        }
        if (i > 0 && minutes[i] == minutes[i - 1]) {
            throw InvalidConfiguration("two arrivals scheduled at minute " +
                                       std::to_string(minutes[i]));
        }
    }
    speed_table.validate();
}

std::string SimulationConfig::describe() const {
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(2)
        << "=== Scenario ===\n"
        << "Horizon: " << horizon_min << " min (dt " << time_step_min << ")\n";
    if (arrival_schedule.empty()) {
        oss << "Arrivals: Poisson, " << arrival_rate_per_min << " per min\n";
    } else {
        oss << "Arrivals: " << arrival_schedule.size() << " scheduled\n";
    }
    oss << "Seed: " << (has_seed ? std::to_string(seed) : std::string("random")) << "\n"
        << "Initial distance: " << initial_distance_nm << " nm\n"
        << "Separation: min " << min_separation_min << ", spacing "
        << spacing_buffer_min << ", reinsertion " << reinsertion_buffer_min << " min\n"
        << "Landing gap: " << landing_gap_min << " min\n"
        << "Max delay: " << max_delay_min << " min\n"
        << "Wind: " << (wind_enabled ? "p=" + std::to_string(wind_abort_probability) : std::string("off"))
        << (wind_enabled && wind_final_approach_only ? " (final approach only)" : "") << "\n";
    if (closure.enabled) {
        oss << "Closure: [" << closure.start_minute << ", " << closure.end_minute << ")\n";
    } else if (storm_duration_min > 0) {
        oss << "Storm: " << storm_duration_min << " min, random start\n";
    } else {
        oss << "Closure: none\n";
    }
    oss << "Replications: " << replications;
    return oss.str();
}

} // namespace aep
