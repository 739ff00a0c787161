#include "core/simulation.h"
#include "common/errors.h"
#include "common/logger.h"
#include "sim/arrival_generator.h"
#include <algorithm>
#include <iomanip>
#include <memory>
#include <sstream>
#include <stdexcept>
#include <utility>

namespace aep {

namespace {

std::shared_ptr<SeededRandomSource> makeRandomSource(const SimulationConfig& config) {
    if (config.has_seed) {
        return std::make_shared<SeededRandomSource>(config.seed);
    }
    return std::make_shared<SeededRandomSource>();
}

} // namespace

Simulation::Simulation(std::shared_ptr<const SimulationConfig> config,
                       std::shared_ptr<RandomSource> random)
    : config_(std::move(config))
    , random_(std::move(random))
    , seed_(0)
    , next_pending_(0) {
    if (!config_) {
        throw std::invalid_argument("Simulation requires a configuration");
    }
    if (!random_) {
        throw std::invalid_argument("Simulation requires a random source");
    }
    config_->validate();
    seed_ = config_->seed;
}

Simulation::Simulation(std::shared_ptr<const SimulationConfig> config)
    : config_(std::move(config))
    , seed_(0)
    , next_pending_(0) {
    if (!config_) {
        throw std::invalid_argument("Simulation requires a configuration");
    }
    config_->validate();

    auto seeded = makeRandomSource(*config_);
    seed_ = seeded->getSeed();
    random_ = seeded;
}

std::vector<RunRecord> Simulation::runReplications(std::shared_ptr<const SimulationConfig> config) {
    if (!config) {
        throw std::invalid_argument("Simulation requires a configuration");
    }
    config->validate();

    uint32_t base_seed = config->has_seed ? config->seed : std::random_device{}();

    std::vector<RunRecord> records;
    records.reserve(config->replications);
    for (int i = 0; i < config->replications; ++i) {
        auto replica = std::make_shared<SimulationConfig>(*config);
        replica->has_seed = true;
        replica->seed = base_seed + static_cast<uint32_t>(i);

        Simulation simulation(replica);
        records.push_back(simulation.run(i));
    }
    return records;
}

RunRecord Simulation::run(int run_index) {
    prepareRun(run_index);

    Logger::getInstance().log("=== Run " + std::to_string(run_index) + " started (" +
                              std::to_string(pending_.size()) + " arrivals, seed " +
                              std::to_string(seed_) + ") ===");

    for (int minute = 0; minute < run_config_->horizon_min; ++minute) {
        stepMinute(minute);
    }

    record_.airborne_at_horizon = queue_.size();
    record_.landed_count = record_.landing_minutes.size();
    logRunSummary();
    return record_;
}

void Simulation::prepareRun(int run_index) {
    run_config_ = std::make_shared<SimulationConfig>(*config_);
    separation_ = std::make_unique<SeparationPolicy>(run_config_);
    diversion_ = std::make_unique<DiversionPolicy>(run_config_);
    queue_ = FlightQueue();
    pending_.clear();
    next_pending_ = 0;
    record_ = RunRecord();

    // Draw order is fixed: arrivals first, then the storm window
    ArrivalGenerator generator(*random_);
    std::vector<int> arrivals = run_config_->arrival_schedule;
    if (arrivals.empty()) {
        arrivals = generator.generate(run_config_->arrival_rate_per_min, run_config_->horizon_min);
    } else {
        std::sort(arrivals.begin(), arrivals.end());
    }
    if (run_config_->storm_duration_min > 0) {
        run_config_->closure = generator.placeStorm(run_config_->storm_duration_min,
                                                    run_config_->horizon_min);
    }

    for (size_t i = 0; i < arrivals.size(); ++i) {
        pending_.push_back(std::make_shared<Aircraft>(static_cast<int>(i) + 1,
                                                      arrivals[i], run_config_));
    }

    record_.run_index = run_index;
    record_.seed = seed_;
    record_.horizon_min = run_config_->horizon_min;
    record_.initial_distance_nm = run_config_->initial_distance_nm;
    record_.closure = run_config_->closure;
    record_.aircraft = pending_;
}

void Simulation::admitArrivals(int minute) {
    while (next_pending_ < pending_.size() &&
           pending_[next_pending_]->getAppearanceMinute() <= minute) {
        queue_.insert(pending_[next_pending_]);
        Logger::getInstance().log(pending_[next_pending_]->getCallsign() +
                                  " on radar at minute " + std::to_string(minute));
        ++next_pending_;
    }
}

void Simulation::advanceAll(int minute) {
    queue_.resort();
    for (const auto& ac : queue_.entries()) {
        ac->advance(minute, run_config_->time_step_min);
    }
    queue_.resort();
}

void Simulation::stepMinute(int minute) {
    admitArrivals(minute);

    // Aircraft present at the start of the minute get a frame for it,
    // including those that land or divert during the minute
    const std::vector<std::shared_ptr<Aircraft>> present = queue_.entries();

    advanceAll(minute);

    SeparationPolicy::MinuteOutcome outcome = separation_->apply(queue_, minute, *random_);
    for (const auto& ac : outcome.landed) {
        record_.landing_minutes.push_back(ac->landing()->landing_minute);
    }
    record_.congestion_events += outcome.congestionEvents();
    record_.separation_reversals += outcome.separation_reversals;
    record_.wind_aborts += outcome.wind_aborts;
    record_.reinsertions += outcome.reinsertions;

    auto diverted = diversion_->apply(queue_, minute);
    record_.diverted_count += diverted.size();

    recordMinute(minute, present);

    if (run_config_->check_invariants) {
        checkInvariants(minute);
    }
}

void Simulation::recordMinute(int minute, const std::vector<std::shared_ptr<Aircraft>>& present) {
    for (const auto& ac : present) {
        ac->recordFrame(minute);
    }

    StateCounts counts{minute, 0, 0, record_.landing_minutes.size(), record_.diverted_count};
    for (const auto& ac : queue_.entries()) {
        if (ac->isInFlight()) {
            ++counts.in_flight;
        } else if (ac->isReversing()) {
            ++counts.reversing;
        }
    }
    record_.minute_counts.push_back(counts);

    if (Logger::getInstance().getLevel() == LogLevel::DEBUG) {
        std::ostringstream oss;
        oss << "Minute " << minute << ": " << counts.in_flight << " in flight, "
            << counts.reversing << " reversing, " << counts.landed << " landed, "
            << counts.diverted << " diverted";
        Logger::getInstance().debug(oss.str());
    }
}

void Simulation::checkInvariants(int minute) const {
    queue_.detectInconsistencies();

    // Separation is monotone along the queue, so adjacent pairs suffice
    std::shared_ptr<Aircraft> previous;
    for (const auto& ac : queue_.entries()) {
        if (!ac->isInFlight()) continue;
        if (previous) {
            double gap = separation_->separationMinutes(*previous, *ac);
            if (gap < run_config_->min_separation_min - FlightQueue::POSITION_TOLERANCE_NM) {
                std::ostringstream oss;
                oss << std::fixed << std::setprecision(3)
                    << ac->getCallsign() << " only " << gap << " min behind "
                    << previous->getCallsign() << " at minute " << minute;
                throw InvariantViolation(oss.str());
            }
        }
        previous = ac;
    }
}

void Simulation::logRunSummary() const {
    std::ostringstream oss;
    oss << "=== Run " << record_.run_index << " complete === "
        << record_.aircraft.size() << " aircraft, "
        << record_.landed_count << " landed, "
        << record_.diverted_count << " diverted, "
        << record_.airborne_at_horizon << " airborne at horizon, "
        << record_.congestion_events << " congestion events";
    Logger::getInstance().log(oss.str());
}

} // namespace aep
