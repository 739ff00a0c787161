#include "core/metrics.h"
#include <algorithm>
#include <cmath>
#include <iomanip>
#include <numeric>
#include <sstream>

namespace aep {

RunMetrics MetricsReducer::reduce(const RunRecord& record) {
    RunMetrics metrics;
    metrics.total_aircraft = record.aircraft.size();
    metrics.airborne_at_horizon = record.airborne_at_horizon;
    metrics.congestion_events = record.congestion_events;
    metrics.wind_aborts = record.wind_aborts;

    size_t reversed = 0;
    for (const auto& ac : record.aircraft) {
        if (ac->everReversed()) {
            ++reversed;
        }

        if (const auto* landed = ac->landing()) {
            ++metrics.landed;
            int delay = landed->landing_minute - ac->getExpectedArrivalMinute();
            metrics.delays.push_back(delay);
            metrics.max_delay_min = std::max(metrics.max_delay_min, delay);
            metrics.max_time_in_system_min = std::max(metrics.max_time_in_system_min,
                landed->landing_minute - ac->getAppearanceMinute());
        } else if (const auto* diverted = ac->diversion()) {
            ++metrics.diverted;
            ++metrics.diverted_by_reason[static_cast<size_t>(diverted->reason)];
            metrics.max_time_in_system_min = std::max(metrics.max_time_in_system_min,
                diverted->diversion_minute - ac->getAppearanceMinute());
        }
    }

    if (!metrics.delays.empty()) {
        double total = std::accumulate(metrics.delays.begin(), metrics.delays.end(), 0.0);
        metrics.average_delay_min = total / metrics.delays.size();
    }

    size_t resolved = metrics.landed + metrics.diverted;
    if (resolved > 0) {
        metrics.diversion_probability = static_cast<double>(metrics.diverted) / resolved;
    }

    if (metrics.total_aircraft > 0) {
        metrics.congestion_frequency =
            static_cast<double>(metrics.congestion_events) / metrics.total_aircraft;
        metrics.reversal_fraction = static_cast<double>(reversed) / metrics.total_aircraft;
    }
    return metrics;
}

Estimate MetricsReducer::estimate(const std::vector<double>& samples) {
    Estimate result;
    if (samples.empty()) {
        return result;
    }

    double n = static_cast<double>(samples.size());
    result.mean = std::accumulate(samples.begin(), samples.end(), 0.0) / n;
    if (samples.size() < 2) {
        return result;
    }

    double squares = 0.0;
    for (double x : samples) {
        squares += (x - result.mean) * (x - result.mean);
    }
    double variance = squares / (n - 1.0);
    result.standard_error = std::sqrt(variance / n);
    return result;
}

ReplicationSummary MetricsReducer::summarize(const std::vector<RunRecord>& records) {
    std::vector<double> delays, diversions, congestion, reversals, landed, diverted;
    for (const auto& record : records) {
        RunMetrics metrics = reduce(record);
        delays.push_back(metrics.average_delay_min);
        diversions.push_back(metrics.diversion_probability);
        congestion.push_back(metrics.congestion_frequency);
        reversals.push_back(metrics.reversal_fraction);
        landed.push_back(static_cast<double>(metrics.landed));
        diverted.push_back(static_cast<double>(metrics.diverted));
    }

    ReplicationSummary summary;
    summary.runs = records.size();
    summary.average_delay = estimate(delays);
    summary.diversion_probability = estimate(diversions);
    summary.congestion_frequency = estimate(congestion);
    summary.reversal_fraction = estimate(reversals);
    summary.landed = estimate(landed);
    summary.diverted = estimate(diverted);
    return summary;
}

std::string MetricsReducer::format(const RunMetrics& metrics) {
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(2)
        << "=== Run Metrics ===\n"
        << "Aircraft: " << metrics.total_aircraft
        << " (landed " << metrics.landed
        << ", diverted " << metrics.diverted
        << ", airborne at horizon " << metrics.airborne_at_horizon << ")\n"
        << "Diversions by reason: delay bound "
        << metrics.diverted_by_reason[static_cast<size_t>(DiversionReason::DELAY_BOUND)]
        << ", closure "
        << metrics.diverted_by_reason[static_cast<size_t>(DiversionReason::CLOSURE)]
        << ", airport closing "
        << metrics.diverted_by_reason[static_cast<size_t>(DiversionReason::AIRPORT_CLOSING)] << "\n"
        << "Average delay: " << metrics.average_delay_min << " min (max "
        << metrics.max_delay_min << ")\n"
        << "Diversion probability: " << metrics.diversion_probability << "\n"
        << "Congestion frequency: " << metrics.congestion_frequency
        << " (" << metrics.congestion_events << " events)\n"
        << "Reversal fraction: " << metrics.reversal_fraction
        << " (" << metrics.wind_aborts << " wind aborts)\n"
        << "Max time in system: " << metrics.max_time_in_system_min << " min\n";
    return oss.str();
}

std::string MetricsReducer::format(const ReplicationSummary& summary) {
    auto line = [](std::ostringstream& oss, const char* name, const Estimate& e) {
        oss << std::left << std::setw(24) << name << std::right
            << std::setw(10) << e.mean << " +/- " << e.standard_error << "\n";
    };

    std::ostringstream oss;
    oss << std::fixed << std::setprecision(3)
        << "=== Replication Summary (" << summary.runs << " runs) ===\n";
    line(oss, "Average delay (min)", summary.average_delay);
    line(oss, "Diversion probability", summary.diversion_probability);
    line(oss, "Congestion frequency", summary.congestion_frequency);
    line(oss, "Reversal fraction", summary.reversal_fraction);
    line(oss, "Landed", summary.landed);
    line(oss, "Diverted", summary.diverted);
    return oss.str();
}

} // namespace aep
