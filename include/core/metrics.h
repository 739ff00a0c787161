#ifndef AEP_METRICS_H
#define AEP_METRICS_H

#include "core/simulation.h"
#include <array>
#include <string>
#include <vector>

namespace aep {

struct RunMetrics {
    size_t total_aircraft{0};
    size_t landed{0};
    size_t diverted{0};
    size_t airborne_at_horizon{0};
    std::array<size_t, 3> diverted_by_reason{{0, 0, 0}};  // indexed by DiversionReason

    std::vector<int> delays;          // landing - expected arrival, per landed aircraft
    double average_delay_min{0.0};    // over landed aircraft
    int max_delay_min{0};
    double diversion_probability{0.0}; // diverted / (landed + diverted)
    double congestion_frequency{0.0};  // congestion events per aircraft
    double reversal_fraction{0.0};     // aircraft that reversed at least once
    size_t congestion_events{0};
    size_t wind_aborts{0};
    int max_time_in_system_min{0};    // appearance to landing or diversion
};

struct Estimate {
    double mean{0.0};
    double standard_error{0.0};
};

struct ReplicationSummary {
    size_t runs{0};
    Estimate average_delay;
    Estimate diversion_probability;
    Estimate congestion_frequency;
    Estimate reversal_fraction;
    Estimate landed;
    Estimate diverted;
};

class MetricsReducer {
public:
    static RunMetrics reduce(const RunRecord& record);
    static ReplicationSummary summarize(const std::vector<RunRecord>& records);

    // Sample mean and standard error of the mean (0 for fewer than two samples)
    static Estimate estimate(const std::vector<double>& samples);

    static std::string format(const RunMetrics& metrics);
    static std::string format(const ReplicationSummary& summary);
};

} // namespace aep

#endif // AEP_METRICS_H
