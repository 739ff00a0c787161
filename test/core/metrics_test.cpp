#include <gtest/gtest.h>
#include "core/metrics.h"
#include "common/logger.h"
#include <cmath>

namespace aep {
namespace test {

class MetricsTest : public testing::Test {
protected:
    void SetUp() override {
        Logger::getInstance().enableConsoleOutput(false);
        config_ = std::make_shared<SimulationConfig>();
    }

    std::shared_ptr<Aircraft> landedAircraft(int id, int appearance, int landing_minute) {
        auto ac = std::make_shared<Aircraft>(id, appearance, config_);
        ac->setVelocity(ac->getPosition() * 60.0);
        ac->advance(appearance, 1.0);
        ac->land(landing_minute);
        return ac;
    }

    std::shared_ptr<SimulationConfig> config_;
};

TEST_F(MetricsTest, ReduceRun) {
    RunRecord record;
    record.aircraft.push_back(landedAircraft(1, 0, 22));   // on time
    auto late = landedAircraft(2, 1, 37);                  // 14 min late
    record.aircraft.push_back(late);

    auto diverted = std::make_shared<Aircraft>(3, 5, config_);
    diverted->startReversal(6, "test");
    diverted->divert(96, DiversionReason::DELAY_BOUND);
    record.aircraft.push_back(diverted);

    record.aircraft.push_back(std::make_shared<Aircraft>(4, 100, config_));
    record.airborne_at_horizon = 1;
    record.congestion_events = 6;
    record.wind_aborts = 1;

    RunMetrics metrics = MetricsReducer::reduce(record);
    EXPECT_EQ(metrics.total_aircraft, 4u);
    EXPECT_EQ(metrics.landed, 2u);
    EXPECT_EQ(metrics.diverted, 1u);
    EXPECT_EQ(metrics.airborne_at_horizon, 1u);
    EXPECT_EQ(metrics.diverted_by_reason[static_cast<size_t>(DiversionReason::DELAY_BOUND)], 1u);

    ASSERT_EQ(metrics.delays.size(), 2u);
    EXPECT_EQ(metrics.delays[0], 0);
    EXPECT_EQ(metrics.delays[1], 14);
    EXPECT_DOUBLE_EQ(metrics.average_delay_min, 7.0);
    EXPECT_EQ(metrics.max_delay_min, 14);

    // Airborne-at-horizon aircraft stay out of the denominator
    EXPECT_DOUBLE_EQ(metrics.diversion_probability, 1.0 / 3.0);
    EXPECT_DOUBLE_EQ(metrics.congestion_frequency, 1.5);
    EXPECT_DOUBLE_EQ(metrics.reversal_fraction, 0.25);
    EXPECT_EQ(metrics.max_time_in_system_min, 91);
}

TEST_F(MetricsTest, EmptyRun) {
    RunRecord record;
    RunMetrics metrics = MetricsReducer::reduce(record);
    EXPECT_EQ(metrics.total_aircraft, 0u);
    EXPECT_DOUBLE_EQ(metrics.average_delay_min, 0.0);
    EXPECT_DOUBLE_EQ(metrics.diversion_probability, 0.0);
    EXPECT_DOUBLE_EQ(metrics.congestion_frequency, 0.0);
}

TEST_F(MetricsTest, Estimate) {
    Estimate e = MetricsReducer::estimate({1.0, 2.0, 3.0});
    EXPECT_DOUBLE_EQ(e.mean, 2.0);
    EXPECT_NEAR(e.standard_error, 1.0 / std::sqrt(3.0), 1e-12);

    Estimate single = MetricsReducer::estimate({4.0});
    EXPECT_DOUBLE_EQ(single.mean, 4.0);
    EXPECT_DOUBLE_EQ(single.standard_error, 0.0);

    Estimate none = MetricsReducer::estimate({});
    EXPECT_DOUBLE_EQ(none.mean, 0.0);
}

TEST_F(MetricsTest, SummarizeReplications) {
    RunRecord first;
    first.aircraft.push_back(landedAircraft(1, 0, 22));
    RunRecord second;
    second.aircraft.push_back(landedAircraft(1, 0, 32));

    ReplicationSummary summary = MetricsReducer::summarize({first, second});
    EXPECT_EQ(summary.runs, 2u);
    EXPECT_DOUBLE_EQ(summary.average_delay.mean, 5.0);
    EXPECT_DOUBLE_EQ(summary.average_delay.standard_error, 5.0);
    EXPECT_DOUBLE_EQ(summary.landed.mean, 1.0);
    EXPECT_DOUBLE_EQ(summary.diversion_probability.mean, 0.0);
}

TEST_F(MetricsTest, Format) {
    RunRecord record;
    record.aircraft.push_back(landedAircraft(1, 0, 25));
    std::string text = MetricsReducer::format(MetricsReducer::reduce(record));
    EXPECT_NE(text.find("Average delay: 3.00 min"), std::string::npos);
    EXPECT_NE(text.find("Diversion probability: 0.00"), std::string::npos);

    std::string summary = MetricsReducer::format(MetricsReducer::summarize({record, record}));
    EXPECT_NE(summary.find("Replication Summary (2 runs)"), std::string::npos);
}

} // namespace test
} // namespace aep
