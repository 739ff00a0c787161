#include <gtest/gtest.h>
#include "display/trajectory_display.h"
#include "common/logger.h"
#include <sstream>

namespace aep {
namespace test {

class TrajectoryDisplayTest : public testing::Test {
protected:
    void SetUp() override {
        Logger::getInstance().enableConsoleOutput(false);
    }

    RunRecord runSchedule(const std::vector<int>& arrivals) {
        auto config = std::make_shared<SimulationConfig>();
        config->arrival_schedule = arrivals;
        Simulation simulation(config, std::make_shared<SeededRandomSource>(1));
        return simulation.run();
    }

    std::ostringstream out_;
};

TEST_F(TrajectoryDisplayTest, StatusSymbols) {
    EXPECT_EQ(TrajectoryDisplay::getStatusSymbol(FlightStatus::IN_FLIGHT), '*');
    EXPECT_EQ(TrajectoryDisplay::getStatusSymbol(FlightStatus::REVERSING), 'r');
    EXPECT_EQ(TrajectoryDisplay::getStatusSymbol(FlightStatus::LANDED), 'L');
    EXPECT_EQ(TrajectoryDisplay::getStatusSymbol(FlightStatus::DIVERTED), 'D');
}

TEST_F(TrajectoryDisplayTest, ChartShowsTrajectoryAndLegend) {
    RunRecord record = runSchedule({0});
    TrajectoryDisplay display(out_);
    display.renderChart(record);

    std::string text = out_.str();
    EXPECT_NE(text.find("=== Approach Trajectories (run 0) ==="), std::string::npos);
    EXPECT_NE(text.find("Landed: 1"), std::string::npos);
    EXPECT_NE(text.find('*'), std::string::npos);
    EXPECT_NE(text.find('L'), std::string::npos);
    EXPECT_NE(text.find("Legend:"), std::string::npos);
    // No escape codes unless color is requested
    EXPECT_EQ(text.find("\033["), std::string::npos);
}

TEST_F(TrajectoryDisplayTest, ChartScalesToConfiguredInitialDistance) {
    auto config = std::make_shared<SimulationConfig>();
    config->initial_distance_nm = 150.0;
    config->arrival_schedule = {0};
    Simulation simulation(config, std::make_shared<SeededRandomSource>(1));
    RunRecord record = simulation.run();
    EXPECT_DOUBLE_EQ(record.initial_distance_nm, 150.0);

    TrajectoryDisplay display(out_);
    display.renderChart(record);
    EXPECT_NE(out_.str().find(" 150.0 |"), std::string::npos);
}

TEST_F(TrajectoryDisplayTest, ColorChartUsesEscapeCodes) {
    RunRecord record = runSchedule({0});
    TrajectoryDisplay display(out_, true);
    display.renderChart(record);
    EXPECT_NE(out_.str().find("\033["), std::string::npos);
}

TEST_F(TrajectoryDisplayTest, AircraftTable) {
    RunRecord record = runSchedule({0});
    TrajectoryDisplay display(out_);
    display.renderAircraftTable(record, 1);

    std::string text = out_.str();
    EXPECT_NE(text.find("=== AEP001 ==="), std::string::npos);
    EXPECT_NE(text.find("expected arrival minute 22"), std::string::npos);
    EXPECT_NE(text.find("95.00"), std::string::npos);
    EXPECT_NE(text.find("300.00"), std::string::npos);
    EXPECT_NE(text.find("LANDED"), std::string::npos);
}

TEST_F(TrajectoryDisplayTest, AircraftTableShowsSeparation) {
    RunRecord record = runSchedule({0, 12});
    TrajectoryDisplay display(out_);
    display.renderAircraftTable(record, 2);

    std::string text = out_.str();
    EXPECT_NE(text.find("=== AEP002 ==="), std::string::npos);
    // At contact AEP001 is at 37.5 nm, 57.5 nm ahead at 300 kt
    EXPECT_NE(text.find("11.50"), std::string::npos);
}

TEST_F(TrajectoryDisplayTest, UnknownAircraft) {
    RunRecord record = runSchedule({0});
    TrajectoryDisplay display(out_);
    display.renderAircraftTable(record, 9);
    EXPECT_NE(out_.str().find("No aircraft with id 9"), std::string::npos);
}

TEST_F(TrajectoryDisplayTest, StateListing) {
    RunRecord record = runSchedule({0, 1});
    TrajectoryDisplay display(out_);
    display.renderStateListing(record, 1, 2);

    std::string text = out_.str();
    EXPECT_NE(text.find("=== States, minutes 1 to 2 ==="), std::string::npos);
    EXPECT_NE(text.find("AEP001"), std::string::npos);
    EXPECT_NE(text.find("AEP002"), std::string::npos);
    EXPECT_NE(text.find("REVERSING"), std::string::npos);
}

TEST_F(TrajectoryDisplayTest, LandingGapsFlagShortGaps) {
    RunRecord record;
    record.landing_minutes = {30, 22, 36};
    TrajectoryDisplay display(out_);
    display.renderLandingGaps(record, 10);

    std::string text = out_.str();
    EXPECT_NE(text.find("=== Landings (3) ==="), std::string::npos);
    EXPECT_NE(text.find("BELOW 10"), std::string::npos);
    EXPECT_LT(text.find("22"), text.find("30"));
}

TEST_F(TrajectoryDisplayTest, LandingGapsFromRun) {
    RunRecord record = runSchedule({0, 5});
    TrajectoryDisplay display(out_);
    display.renderLandingGaps(record, 10);

    std::string text = out_.str();
    EXPECT_NE(text.find("=== Landings (2) ==="), std::string::npos);
    EXPECT_NE(text.find("gap  10"), std::string::npos);
    EXPECT_EQ(text.find("BELOW"), std::string::npos);
}

} // namespace test
} // namespace aep
