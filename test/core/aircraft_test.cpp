#include <gtest/gtest.h>
#include "core/aircraft.h"
#include "common/errors.h"
#include "common/logger.h"

namespace aep {
namespace test {

class AircraftTest : public testing::Test {
protected:
    void SetUp() override {
        Logger::getInstance().enableConsoleOutput(false);
        config_ = std::make_shared<SimulationConfig>();
        aircraft_ = std::make_shared<Aircraft>(1, 0, config_);
    }

    // Puts the aircraft on the threshold in one step
    void flyToThreshold(Aircraft& ac, int minute) {
        ac.setVelocity(ac.getPosition() * 60.0);
        ac.advance(minute, 1.0);
    }

    std::shared_ptr<SimulationConfig> config_;
    std::shared_ptr<Aircraft> aircraft_;
};

TEST_F(AircraftTest, Initialization) {
    EXPECT_EQ(aircraft_->getId(), 1);
    EXPECT_EQ(aircraft_->getCallsign(), "AEP001");
    EXPECT_EQ(aircraft_->getAppearanceMinute(), 0);
    EXPECT_DOUBLE_EQ(aircraft_->getPosition(), 100.0);
    EXPECT_EQ(aircraft_->getStatus(), FlightStatus::IN_FLIGHT);
    EXPECT_DOUBLE_EQ(aircraft_->getVelocity(), 300.0);
    EXPECT_FALSE(aircraft_->everReversed());
    EXPECT_TRUE(aircraft_->getHistory().empty());
}

TEST_F(AircraftTest, ExpectedArrival) {
    EXPECT_EQ(aircraft_->expectedTimeToLand(), 23);
    EXPECT_EQ(aircraft_->getExpectedArrivalMinute(), 22);

    Aircraft late(7, 40, config_);
    EXPECT_EQ(late.getExpectedArrivalMinute(), 62);
    EXPECT_EQ(late.getCallsign(), "AEP007");
}

TEST_F(AircraftTest, PermittedSpeedBands) {
    EXPECT_DOUBLE_EQ(aircraft_->permittedSpeed(150.0).max_kt, 500.0);
    EXPECT_DOUBLE_EQ(aircraft_->permittedSpeed(100.0).max_kt, 300.0);
    EXPECT_DOUBLE_EQ(aircraft_->permittedSpeed(50.0).max_kt, 250.0);
    EXPECT_DOUBLE_EQ(aircraft_->permittedSpeed(10.0).max_kt, 200.0);
    EXPECT_DOUBLE_EQ(aircraft_->permittedSpeed(5.0).max_kt, 150.0);
    EXPECT_DOUBLE_EQ(aircraft_->permittedSpeed(3.0).min_kt, 120.0);
    EXPECT_DOUBLE_EQ(aircraft_->permittedSpeed(0.0).max_kt, 150.0);
}

TEST_F(AircraftTest, AdvanceInFlight) {
    EXPECT_TRUE(aircraft_->advance(0, 1.0));
    EXPECT_DOUBLE_EQ(aircraft_->getPosition(), 95.0);
    EXPECT_EQ(aircraft_->expectedTimeToLand(), 22);
}

TEST_F(AircraftTest, UnimpededApproachTakesExpectedSteps) {
    int steps = 0;
    while (!aircraft_->isOnThreshold()) {
        aircraft_->setVelocity(aircraft_->permittedSpeed().max_kt);
        aircraft_->advance(steps, 1.0);
        ++steps;
    }
    EXPECT_EQ(steps, 23);
    EXPECT_DOUBLE_EQ(aircraft_->getPosition(), 0.0);

    aircraft_->land(22);
    ASSERT_NE(aircraft_->landing(), nullptr);
    EXPECT_EQ(aircraft_->landing()->landing_minute, 22);
    EXPECT_EQ(aircraft_->getStatus(), FlightStatus::LANDED);
    EXPECT_DOUBLE_EQ(aircraft_->getVelocity(), 0.0);
}

TEST_F(AircraftTest, ReversalMovesAwayFromRunway) {
    aircraft_->startReversal(3, "test");
    EXPECT_TRUE(aircraft_->isReversing());
    EXPECT_TRUE(aircraft_->everReversed());
    ASSERT_NE(aircraft_->reversal(), nullptr);
    EXPECT_EQ(aircraft_->reversal()->since_minute, 3);
    EXPECT_DOUBLE_EQ(aircraft_->getVelocity(), -200.0);

    aircraft_->advance(4, 1.0);
    EXPECT_NEAR(aircraft_->getPosition(), 100.0 + 200.0 / 60.0, 1e-9);
}

TEST_F(AircraftTest, ReinsertionRestoresBandSpeed) {
    aircraft_->startReversal(0, "test");
    aircraft_->advance(1, 1.0);
    aircraft_->reinsert(1);

    EXPECT_TRUE(aircraft_->isInFlight());
    // Beyond 100 nm the outer band applies
    EXPECT_DOUBLE_EQ(aircraft_->getVelocity(), 500.0);
    EXPECT_EQ(aircraft_->getReversalCount(), 1);
    EXPECT_TRUE(aircraft_->everReversed());
}

TEST_F(AircraftTest, LandingRequiresThreshold) {
    EXPECT_THROW(aircraft_->land(5), InvariantViolation);

    flyToThreshold(*aircraft_, 0);
    aircraft_->startReversal(0, "test");
    EXPECT_THROW(aircraft_->land(1), InvariantViolation);
}

TEST_F(AircraftTest, TerminalAircraftRejectTransitions) {
    aircraft_->divert(10, DiversionReason::DELAY_BOUND);
    ASSERT_NE(aircraft_->diversion(), nullptr);
    EXPECT_EQ(aircraft_->diversion()->reason, DiversionReason::DELAY_BOUND);

    EXPECT_THROW(aircraft_->startReversal(11, "test"), InvariantViolation);
    EXPECT_THROW(aircraft_->setVelocity(200.0), InvariantViolation);
    EXPECT_THROW(aircraft_->divert(11, DiversionReason::CLOSURE), InvariantViolation);
    EXPECT_THROW(aircraft_->reinsert(11), InvariantViolation);

    double position = aircraft_->getPosition();
    EXPECT_FALSE(aircraft_->advance(11, 1.0));
    EXPECT_DOUBLE_EQ(aircraft_->getPosition(), position);
}

TEST_F(AircraftTest, HoldKeepsInFlight) {
    flyToThreshold(*aircraft_, 0);
    aircraft_->hold();
    EXPECT_TRUE(aircraft_->isInFlight());
    EXPECT_DOUBLE_EQ(aircraft_->getVelocity(), 0.0);

    aircraft_->advance(1, 1.0);
    EXPECT_DOUBLE_EQ(aircraft_->getPosition(), 0.0);
}

TEST_F(AircraftTest, RecordFrame) {
    aircraft_->advance(0, 1.0);
    aircraft_->recordFrame(0);
    aircraft_->startReversal(1, "test");
    aircraft_->recordFrame(1);

    const auto& history = aircraft_->getHistory();
    ASSERT_EQ(history.size(), 2u);
    EXPECT_EQ(history[0], (HistoryFrame{0, 95.0, 300.0, FlightStatus::IN_FLIGHT}));
    EXPECT_EQ(history[1].status, FlightStatus::REVERSING);
    EXPECT_DOUBLE_EQ(history[1].velocity_kt, -200.0);
}

TEST_F(AircraftTest, CustomSpeedTable) {
    config_->speed_table = SpeedTable(std::vector<SpeedBand>{SpeedBand{0.0, 600.0, 300.0}});
    Aircraft fast(2, 0, config_);
    EXPECT_DOUBLE_EQ(fast.getVelocity(), 600.0);
    EXPECT_EQ(fast.expectedTimeToLand(), 10);
}

} // namespace test
} // namespace aep
