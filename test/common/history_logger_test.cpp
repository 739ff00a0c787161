#include <gtest/gtest.h>
#include "common/history_logger.h"
#include "common/logger.h"
#include <cstdio>
#include <fstream>
#include <string>
#include <vector>

namespace aep {
namespace test {

class HistoryLoggerTest : public testing::Test {
protected:
    void SetUp() override {
        Logger::getInstance().enableConsoleOutput(false);
        path_ = testing::TempDir() + "aep_history_test.csv";
    }

    void TearDown() override {
        std::remove(path_.c_str());
    }

    std::vector<std::string> readLines() const {
        std::ifstream in(path_);
        std::vector<std::string> lines;
        std::string line;
        while (std::getline(in, line)) {
            lines.push_back(line);
        }
        return lines;
    }

    RunRecord runSchedule(const std::vector<int>& arrivals, ClosureWindow closure = ClosureWindow()) {
        auto config = std::make_shared<SimulationConfig>();
        config->arrival_schedule = arrivals;
        config->closure = closure;
        Simulation simulation(config, std::make_shared<SeededRandomSource>(1));
        return simulation.run();
    }

    std::string path_;
};

TEST_F(HistoryLoggerTest, WritesHeader) {
    {
        HistoryLogger logger(path_);
        EXPECT_TRUE(logger.isOperational());
        EXPECT_EQ(logger.getFilename(), path_);
    }

    auto lines = readLines();
    ASSERT_EQ(lines.size(), 3u);
    EXPECT_EQ(lines[0].rfind("# AEP approach history", 0), 0u);
    EXPECT_EQ(lines[1].rfind("# Started at: ", 0), 0u);
    EXPECT_EQ(lines[2], "minute,aircraft,position_nm,velocity_kt,status");
}

TEST_F(HistoryLoggerTest, WritesOneRowPerFrame) {
    RunRecord record = runSchedule({0});
    {
        HistoryLogger logger(path_);
        EXPECT_TRUE(logger.writeRun(record));
    }

    auto lines = readLines();
    // Header, run comment, then minutes 0 through 22
    ASSERT_EQ(lines.size(), 27u);
    EXPECT_EQ(lines[3].rfind("# run 0 ", 0), 0u);
    EXPECT_NE(lines[3].find("landed 1"), std::string::npos);
    EXPECT_EQ(lines[4], "0,AEP001,95.0000,300.0,IN_FLIGHT");
    EXPECT_EQ(lines[26], "22,AEP001,0.0000,0.0,LANDED");
}

TEST_F(HistoryLoggerTest, RecordsClosure) {
    RunRecord record = runSchedule({0}, ClosureWindow{true, 20, 25});
    {
        HistoryLogger logger(path_);
        EXPECT_TRUE(logger.writeRun(record));
        EXPECT_TRUE(logger.writeRun(record));
    }

    auto lines = readLines();
    ASSERT_GT(lines.size(), 5u);
    EXPECT_EQ(lines[4], "# closure 20 25");

    size_t run_comments = 0;
    for (const auto& line : lines) {
        if (line.rfind("# run ", 0) == 0) ++run_comments;
    }
    EXPECT_EQ(run_comments, 2u);
}

TEST_F(HistoryLoggerTest, UnwritablePathIsNotOperational) {
    HistoryLogger logger("/nonexistent_directory/history.csv");
    EXPECT_FALSE(logger.isOperational());
    EXPECT_FALSE(logger.writeRun(RunRecord()));
}

} // namespace test
} // namespace aep
