#include "common/constants.h"
#include "common/errors.h"
#include "common/history_logger.h"
#include "common/logger.h"
#include "core/metrics.h"
#include "core/simulation.h"
#include "display/trajectory_display.h"
#include "operator/scenario_commands.h"
#include <iostream>
#include <memory>
#include <string>

namespace {

struct Options {
    std::string scenario_file;
    std::string history_file{aep::constants::HISTORY_FILE_NAME};
    std::string log_file;
    bool verbose{false};
    bool directives{false};
    bool chart{true};
    bool color{false};
    int table_aircraft{0};
    bool states{false};
    int states_from{0};
    int states_to{0};
};

void printUsage(const char* program) {
    std::cerr << "Usage: " << program << " [scenario_file] [options]\n"
              << "  --verbose              log every transition\n"
              << "  --no-chart             skip the trajectory chart\n"
              << "  --color                ANSI colors in the chart\n"
              << "  --history <file>       CSV history output (default "
              << aep::constants::HISTORY_FILE_NAME << ")\n"
              << "  --log <file>           append log lines to a file\n"
              << "  --aircraft <id>        per-minute table for one aircraft\n"
              << "  --states <from> <to>   list every aircraft state in a minute range\n"
              << "  --directives           list scenario file directives\n";
}

bool parseOptions(int argc, char** argv, Options& options) {
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--verbose") {
            options.verbose = true;
        } else if (arg == "--no-chart") {
            options.chart = false;
        } else if (arg == "--color") {
            options.color = true;
        } else if (arg == "--history" && i + 1 < argc) {
            options.history_file = argv[++i];
        } else if (arg == "--log" && i + 1 < argc) {
            options.log_file = argv[++i];
        } else if (arg == "--aircraft" && i + 1 < argc) {
            options.table_aircraft = std::stoi(argv[++i]);
        } else if (arg == "--states" && i + 2 < argc) {
            options.states = true;
            options.states_from = std::stoi(argv[++i]);
            options.states_to = std::stoi(argv[++i]);
        } else if (arg == "--directives") {
            options.directives = true;
        } else if (arg == "--help" || arg == "-h") {
            return false;
        } else if (!arg.empty() && arg[0] != '-' && options.scenario_file.empty()) {
            options.scenario_file = arg;
        } else {
            std::cerr << "Unknown argument: " << arg << std::endl;
            return false;
        }
    }
    return true;
}

} // namespace

int main(int argc, char** argv) {
    Options options;

    try {
        if (!parseOptions(argc, argv, options)) {
            printUsage(argv[0]);
            return 1;
        }

        if (options.directives) {
            aep::SimulationConfig defaults;
            aep::ScenarioCommandProcessor processor(defaults);
            std::cout << processor.getHelpText();
            return 0;
        }

        auto& logger = aep::Logger::getInstance();
        if (options.verbose) {
            logger.setLevel(aep::LogLevel::DEBUG);
        }
        if (!options.log_file.empty() && !logger.setLogFile(options.log_file)) {
            return 1;
        }

        aep::SimulationConfig config;
        if (!options.scenario_file.empty()) {
            config = aep::ScenarioCommandProcessor::loadFile(options.scenario_file);
        }
        std::cout << config.describe() << "\n\n";

        auto shared_config = std::make_shared<const aep::SimulationConfig>(config);
        auto records = aep::Simulation::runReplications(shared_config);

        bool history_written = true;
        aep::HistoryLogger history(options.history_file);
        for (const auto& record : records) {
            if (!history.writeRun(record)) {
                logger.error("History for run " + std::to_string(record.run_index) +
                             " not written to " + options.history_file);
                history_written = false;
                break;
            }
        }

        const aep::RunRecord& first = records.front();
        aep::TrajectoryDisplay display(std::cout, options.color);
        if (options.chart) {
            display.renderChart(first);
            std::cout << '\n';
        }
        display.renderLandingGaps(first, config.landing_gap_min);
        if (options.table_aircraft > 0) {
            std::cout << '\n';
            display.renderAircraftTable(first, options.table_aircraft);
        }
        if (options.states) {
            std::cout << '\n';
            display.renderStateListing(first, options.states_from, options.states_to);
        }

        std::cout << '\n' << aep::MetricsReducer::format(aep::MetricsReducer::reduce(first));
        if (records.size() > 1) {
            std::cout << '\n' << aep::MetricsReducer::format(aep::MetricsReducer::summarize(records));
        }
        logger.closeLogFile();
        return history_written ? 0 : 1;

    } catch (const aep::InvalidConfiguration& e) {
        aep::Logger::getInstance().error(e.what());
        return 1;
    } catch (const aep::InvariantViolation& e) {
        aep::Logger::getInstance().error(e.what());
        return 2;
    } catch (const std::exception& e) {
        aep::Logger::getInstance().error(std::string("Fatal error: ") + e.what());
        return 1;
    }
}
