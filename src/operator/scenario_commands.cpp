#include "operator/scenario_commands.h"
#include "common/errors.h"
#include "common/logger.h"
#include <algorithm>
#include <cctype>
#include <fstream>
#include <iomanip>
#include <limits>
#include <sstream>
#include <utility>

namespace aep {

namespace {

std::string toUpper(std::string text) {
    std::transform(text.begin(), text.end(), text.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return text;
}

} // namespace

const std::string ScenarioCommandProcessor::ERR_UNKNOWN_COMMAND = "Unknown directive";
const std::string ScenarioCommandProcessor::ERR_INVALID_PARAMETERS = "Invalid parameter count";
const std::string ScenarioCommandProcessor::ERR_INVALID_VALUE = "Invalid value";

ScenarioCommandProcessor::ScenarioCommandProcessor(SimulationConfig& config)
    : config_(config) {
    initializeCommandDefinitions();
}

void ScenarioCommandProcessor::define(const std::string& name,
                                      CommandResult (ScenarioCommandProcessor::*handler)(const ParsedCommand&),
                                      CommandInfo info, size_t min_params, size_t max_params) {
    command_definitions_[name] = CommandDefinition{
        [this, handler](const ParsedCommand& cmd) { return (this->*handler)(cmd); },
        std::move(info),
        min_params, max_params
    };
}

void ScenarioCommandProcessor::initializeCommandDefinitions() {
    command_definitions_.clear();

    define("RATE", &ScenarioCommandProcessor::handleRate,
           {"RATE <per_minute>", "Mean arrivals per minute", {"RATE 0.05"}}, 1, 1);
    define("RATE_PER_HOUR", &ScenarioCommandProcessor::handleRatePerHour,
           {"RATE_PER_HOUR <per_hour>", "Mean arrivals per hour", {"RATE_PER_HOUR 3"}}, 1, 1);
    define("HORIZON", &ScenarioCommandProcessor::handleHorizon,
           {"HORIZON <minutes>", "Length of the simulated period", {"HORIZON 1080"}}, 1, 1);
    define("SEED", &ScenarioCommandProcessor::handleSeed,
           {"SEED <n>", "Seed of the random source", {"SEED 42"}}, 1, 1);
    define("RUNS", &ScenarioCommandProcessor::handleRuns,
           {"RUNS <n>", "Independent replications (seeds seed, seed+1, ...)", {"RUNS 100"}}, 1, 1);
    define("DT", &ScenarioCommandProcessor::handleTimeStep,
           {"DT <minutes>", "Integration step", {"DT 1"}}, 1, 1);
    define("INITIAL_DISTANCE", &ScenarioCommandProcessor::handleInitialDistance,
           {"INITIAL_DISTANCE <nm>", "Distance at radar contact", {"INITIAL_DISTANCE 100"}}, 1, 1);
    define("REVERSAL_SPEED", &ScenarioCommandProcessor::handleReversalSpeed,
           {"REVERSAL_SPEED <kt>", "Speed flown away from the runway", {"REVERSAL_SPEED 200"}}, 1, 1);
    define("SPEED_STEP", &ScenarioCommandProcessor::handleSpeedStep,
           {"SPEED_STEP <kt>", "Slowdown applied inside the spacing buffer", {"SPEED_STEP 20"}}, 1, 1);
    define("SEPARATION", &ScenarioCommandProcessor::handleSeparation,
           {"SEPARATION <minutes>", "Minimum separation; below it the trailer reverses",
            {"SEPARATION 4"}}, 1, 1);
    define("SPACING_BUFFER", &ScenarioCommandProcessor::handleSpacingBuffer,
           {"SPACING_BUFFER <minutes>", "Below it the trailer slows down", {"SPACING_BUFFER 5"}}, 1, 1);
    define("REINSERTION", &ScenarioCommandProcessor::handleReinsertion,
           {"REINSERTION <minutes>", "Gap needed on both sides to rejoin the sequence",
            {"REINSERTION 10"}}, 1, 1);
    define("LANDING_GAP", &ScenarioCommandProcessor::handleLandingGap,
           {"LANDING_GAP <minutes>", "Minimum time between landings", {"LANDING_GAP 10"}}, 1, 1);
    define("MAX_DELAY", &ScenarioCommandProcessor::handleMaxDelay,
           {"MAX_DELAY <minutes>", "Airborne time after which an aircraft diverts", {"MAX_DELAY 90"}}, 1, 1);
    define("CLOSURE", &ScenarioCommandProcessor::handleClosure,
           {"CLOSURE <start> <end>", "Runway closed for landings during [start, end)",
            {"CLOSURE 30 60"}}, 2, 2);
    define("STORM", &ScenarioCommandProcessor::handleStorm,
           {"STORM <duration>", "Closure of the given length at a random start", {"STORM 30"}}, 1, 1);
    define("WIND", &ScenarioCommandProcessor::handleWind,
           {"WIND <probability|OFF>", "Per-minute go-around probability", {"WIND 0.1", "WIND OFF"}}, 1, 1);
    define("WIND_FINAL_ONLY", &ScenarioCommandProcessor::handleWindFinalOnly,
           {"WIND_FINAL_ONLY <ON|OFF>", "Restrict wind trials to the final approach",
            {"WIND_FINAL_ONLY ON"}}, 1, 1);
    define("DIVERT_AT_CLOSING", &ScenarioCommandProcessor::handleDivertAtClosing,
           {"DIVERT_AT_CLOSING <ON|OFF>", "Divert aircraft that cannot land before the horizon",
            {"DIVERT_AT_CLOSING ON"}}, 1, 1);
    define("CHECK_INVARIANTS", &ScenarioCommandProcessor::handleCheckInvariants,
           {"CHECK_INVARIANTS <ON|OFF>", "Run the queue consistency check every minute",
            {"CHECK_INVARIANTS OFF"}}, 1, 1);
    define("SPEED_BAND", &ScenarioCommandProcessor::handleSpeedBand,
           {"SPEED_BAND <floor_nm> <vmax> <vmin>",
            "Speed limits above a distance; the first one replaces the defaults",
            {"SPEED_BAND 100 500 300", "SPEED_BAND 0 150 120"}}, 3, 3);
    define("ARRIVALS", &ScenarioCommandProcessor::handleArrivals,
           {"ARRIVALS <minute> [...]", "Explicit appearance minutes instead of sampling",
            {"ARRIVALS 0 1", "ARRIVALS 10 25 40"}}, 1, std::numeric_limits<size_t>::max());
    define("HELP", &ScenarioCommandProcessor::handleHelp,
           {"HELP [directive]", "Show help information", {"HELP", "HELP CLOSURE"}}, 0, 1);
}

ScenarioCommandProcessor::CommandResult
ScenarioCommandProcessor::processCommand(const std::string& command_line) {
    try {
        std::string line = command_line.substr(0, command_line.find(COMMENT_CHAR));
        ParsedCommand cmd = parseCommandLine(line);
        if (cmd.command.empty()) {
            return CommandResult(true);
        }

        cmd.command = toUpper(cmd.command);

        auto it = command_definitions_.find(cmd.command);
        if (it == command_definitions_.end()) {
            return CommandResult(false, ERR_UNKNOWN_COMMAND + ": " + cmd.command);
        }

        const auto& def = it->second;
        if (cmd.parameters.size() < def.min_params ||
            cmd.parameters.size() > def.max_params) {
            return CommandResult(false, ERR_INVALID_PARAMETERS + " (" + def.info.syntax + ")");
        }

        return def.handler(cmd);

    } catch (const std::exception& e) {
        return CommandResult(false, "Error processing directive: " + std::string(e.what()));
    }
}

ScenarioCommandProcessor::CommandResult
ScenarioCommandProcessor::handleRate(const ParsedCommand& cmd) {
    double rate = 0.0;
    if (!parseDouble(cmd.parameters[0], rate) || rate <= 0.0) {
        return CommandResult(false, "Arrival rate must be a positive number");
    }
    config_.arrival_rate_per_min = rate;
    return CommandResult(true, "Arrival rate set");
}

ScenarioCommandProcessor::CommandResult
ScenarioCommandProcessor::handleRatePerHour(const ParsedCommand& cmd) {
    double rate = 0.0;
    if (!parseDouble(cmd.parameters[0], rate) || rate <= 0.0) {
        return CommandResult(false, "Arrival rate must be a positive number");
    }
    config_.arrival_rate_per_min = rate / 60.0;
    return CommandResult(true, "Arrival rate set");
}

ScenarioCommandProcessor::CommandResult
ScenarioCommandProcessor::handleHorizon(const ParsedCommand& cmd) {
    int horizon = 0;
    if (!parseInt(cmd.parameters[0], horizon) || horizon <= 0) {
        return CommandResult(false, "Horizon must be a positive number of minutes");
    }
    config_.horizon_min = horizon;
    return CommandResult(true, "Horizon set");
}

ScenarioCommandProcessor::CommandResult
ScenarioCommandProcessor::handleSeed(const ParsedCommand& cmd) {
    const std::string& token = cmd.parameters[0];
    if (token.empty() || !std::all_of(token.begin(), token.end(),
                                      [](char c) { return std::isdigit(static_cast<unsigned char>(c)); })) {
        return CommandResult(false, "Seed must be a non-negative integer");
    }
    unsigned long long seed = std::stoull(token);
    if (seed > std::numeric_limits<uint32_t>::max()) {
        return CommandResult(false, "Seed must fit in 32 bits");
    }
    config_.has_seed = true;
    config_.seed = static_cast<uint32_t>(seed);
    return CommandResult(true, "Seed set");
}

ScenarioCommandProcessor::CommandResult
ScenarioCommandProcessor::handleRuns(const ParsedCommand& cmd) {
    int runs = 0;
    if (!parseInt(cmd.parameters[0], runs) || runs < 1) {
        return CommandResult(false, "Replications must be at least 1");
    }
    config_.replications = runs;
    return CommandResult(true, "Replications set");
}

ScenarioCommandProcessor::CommandResult
ScenarioCommandProcessor::handleTimeStep(const ParsedCommand& cmd) {
    double dt = 0.0;
    if (!parseDouble(cmd.parameters[0], dt) || dt <= 0.0) {
        return CommandResult(false, "Time step must be positive");
    }
    config_.time_step_min = dt;
    return CommandResult(true, "Time step set");
}

ScenarioCommandProcessor::CommandResult
ScenarioCommandProcessor::handleInitialDistance(const ParsedCommand& cmd) {
    double distance = 0.0;
    if (!parseDouble(cmd.parameters[0], distance) || distance <= 0.0) {
        return CommandResult(false, "Initial distance must be positive");
    }
    config_.initial_distance_nm = distance;
    return CommandResult(true, "Initial distance set");
}

ScenarioCommandProcessor::CommandResult
ScenarioCommandProcessor::handleReversalSpeed(const ParsedCommand& cmd) {
    double speed = 0.0;
    if (!parseDouble(cmd.parameters[0], speed) || speed <= 0.0) {
        return CommandResult(false, "Reversal speed must be positive");
    }
    config_.reversal_speed_kt = speed;
    return CommandResult(true, "Reversal speed set");
}

ScenarioCommandProcessor::CommandResult
ScenarioCommandProcessor::handleSpeedStep(const ParsedCommand& cmd) {
    double step = 0.0;
    if (!parseDouble(cmd.parameters[0], step) || step < 0.0) {
        return CommandResult(false, "Speed step must not be negative");
    }
    config_.speed_step_kt = step;
    return CommandResult(true, "Speed step set");
}

ScenarioCommandProcessor::CommandResult
ScenarioCommandProcessor::handleSeparation(const ParsedCommand& cmd) {
    double minutes = 0.0;
    if (!parseDouble(cmd.parameters[0], minutes) || minutes < 0.0) {
        return CommandResult(false, "Separation must not be negative");
    }
    config_.min_separation_min = minutes;
    return CommandResult(true, "Minimum separation set");
}

ScenarioCommandProcessor::CommandResult
ScenarioCommandProcessor::handleSpacingBuffer(const ParsedCommand& cmd) {
    double minutes = 0.0;
    if (!parseDouble(cmd.parameters[0], minutes) || minutes < 0.0) {
        return CommandResult(false, "Spacing buffer must not be negative");
    }
    config_.spacing_buffer_min = minutes;
    return CommandResult(true, "Spacing buffer set");
}

ScenarioCommandProcessor::CommandResult
ScenarioCommandProcessor::handleReinsertion(const ParsedCommand& cmd) {
    double minutes = 0.0;
    if (!parseDouble(cmd.parameters[0], minutes) || minutes < 0.0) {
        return CommandResult(false, "Reinsertion buffer must not be negative");
    }
    config_.reinsertion_buffer_min = minutes;
    return CommandResult(true, "Reinsertion buffer set");
}

ScenarioCommandProcessor::CommandResult
ScenarioCommandProcessor::handleLandingGap(const ParsedCommand& cmd) {
    int gap = 0;
    if (!parseInt(cmd.parameters[0], gap) || gap < 0) {
        return CommandResult(false, "Landing gap must be a non-negative number of minutes");
    }
    config_.landing_gap_min = gap;
    return CommandResult(true, "Landing gap set");
}

ScenarioCommandProcessor::CommandResult
ScenarioCommandProcessor::handleMaxDelay(const ParsedCommand& cmd) {
    int delay = 0;
    if (!parseInt(cmd.parameters[0], delay) || delay <= 0) {
        return CommandResult(false, "Maximum delay must be a positive number of minutes");
    }
    config_.max_delay_min = delay;
    return CommandResult(true, "Maximum delay set");
}

ScenarioCommandProcessor::CommandResult
ScenarioCommandProcessor::handleClosure(const ParsedCommand& cmd) {
    int start = 0;
    int end = 0;
    if (!parseInt(cmd.parameters[0], start) || !parseInt(cmd.parameters[1], end)) {
        return CommandResult(false, ERR_INVALID_VALUE + " (" + command_definitions_["CLOSURE"].info.syntax + ")");
    }
    if (start < 0 || end <= start) {
        return CommandResult(false, "Closure window must satisfy 0 <= start < end");
    }
    config_.closure.enabled = true;
    config_.closure.start_minute = start;
    config_.closure.end_minute = end;

    std::ostringstream oss;
    oss << "Runway closed during [" << start << ", " << end << ")";
    return CommandResult(true, oss.str());
}

ScenarioCommandProcessor::CommandResult
ScenarioCommandProcessor::handleStorm(const ParsedCommand& cmd) {
    int duration = 0;
    if (!parseInt(cmd.parameters[0], duration) || duration < 0) {
        return CommandResult(false, "Storm duration must be a non-negative number of minutes");
    }
    config_.storm_duration_min = duration;
    return CommandResult(true, "Storm duration set");
}

ScenarioCommandProcessor::CommandResult
ScenarioCommandProcessor::handleWind(const ParsedCommand& cmd) {
    std::string value = toUpper(cmd.parameters[0]);
    if (value == "OFF") {
        config_.wind_enabled = false;
        return CommandResult(true, "Wind aborts disabled");
    }

    double probability = 0.0;
    if (!parseDouble(cmd.parameters[0], probability) ||
        probability < 0.0 || probability > 1.0) {
        return CommandResult(false, "Wind probability must be within [0, 1]");
    }
    config_.wind_enabled = true;
    config_.wind_abort_probability = probability;
    return CommandResult(true, "Wind aborts enabled");
}

ScenarioCommandProcessor::CommandResult
ScenarioCommandProcessor::handleWindFinalOnly(const ParsedCommand& cmd) {
    if (!parseSwitch(cmd.parameters[0], config_.wind_final_approach_only)) {
        return CommandResult(false, "Value must be ON or OFF");
    }
    return CommandResult(true, "Final-approach wind restriction set");
}

ScenarioCommandProcessor::CommandResult
ScenarioCommandProcessor::handleDivertAtClosing(const ParsedCommand& cmd) {
    if (!parseSwitch(cmd.parameters[0], config_.divert_at_closing)) {
        return CommandResult(false, "Value must be ON or OFF");
    }
    return CommandResult(true, "Closing-time diversion set");
}

ScenarioCommandProcessor::CommandResult
ScenarioCommandProcessor::handleCheckInvariants(const ParsedCommand& cmd) {
    if (!parseSwitch(cmd.parameters[0], config_.check_invariants)) {
        return CommandResult(false, "Value must be ON or OFF");
    }
    return CommandResult(true, "Consistency checks set");
}

ScenarioCommandProcessor::CommandResult
ScenarioCommandProcessor::handleSpeedBand(const ParsedCommand& cmd) {
    SpeedBand band{0.0, 0.0, 0.0};
    if (!parseDouble(cmd.parameters[0], band.floor_nm) ||
        !parseDouble(cmd.parameters[1], band.max_speed_kt) ||
        !parseDouble(cmd.parameters[2], band.min_speed_kt)) {
        return CommandResult(false, ERR_INVALID_VALUE + " (" + command_definitions_["SPEED_BAND"].info.syntax + ")");
    }
    if (band.floor_nm < 0.0 || band.min_speed_kt <= 0.0 || band.min_speed_kt > band.max_speed_kt) {
        return CommandResult(false, "Speed band needs floor >= 0 and 0 < vmin <= vmax");
    }

    custom_bands_.push_back(band);
    config_.speed_table = SpeedTable(custom_bands_);
    return CommandResult(true, "Speed band added (" + std::to_string(custom_bands_.size()) + " defined)");
}

ScenarioCommandProcessor::CommandResult
ScenarioCommandProcessor::handleArrivals(const ParsedCommand& cmd) {
    std::vector<int> minutes;
    for (const auto& token : cmd.parameters) {
        int minute = 0;
        if (!parseInt(token, minute) || minute < 0) {
            return CommandResult(false, "Arrival minutes must be non-negative integers: " + token);
        }
        minutes.push_back(minute);
    }
    config_.arrival_schedule.insert(config_.arrival_schedule.end(), minutes.begin(), minutes.end());
    return CommandResult(true, std::to_string(config_.arrival_schedule.size()) + " arrivals scheduled");
}

ScenarioCommandProcessor::CommandResult
ScenarioCommandProcessor::handleHelp(const ParsedCommand& cmd) {
    if (cmd.parameters.empty()) {
        return CommandResult(true, getHelpText());
    }

    return CommandResult(true, getCommandHelp(toUpper(cmd.parameters[0])));
}

ScenarioCommandProcessor::ParsedCommand
ScenarioCommandProcessor::parseCommandLine(const std::string& command_line) const {
    ParsedCommand result;
    std::istringstream iss(command_line);
    std::string token;

    if (!(iss >> token)) {
        return result;
    }
    result.command = token;

    while (iss >> token) {
        result.parameters.push_back(token);
    }

    return result;
}

bool ScenarioCommandProcessor::parseDouble(const std::string& token, double& value) {
    try {
        size_t used = 0;
        double parsed = std::stod(token, &used);
        if (used != token.size()) {
            return false;
        }
        value = parsed;
        return true;
    } catch (const std::exception&) {
        return false;
    }
}

bool ScenarioCommandProcessor::parseInt(const std::string& token, int& value) {
    try {
        size_t used = 0;
        int parsed = std::stoi(token, &used);
        if (used != token.size()) {
            return false;
        }
        value = parsed;
        return true;
    } catch (const std::exception&) {
        return false;
    }
}

bool ScenarioCommandProcessor::parseSwitch(const std::string& token, bool& value) {
    std::string upper = toUpper(token);
    if (upper == "ON") {
        value = true;
        return true;
    }
    if (upper == "OFF") {
        value = false;
        return true;
    }
    return false;
}

std::string ScenarioCommandProcessor::getHelpText() const {
    std::vector<std::string> names;
    for (const auto& pair : command_definitions_) {
        names.push_back(pair.first);
    }
    std::sort(names.begin(), names.end());

    std::ostringstream oss;
    oss << "\nScenario Directives:\n"
        << "====================\n";

    for (const auto& name : names) {
        oss << std::left << std::setw(18) << name << " - "
            << command_definitions_.at(name).info.description << "\n";
    }

    oss << "\nUse 'HELP <directive>' for detailed information.\n";
    return oss.str();
}

std::string ScenarioCommandProcessor::getCommandHelp(const std::string& command) const {
    auto it = command_definitions_.find(command);
    if (it == command_definitions_.end()) {
        return "Unknown directive: " + command;
    }

    const auto& info = it->second.info;
    std::ostringstream oss;
    oss << "\nDirective: " << command << "\n"
        << "Syntax: " << info.syntax << "\n"
        << "Description: " << info.description << "\n"
        << "Examples:\n";

    for (const auto& example : info.examples) {
        oss << "  " << example << "\n";
    }

    return oss.str();
}

SimulationConfig ScenarioCommandProcessor::loadStream(std::istream& in, const std::string& source_name) {
    SimulationConfig config;
    ScenarioCommandProcessor processor(config);

    std::string line;
    int line_number = 0;
    while (std::getline(in, line)) {
        ++line_number;
        CommandResult result = processor.processCommand(line);
        if (!result.success) {
            std::ostringstream oss;
            oss << source_name << ":" << line_number << ": " << result.message;
            throw InvalidConfiguration(oss.str());
        }
        if (!result.message.empty()) {
            Logger::getInstance().debug(source_name + ":" + std::to_string(line_number) +
                                        ": " + result.message);
        }
    }

    config.validate();
    Logger::getInstance().log("Loaded scenario " + source_name + " (" +
                              std::to_string(line_number) + " lines)");
    return config;
}

SimulationConfig ScenarioCommandProcessor::loadFile(const std::string& filename) {
    std::ifstream file(filename);
    if (!file) {
        throw InvalidConfiguration("cannot open scenario file " + filename);
    }
    return loadStream(file, filename);
}

} // namespace aep
