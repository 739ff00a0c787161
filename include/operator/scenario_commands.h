#ifndef AEP_SCENARIO_COMMANDS_H
#define AEP_SCENARIO_COMMANDS_H

#include "core/simulation_config.h"
#include <functional>
#include <istream>
#include <string>
#include <unordered_map>
#include <vector>

namespace aep {

// Applies scenario directives ("HORIZON 180", "CLOSURE 30 60", ...) to a configuration.
class ScenarioCommandProcessor {
public:
    explicit ScenarioCommandProcessor(SimulationConfig& config);
    ~ScenarioCommandProcessor() = default;

    // Handlers are bound to this instance
    ScenarioCommandProcessor(const ScenarioCommandProcessor&) = delete;
    ScenarioCommandProcessor& operator=(const ScenarioCommandProcessor&) = delete;

    struct CommandResult {
        bool success;
        std::string message;

        CommandResult(bool s = false, const std::string& msg = "")
            : success(s)
            , message(msg) {}
    };

    // One directive; blank lines and comments succeed with an empty message
    CommandResult processCommand(const std::string& command_line);
    std::string getHelpText() const;
    std::string getCommandHelp(const std::string& command) const;

    // Throw InvalidConfiguration naming the failing line, then validate the result
    static SimulationConfig loadFile(const std::string& filename);
    static SimulationConfig loadStream(std::istream& in, const std::string& source_name);

private:
    struct CommandInfo {
        std::string syntax;
        std::string description;
        std::vector<std::string> examples;
    };

    struct ParsedCommand {
        std::string command;
        std::vector<std::string> parameters;
    };

    struct CommandDefinition {
        std::function<CommandResult(const ParsedCommand&)> handler;
        CommandInfo info;
        size_t min_params;
        size_t max_params;
    };

    // Directive handlers
    CommandResult handleRate(const ParsedCommand& cmd);
    CommandResult handleRatePerHour(const ParsedCommand& cmd);
    CommandResult handleHorizon(const ParsedCommand& cmd);
    CommandResult handleSeed(const ParsedCommand& cmd);
    CommandResult handleRuns(const ParsedCommand& cmd);
    CommandResult handleTimeStep(const ParsedCommand& cmd);
    CommandResult handleInitialDistance(const ParsedCommand& cmd);
    CommandResult handleReversalSpeed(const ParsedCommand& cmd);
    CommandResult handleSpeedStep(const ParsedCommand& cmd);
    CommandResult handleSeparation(const ParsedCommand& cmd);
    CommandResult handleSpacingBuffer(const ParsedCommand& cmd);
    CommandResult handleReinsertion(const ParsedCommand& cmd);
    CommandResult handleLandingGap(const ParsedCommand& cmd);
    CommandResult handleMaxDelay(const ParsedCommand& cmd);
    CommandResult handleClosure(const ParsedCommand& cmd);
    CommandResult handleStorm(const ParsedCommand& cmd);
    CommandResult handleWind(const ParsedCommand& cmd);
    CommandResult handleWindFinalOnly(const ParsedCommand& cmd);
    CommandResult handleDivertAtClosing(const ParsedCommand& cmd);
    CommandResult handleCheckInvariants(const ParsedCommand& cmd);
    CommandResult handleSpeedBand(const ParsedCommand& cmd);
    CommandResult handleArrivals(const ParsedCommand& cmd);
    CommandResult handleHelp(const ParsedCommand& cmd);

    // Helper methods
    void initializeCommandDefinitions();
    void define(const std::string& name,
                CommandResult (ScenarioCommandProcessor::*handler)(const ParsedCommand&),
                CommandInfo info, size_t min_params, size_t max_params);
    ParsedCommand parseCommandLine(const std::string& command_line) const;
    static bool parseDouble(const std::string& token, double& value);
    static bool parseInt(const std::string& token, int& value);
    static bool parseSwitch(const std::string& token, bool& value);

    SimulationConfig& config_;
    std::vector<SpeedBand> custom_bands_;
    std::unordered_map<std::string, CommandDefinition> command_definitions_;

    static const char COMMENT_CHAR = '#';

    // Error messages
    static const std::string ERR_UNKNOWN_COMMAND;
    static const std::string ERR_INVALID_PARAMETERS;
    static const std::string ERR_INVALID_VALUE;
};

} // namespace aep

#endif // AEP_SCENARIO_COMMANDS_H
