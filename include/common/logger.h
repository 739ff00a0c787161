#ifndef AEP_LOGGER_H
#define AEP_LOGGER_H

#include <string>
#include <fstream>
#include <mutex>

namespace aep {

enum class LogLevel {
    DEBUG,
    INFO,
    WARNING,
    ERROR
};

class Logger {
public:
    // Get the singleton instance of the logger
    static Logger& getInstance();

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    // Log a message at INFO level
    void log(const std::string& message);
    void log(LogLevel level, const std::string& message);

    void debug(const std::string& message) { log(LogLevel::DEBUG, message); }
    void warning(const std::string& message) { log(LogLevel::WARNING, message); }
    void error(const std::string& message) { log(LogLevel::ERROR, message); }

    // Messages below this level are dropped
    void setLevel(LogLevel level);
    LogLevel getLevel() const;

    // Append to a log file in addition to the console (optional)
    bool setLogFile(const std::string& filename);
    void closeLogFile();

    // Enable or disable console output
    void enableConsoleOutput(bool enable);

    static std::string getLevelString(LogLevel level);

private:
    Logger();
    ~Logger();

    void write(LogLevel level, const std::string& message);

    mutable std::mutex mutex_;
    std::ofstream log_file_;
    bool console_output_enabled_;
    LogLevel level_;
};

} // namespace aep

#endif // AEP_LOGGER_H
