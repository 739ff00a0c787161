#ifndef AEP_HISTORY_LOGGER_H
#define AEP_HISTORY_LOGGER_H

#include "core/simulation.h"
#include <fstream>
#include <mutex>
#include <string>

namespace aep {

// Writes per-aircraft trajectories as CSV, one block per run
class HistoryLogger {
public:
    explicit HistoryLogger(const std::string& filename);
    ~HistoryLogger();

    HistoryLogger(const HistoryLogger&) = delete;
    HistoryLogger& operator=(const HistoryLogger&) = delete;

    // Run summary as comment lines, then one row per history frame
    bool writeRun(const RunRecord& record);

    bool isOperational() const { return file_operational_; }
    const std::string& getFilename() const { return filename_; }

private:
    void writeHeader();
    std::string getTimestamp() const;

    std::ofstream history_file_;
    std::mutex file_mutex_;
    bool file_operational_;
    const std::string filename_;
    static constexpr size_t MAX_BUFFER_SIZE = 1024 * 1024;  // 1MB buffer size
};

} // namespace aep

#endif // AEP_HISTORY_LOGGER_H
