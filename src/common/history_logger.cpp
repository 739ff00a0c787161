#include "common/history_logger.h"
#include "common/constants.h"
#include "common/logger.h"
#include <chrono>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace aep {

HistoryLogger::HistoryLogger(const std::string& filename)
    : file_operational_(false)
    , filename_(filename) {

    history_file_.open(filename_, std::ios::out | std::ios::trunc);
    if (history_file_.is_open()) {
        file_operational_ = true;
        writeHeader();
        Logger::getInstance().log("History logger initialized: " + filename_);
    } else {
        Logger::getInstance().error("Failed to open history file " + filename_);
    }
}

HistoryLogger::~HistoryLogger() {
    if (history_file_.is_open()) {
        history_file_.close();
    }
}

void HistoryLogger::writeHeader() {
    std::lock_guard<std::mutex> lock(file_mutex_);
    history_file_ << "# AEP approach history, version " << constants::SYSTEM_VERSION << "\n"
                  << "# Started at: " << getTimestamp() << "\n"
                  << "minute,aircraft,position_nm,velocity_kt,status\n";
    history_file_.flush();
}

std::string HistoryLogger::getTimestamp() const {
    auto now = std::chrono::system_clock::now();
    auto time = std::chrono::system_clock::to_time_t(now);
    std::stringstream ss;
    ss << std::put_time(std::localtime(&time), "%Y-%m-%d %H:%M:%S");
    return ss.str();
}

bool HistoryLogger::writeRun(const RunRecord& record) {
    std::lock_guard<std::mutex> lock(file_mutex_);
    if (!file_operational_) return false;

    std::stringstream buffer;
    buffer << "# run " << record.run_index
           << " seed " << record.seed
           << " aircraft " << record.aircraft.size()
           << " landed " << record.landed_count
           << " diverted " << record.diverted_count
           << " airborne_at_horizon " << record.airborne_at_horizon
           << " congestion_events " << record.congestion_events << "\n";
    if (record.closure.enabled) {
        buffer << "# closure " << record.closure.start_minute
               << " " << record.closure.end_minute << "\n";
    }

    for (const auto& ac : record.aircraft) {
        for (const auto& frame : ac->getHistory()) {
            buffer << frame.minute << ','
                   << ac->getCallsign() << ','
                   << std::fixed << std::setprecision(4) << frame.position_nm << ','
                   << std::setprecision(1) << frame.velocity_kt << ','
                   << getStatusString(frame.status) << '\n';

            if (static_cast<size_t>(buffer.tellp()) >= MAX_BUFFER_SIZE) {
                history_file_ << buffer.str();
                buffer.str("");
                buffer.clear();
            }
        }
    }

    history_file_ << buffer.str();
    history_file_.flush();
    if (!history_file_) {
        Logger::getInstance().error("Write to history file " + filename_ + " failed");
        file_operational_ = false;
    }
    return file_operational_;
}

} // namespace aep
