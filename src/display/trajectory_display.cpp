#include "display/trajectory_display.h"
#include "common/constants.h"
#include <algorithm>
#include <iomanip>
#include <sstream>

namespace aep {

TrajectoryDisplay::TrajectoryDisplay(std::ostream& out, bool use_color)
    : out_(out)
    , use_color_(use_color)
    , width_(constants::CHART_WIDTH)
    , height_(constants::CHART_HEIGHT) {
    initializeGrid();
}

void TrajectoryDisplay::initializeGrid() {
    grid_.assign(height_, std::vector<GridCell>(width_));
}

char TrajectoryDisplay::getStatusSymbol(FlightStatus status) {
    switch (status) {
        case FlightStatus::IN_FLIGHT: return '*';
        case FlightStatus::REVERSING: return 'r';
        case FlightStatus::LANDED:    return 'L';
        case FlightStatus::DIVERTED:  return 'D';
    }
    return '?';
}

const char* TrajectoryDisplay::getStatusColor(FlightStatus status) const {
    switch (status) {
        case FlightStatus::REVERSING: return "\033[33m";    // Yellow
        case FlightStatus::DIVERTED:  return "\033[1;31m";  // Bright red
        case FlightStatus::LANDED:    return "\033[32m";    // Green
        default:                      return "\033[0m";     // Reset
    }
}

void TrajectoryDisplay::plotFrame(const HistoryFrame& frame, int horizon_min, double max_distance_nm) {
    int x = static_cast<int>(static_cast<double>(frame.minute) / horizon_min * width_);
    int y = static_cast<int>(frame.position_nm / max_distance_nm * (height_ - 1) + 0.5);
    x = std::min(std::max(x, 0), width_ - 1);
    y = std::min(std::max(y, 0), height_ - 1);

    // Row 0 is printed last, at the runway
    auto& cell = grid_[height_ - 1 - y][x];
    // Terminal events win over in-flight traffic sharing a cell
    if (!cell.occupied || frame.status == FlightStatus::LANDED ||
        frame.status == FlightStatus::DIVERTED) {
        cell.symbol = getStatusSymbol(frame.status);
        cell.status = frame.status;
        cell.occupied = true;
    }
}

void TrajectoryDisplay::displayCell(const GridCell& cell) {
    if (use_color_ && cell.occupied) {
        out_ << getStatusColor(cell.status) << cell.symbol << "\033[0m";
    } else {
        out_ << cell.symbol;
    }
}

void TrajectoryDisplay::renderChart(const RunRecord& record) {
    initializeGrid();

    double max_distance = std::max(record.initial_distance_nm, 1.0);
    for (const auto& ac : record.aircraft) {
        for (const auto& frame : ac->getHistory()) {
            max_distance = std::max(max_distance, frame.position_nm);
        }
    }

    int horizon = std::max(record.horizon_min, 1);
    for (const auto& ac : record.aircraft) {
        for (const auto& frame : ac->getHistory()) {
            plotFrame(frame, horizon, max_distance);
        }
    }

    out_ << "=== Approach Trajectories (run " << record.run_index << ") ===\n"
         << "Aircraft: " << record.aircraft.size()
         << " | Landed: " << record.landed_count
         << " | Diverted: " << record.diverted_count
         << " | Airborne at horizon: " << record.airborne_at_horizon << "\n";
    if (record.closure.enabled) {
        out_ << "Runway closed [" << record.closure.start_minute << ", "
             << record.closure.end_minute << ")\n";
    }

    for (int row = 0; row < height_; ++row) {
        double distance = max_distance * (height_ - 1 - row) / (height_ - 1);
        out_ << std::setw(6) << std::fixed << std::setprecision(1) << distance << " |";
        for (const auto& cell : grid_[row]) {
            displayCell(cell);
        }
        out_ << '\n';
    }

    out_ << std::string(7, ' ') << '+' << std::string(width_, '-') << '\n'
         << std::string(8, ' ') << "0" << std::setw(width_ - 1) << horizon << " min\n"
         << "Legend: " << getStatusSymbol(FlightStatus::IN_FLIGHT) << " in flight  "
         << getStatusSymbol(FlightStatus::REVERSING) << " reversing  "
         << getStatusSymbol(FlightStatus::LANDED) << " landed  "
         << getStatusSymbol(FlightStatus::DIVERTED) << " diverted\n";
}

const HistoryFrame* TrajectoryDisplay::frameAt(const Aircraft& aircraft, int minute) {
    for (const auto& frame : aircraft.getHistory()) {
        if (frame.minute == minute) {
            return &frame;
        }
    }
    return nullptr;
}

double TrajectoryDisplay::separationAhead(const RunRecord& record, const Aircraft& aircraft,
                                          const HistoryFrame& frame) {
    const HistoryFrame* ahead = nullptr;
    for (const auto& other : record.aircraft) {
        if (other->getId() == aircraft.getId()) continue;
        const HistoryFrame* candidate = frameAt(*other, frame.minute);
        if (!candidate || candidate->status != FlightStatus::IN_FLIGHT) continue;
        if (candidate->position_nm > frame.position_nm) continue;
        if (!ahead || candidate->position_nm > ahead->position_nm) {
            ahead = candidate;
        }
    }
    if (!ahead) {
        return -1.0;
    }
    double speed = aircraft.permittedSpeed(frame.position_nm).max_kt;
    return (frame.position_nm - ahead->position_nm) / speed * 60.0;
}

void TrajectoryDisplay::renderAircraftTable(const RunRecord& record, int aircraft_id) {
    auto it = std::find_if(record.aircraft.begin(), record.aircraft.end(),
        [aircraft_id](const std::shared_ptr<Aircraft>& ac) {
            return ac->getId() == aircraft_id;
        });
    if (it == record.aircraft.end()) {
        out_ << "No aircraft with id " << aircraft_id << "\n";
        return;
    }

    const Aircraft& ac = **it;
    out_ << "=== " << ac.getCallsign() << " ===\n"
         << "Appeared minute " << ac.getAppearanceMinute()
         << ", expected arrival minute " << ac.getExpectedArrivalMinute()
         << ", reversals " << ac.getReversalCount() << "\n"
         << std::setw(6) << "Minute" << std::setw(12) << "Pos (nm)"
         << std::setw(12) << "Vel (kt)" << std::setw(12) << "Sep (min)"
         << "  Status\n"
         << std::string(54, '-') << '\n';

    for (const auto& frame : ac.getHistory()) {
        out_ << std::fixed << std::setprecision(2)
             << std::setw(6) << frame.minute
             << std::setw(12) << frame.position_nm
             << std::setw(12) << frame.velocity_kt;

        double separation = frame.status == FlightStatus::IN_FLIGHT
            ? separationAhead(record, ac, frame) : -1.0;
        if (separation >= 0.0) {
            out_ << std::setw(12) << separation;
        } else {
            out_ << std::setw(12) << "-";
        }
        out_ << "  " << getStatusString(frame.status) << '\n';
    }
}

void TrajectoryDisplay::renderStateListing(const RunRecord& record, int from_minute, int to_minute) {
    out_ << "=== States, minutes " << from_minute << " to " << to_minute << " ===\n";
    for (int minute = from_minute; minute <= to_minute; ++minute) {
        for (const auto& ac : record.aircraft) {
            const HistoryFrame* frame = frameAt(*ac, minute);
            if (!frame) continue;
            out_ << std::fixed << std::setprecision(2)
                 << std::setw(5) << minute << "  " << ac->getCallsign()
                 << "  " << std::left << std::setw(10) << getStatusString(frame->status)
                 << std::right << std::setw(9) << frame->position_nm << " nm"
                 << std::setw(9) << frame->velocity_kt << " kt\n";
        }
    }
}

void TrajectoryDisplay::renderLandingGaps(const RunRecord& record, int landing_gap_min) {
    std::vector<int> landings = record.landing_minutes;
    std::sort(landings.begin(), landings.end());

    out_ << "=== Landings (" << landings.size() << ") ===\n";
    for (size_t i = 0; i < landings.size(); ++i) {
        out_ << std::setw(5) << landings[i];
        if (i > 0) {
            int gap = landings[i] - landings[i - 1];
            out_ << "  gap " << std::setw(3) << gap;
            if (gap < landing_gap_min) {
                out_ << "  BELOW " << landing_gap_min;
            }
        }
        out_ << '\n';
    }
}

} // namespace aep
