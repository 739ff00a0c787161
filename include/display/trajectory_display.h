#ifndef AEP_TRAJECTORY_DISPLAY_H
#define AEP_TRAJECTORY_DISPLAY_H

#include "core/simulation.h"
#include <ostream>
#include <string>
#include <vector>

namespace aep {

// Text reports over a finished run
class TrajectoryDisplay {
public:
    explicit TrajectoryDisplay(std::ostream& out, bool use_color = false);

    // Distance-to-runway vs minute, one symbol per status
    void renderChart(const RunRecord& record);

    // Minute, position, velocity, separation to the aircraft ahead, status
    void renderAircraftTable(const RunRecord& record, int aircraft_id);

    // Every frame with minute in [from_minute, to_minute]
    void renderStateListing(const RunRecord& record, int from_minute, int to_minute);

    void renderLandingGaps(const RunRecord& record, int landing_gap_min);

    static char getStatusSymbol(FlightStatus status);

private:
    struct GridCell {
        char symbol{' '};
        FlightStatus status{FlightStatus::IN_FLIGHT};
        bool occupied{false};
    };

    void initializeGrid();
    void plotFrame(const HistoryFrame& frame, int horizon_min, double max_distance_nm);
    void displayCell(const GridCell& cell);
    const char* getStatusColor(FlightStatus status) const;

    // Frame of `aircraft` stamped `minute`, or nullptr
    static const HistoryFrame* frameAt(const Aircraft& aircraft, int minute);
    // Minutes behind the nearest in-flight aircraft ahead at that minute; negative if none
    static double separationAhead(const RunRecord& record, const Aircraft& aircraft,
                                  const HistoryFrame& frame);

    std::ostream& out_;
    bool use_color_;
    std::vector<std::vector<GridCell>> grid_;
    int width_;
    int height_;
};

} // namespace aep

#endif // AEP_TRAJECTORY_DISPLAY_H
