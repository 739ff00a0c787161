#ifndef AEP_CONSTANTS_H
#define AEP_CONSTANTS_H

#include <string>

namespace aep {
namespace constants {

// Approach geometry
extern const double INITIAL_DISTANCE_NM;      // radar contact distance
extern const double LANDED_TOLERANCE_NM;      // distance treated as "on the threshold"

// Speed bands (floor in nm, speeds in knots), outermost first
extern const int DEFAULT_SPEED_BAND_COUNT;
extern const double DEFAULT_BAND_FLOOR_NM[];
extern const double DEFAULT_BAND_MAX_KT[];
extern const double DEFAULT_BAND_MIN_KT[];

extern const double REVERSAL_SPEED_KT;
extern const double SPEED_STEP_KT;            // slowdown applied inside the spacing buffer

// Separation (minutes of flight at the trailer's permitted speed)
extern const double MIN_SEPARATION_MIN;
extern const double SPACING_BUFFER_MIN;
extern const double REINSERTION_BUFFER_MIN;
extern const int LANDING_GAP_MIN;

// Diversion
extern const int MAX_DELAY_MIN;

// Weather
extern const double WIND_ABORT_PROBABILITY;
extern const double FINAL_APPROACH_WINDOW_MIN; // wind trials restricted to this when final-only

// Run control
extern const int HORIZON_MIN;
extern const double TIME_STEP_MIN;
extern const double ARRIVAL_RATE_PER_MIN;
extern const int REPLICATIONS;
extern const int MAX_LANDING_STEPS;           // cap for expected_time_to_land iteration

// Output
extern const std::string HISTORY_FILE_NAME;
extern const int CHART_WIDTH;
extern const int CHART_HEIGHT;

// System version
extern const std::string SYSTEM_VERSION;

} // namespace constants
} // namespace aep

#endif // AEP_CONSTANTS_H
