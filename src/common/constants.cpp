#include "common/constants.h"

namespace aep {
namespace constants {

// Approach geometry
const double INITIAL_DISTANCE_NM = 100.0;
const double LANDED_TOLERANCE_NM = 1e-9;

// Speed bands
const int DEFAULT_SPEED_BAND_COUNT = 5;
const double DEFAULT_BAND_FLOOR_NM[] = {100.0, 50.0, 15.0, 5.0, 0.0};
const double DEFAULT_BAND_MAX_KT[]   = {500.0, 300.0, 250.0, 200.0, 150.0};
const double DEFAULT_BAND_MIN_KT[]   = {300.0, 250.0, 200.0, 150.0, 120.0};

const double REVERSAL_SPEED_KT = 200.0;
const double SPEED_STEP_KT = 20.0;

// Separation
const double MIN_SEPARATION_MIN = 4.0;
const double SPACING_BUFFER_MIN = 5.0;
const double REINSERTION_BUFFER_MIN = 10.0;
const int LANDING_GAP_MIN = 10;

// Diversion
const int MAX_DELAY_MIN = 90;

// Weather
const double WIND_ABORT_PROBABILITY = 0.1;
const double FINAL_APPROACH_WINDOW_MIN = 1.0;

// Run control
const int HORIZON_MIN = 120;
const double TIME_STEP_MIN = 1.0;
const double ARRIVAL_RATE_PER_MIN = 0.05;
const int REPLICATIONS = 1;
const int MAX_LANDING_STEPS = 100000;

// Output
const std::string HISTORY_FILE_NAME = "aep_history.csv";
const int CHART_WIDTH = 72;
const int CHART_HEIGHT = 20;

const std::string SYSTEM_VERSION = "1.0.0";

} // namespace constants
} // namespace aep
