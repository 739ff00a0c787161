#include "sim/arrival_generator.h"
#include "common/errors.h"
#include "common/logger.h"
#include <algorithm>
#include <cmath>
#include <set>
#include <sstream>

namespace aep {

ArrivalGenerator::ArrivalGenerator(RandomSource& random)
    : random_(random) {
}

std::vector<int> ArrivalGenerator::generate(double rate_per_min, int horizon_min) {
    if (rate_per_min <= 0.0) {
        throw InvalidConfiguration("arrival rate must be positive");
    }
    if (horizon_min <= 0) {
        throw InvalidConfiguration("horizon must be positive");
    }

    std::vector<double> times;
    double t = 0.0;
    while (true) {
        t += random_.exponential(rate_per_min);
        if (t >= horizon_min) break;
        times.push_back(t);
    }

    std::set<int> taken;
    for (double time : times) {
        int minute = static_cast<int>(std::floor(time));
        while (taken.count(minute) && minute < horizon_min) {
            ++minute;
        }
        if (minute < horizon_min) {
            taken.insert(minute);
        }
    }

    std::vector<int> minutes(taken.begin(), taken.end());

    std::ostringstream oss;
    oss << "Sampled " << minutes.size() << " arrivals over " << horizon_min
        << " min (rate " << rate_per_min << "/min)";
    Logger::getInstance().debug(oss.str());
    return minutes;
}

ClosureWindow ArrivalGenerator::placeStorm(int duration_min, int horizon_min) {
    ClosureWindow window;
    if (duration_min <= 0) {
        return window;
    }
    if (duration_min > horizon_min) {
        throw InvalidConfiguration("storm duration exceeds the horizon");
    }

    window.enabled = true;
    window.start_minute = random_.uniformInt(0, horizon_min - duration_min);
    window.end_minute = window.start_minute + duration_min;

    std::ostringstream oss;
    oss << "Storm closes the runway during [" << window.start_minute << ", "
        << window.end_minute << ")";
    Logger::getInstance().log(oss.str());
    return window;
}

} // namespace aep
