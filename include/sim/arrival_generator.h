#ifndef AEP_ARRIVAL_GENERATOR_H
#define AEP_ARRIVAL_GENERATOR_H

#include "common/random_source.h"
#include "common/types.h"
#include <vector>

namespace aep {

// Samples radar-contact minutes from a Poisson process and places storm windows.
class ArrivalGenerator {
public:
    explicit ArrivalGenerator(RandomSource& random);

    // Appearance minutes in [0, horizon), strictly increasing. Inter-arrival
    // times are exponential; an arrival landing on a taken minute moves to
    // the next free one.
    std::vector<int> generate(double rate_per_min, int horizon_min);

    // Closure of `duration_min` minutes starting uniformly in [0, horizon - duration]
    ClosureWindow placeStorm(int duration_min, int horizon_min);

private:
    RandomSource& random_;
};

} // namespace aep

#endif // AEP_ARRIVAL_GENERATOR_H
