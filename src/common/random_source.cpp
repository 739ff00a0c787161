#include "common/random_source.h"
#include <cmath>
#include <stdexcept>

namespace aep {

double RandomSource::exponential(double rate) {
    if (rate <= 0.0) {
        throw std::invalid_argument("Exponential rate must be positive");
    }
    return -std::log(1.0 - uniform()) / rate;
}

int RandomSource::uniformInt(int low, int high) {
    if (high < low) {
        throw std::invalid_argument("Empty integer range");
    }
    int span = high - low + 1;
    int offset = static_cast<int>(uniform() * span);
    if (offset >= span) offset = span - 1;
    return low + offset;
}

SeededRandomSource::SeededRandomSource(uint32_t seed)
    : seed_(seed)
    , engine_(seed)
    , unit_(0.0, 1.0) {
}

SeededRandomSource::SeededRandomSource()
    : SeededRandomSource(std::random_device{}()) {
}

double SeededRandomSource::uniform() {
    return unit_(engine_);
}

double SeededRandomSource::exponential(double rate) {
    if (rate <= 0.0) {
        throw std::invalid_argument("Exponential rate must be positive");
    }
    std::exponential_distribution<double> dist(rate);
    return dist(engine_);
}

int SeededRandomSource::uniformInt(int low, int high) {
    if (high < low) {
        throw std::invalid_argument("Empty integer range");
    }
    std::uniform_int_distribution<int> dist(low, high);
    return dist(engine_);
}

} // namespace aep
