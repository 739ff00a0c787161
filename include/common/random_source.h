#ifndef AEP_RANDOM_SOURCE_H
#define AEP_RANDOM_SOURCE_H

#include <cstdint>
#include <random>

namespace aep {

// Single stream of randomness for a run. Arrivals, storm placement and wind
// trials all draw from the same source, in that order.
class RandomSource {
public:
    virtual ~RandomSource() = default;

    // Uniform on [0, 1)
    virtual double uniform() = 0;

    // Exponential with the given rate (events per unit time)
    virtual double exponential(double rate);

    // Uniform integer on [low, high]
    virtual int uniformInt(int low, int high);

    // One Bernoulli trial
    bool bernoulli(double probability) { return uniform() < probability; }
};

class SeededRandomSource : public RandomSource {
public:
    explicit SeededRandomSource(uint32_t seed);
    // Seeds from std::random_device
    SeededRandomSource();

    double uniform() override;
    double exponential(double rate) override;
    int uniformInt(int low, int high) override;
    uint32_t getSeed() const { return seed_; }

private:
    uint32_t seed_;
    std::mt19937 engine_;
    std::uniform_real_distribution<double> unit_;
};

} // namespace aep

#endif // AEP_RANDOM_SOURCE_H
