#ifndef AEP_TEST_MOCK_RANDOM_SOURCE_H
#define AEP_TEST_MOCK_RANDOM_SOURCE_H

#include "common/random_source.h"
#include <gmock/gmock.h>

namespace aep {
namespace test {

// exponential() and uniformInt() keep their base implementations, so
// scripting uniform() drives every draw.
class MockRandomSource : public RandomSource {
public:
    MOCK_METHOD(double, uniform, (), (override));
};

} // namespace test
} // namespace aep

#endif // AEP_TEST_MOCK_RANDOM_SOURCE_H
