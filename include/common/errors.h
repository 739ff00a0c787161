#ifndef AEP_ERRORS_H
#define AEP_ERRORS_H

#include <stdexcept>
#include <string>

namespace aep {

// User-correctable problem in the scenario; raised before a run starts
class InvalidConfiguration : public std::invalid_argument {
public:
    explicit InvalidConfiguration(const std::string& what)
        : std::invalid_argument("Invalid configuration: " + what) {}
};

// Broken ordering or state uniqueness; an implementation defect, fatal for the run
class InvariantViolation : public std::logic_error {
public:
    explicit InvariantViolation(const std::string& what)
        : std::logic_error("Invariant violation: " + what) {}
};

} // namespace aep

#endif // AEP_ERRORS_H
