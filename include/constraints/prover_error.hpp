#pragma once

#include <stdexcept>
#include <string>
#include <vector>

namespace starkcomp {

/**
 * ProverError - integrity failure detected while composing constraints
 *
 * Only raised by degree verification. Carries the expected and the measured
 * values so the arithmetization author can see which constraint is off.
 */
class ProverError : public std::runtime_error {
public:
    enum class Kind {
        // measured transition constraint degrees differ from the declared ones
        MismatchedTransitionDegrees,
        // evaluation domain is not the size the measured degrees call for
        MismatchedDomainSize,
        // a column divided by its divisor is above the degree the arithmetization allows
        MismatchedColumnDegrees
    };

    ProverError(Kind kind, std::vector<size_t> expected, std::vector<size_t> actual);

    Kind kind() const { return kind_; }
    const std::vector<size_t>& expected() const { return expected_; }
    const std::vector<size_t>& actual() const { return actual_; }

private:
    Kind kind_;
    std::vector<size_t> expected_;
    std::vector<size_t> actual_;
};

const char* to_string(ProverError::Kind kind);

} // namespace starkcomp
