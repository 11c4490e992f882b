#include "constraints/prover_error.hpp"
#include <sstream>
#include <utility>

namespace starkcomp {

namespace {

std::string format_values(const std::vector<size_t>& values) {
    std::ostringstream oss;
    oss << "[";
    for (size_t i = 0; i < values.size(); ++i) {
        if (i > 0) oss << ", ";
        oss << values[i];
    }
    oss << "]";
    return oss.str();
}

std::string format_message(ProverError::Kind kind,
                           const std::vector<size_t>& expected,
                           const std::vector<size_t>& actual) {
    std::ostringstream oss;
    switch (kind) {
        case ProverError::Kind::MismatchedTransitionDegrees:
            oss << "transition constraint degrees didn't match\n"
                << "expected: " << format_values(expected) << "\n"
                << "actual:   " << format_values(actual);
            break;
        case ProverError::Kind::MismatchedDomainSize:
            oss << "incorrect constraint evaluation domain size; expected "
                << format_values(expected) << ", actual: " << format_values(actual);
            break;
        case ProverError::Kind::MismatchedColumnDegrees:
            oss << "constraint column degrees after division exceed their bounds\n"
                << "expected at most: " << format_values(expected) << "\n"
                << "actual:           " << format_values(actual);
            break;
    }
    return oss.str();
}

} // namespace

ProverError::ProverError(Kind kind, std::vector<size_t> expected, std::vector<size_t> actual)
    : std::runtime_error(format_message(kind, expected, actual))
    , kind_(kind)
    , expected_(std::move(expected))
    , actual_(std::move(actual)) {}

const char* to_string(ProverError::Kind kind) {
    switch (kind) {
        case ProverError::Kind::MismatchedTransitionDegrees: return "MismatchedTransitionDegrees";
        case ProverError::Kind::MismatchedDomainSize: return "MismatchedDomainSize";
        case ProverError::Kind::MismatchedColumnDegrees: return "MismatchedColumnDegrees";
    }
    return "Unknown";
}

} // namespace starkcomp
