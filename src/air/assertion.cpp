#include "air/assertion.hpp"
#include "domain/stark_domain.hpp"
#include <sstream>
#include <stdexcept>

namespace starkcomp {

Assertion Assertion::single(size_t column, size_t step, BFieldElement value) {
    return Assertion(column, step, 0, value);
}

Assertion Assertion::periodic(size_t column, size_t first_step, size_t stride, BFieldElement value) {
    if (!is_power_of_two(stride) || stride < 2) {
        throw std::invalid_argument("Assertion stride must be a power of 2 greater than 1");
    }
    if (first_step >= stride) {
        throw std::invalid_argument("Periodic assertion must start within its first stride");
    }
    return Assertion(column, first_step, stride, value);
}

size_t Assertion::num_steps(size_t trace_length) const {
    return is_single() ? 1 : trace_length / stride_;
}

void Assertion::validate(size_t trace_width, size_t trace_length) const {
    if (column_ >= trace_width) {
        throw std::invalid_argument(
            "Assertion column " + std::to_string(column_) +
            " out of bounds for trace width " + std::to_string(trace_width));
    }
    if (first_step_ >= trace_length) {
        throw std::invalid_argument(
            "Assertion step " + std::to_string(first_step_) +
            " out of bounds for trace length " + std::to_string(trace_length));
    }
    if (!is_single() && stride_ > trace_length) {
        throw std::invalid_argument("Assertion stride exceeds trace length");
    }
}

std::string Assertion::to_string() const {
    std::ostringstream oss;
    if (is_single()) {
        oss << "trace[" << column_ << "][" << first_step_ << "] == " << value_;
    } else {
        oss << "trace[" << column_ << "][" << first_step_ << " + k*" << stride_ << "] == " << value_;
    }
    return oss.str();
}

} // namespace starkcomp
