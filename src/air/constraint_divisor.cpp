#include "air/constraint_divisor.hpp"
#include "domain/stark_domain.hpp"
#include "ntt/ntt.hpp"
#include <sstream>
#include <stdexcept>

namespace starkcomp {

ConstraintDivisor::ConstraintDivisor(std::vector<NumeratorTerm> numerator, std::vector<BFieldElement> exclude)
    : numerator_(std::move(numerator))
    , exclude_(std::move(exclude)) {
    if (numerator_.empty()) {
        throw std::invalid_argument("Divisor numerator must have at least one term");
    }
    size_t numerator_degree = 0;
    for (const auto& term : numerator_) {
        if (term.first == 0) {
            throw std::invalid_argument("Divisor numerator terms must have degree >= 1");
        }
        numerator_degree += term.first;
    }
    if (exclude_.size() > numerator_degree) {
        throw std::invalid_argument("Divisor excludes more points than its numerator has roots");
    }
}

ConstraintDivisor ConstraintDivisor::from_transition(size_t trace_length) {
    if (!is_power_of_two(trace_length)) {
        throw std::invalid_argument("Trace length must be a power of 2");
    }
    BFieldElement g = BFieldElement::primitive_root_of_unity(NTT::log2_of(trace_length));
    BFieldElement last_step = g.pow(trace_length - 1);
    return ConstraintDivisor({{trace_length, BFieldElement::one()}}, {last_step});
}

ConstraintDivisor ConstraintDivisor::from_assertion(const Assertion& assertion, size_t trace_length) {
    if (!is_power_of_two(trace_length)) {
        throw std::invalid_argument("Trace length must be a power of 2");
    }
    BFieldElement g = BFieldElement::primitive_root_of_unity(NTT::log2_of(trace_length));
    const size_t num_steps = assertion.num_steps(trace_length);
    // the bound steps g^(s + k*stride) are exactly the roots of x^m - g^(s*m)
    BFieldElement constant = g.pow(static_cast<uint64_t>(assertion.first_step()) * num_steps);
    return ConstraintDivisor({{num_steps, constant}}, {});
}

size_t ConstraintDivisor::degree() const {
    size_t result = 0;
    for (const auto& term : numerator_) {
        result += term.first;
    }
    return result - exclude_.size();
}

BFieldElement ConstraintDivisor::evaluate_at(BFieldElement x) const {
    BFieldElement numerator = BFieldElement::one();
    for (const auto& term : numerator_) {
        numerator *= x.pow(term.first) - term.second;
    }

    BFieldElement denominator = BFieldElement::one();
    for (const auto& e : exclude_) {
        denominator *= x - e;
    }

    return numerator / denominator;
}

bool ConstraintDivisor::operator==(const ConstraintDivisor& other) const {
    return numerator_ == other.numerator_ && exclude_ == other.exclude_;
}

std::string ConstraintDivisor::to_string() const {
    std::ostringstream oss;
    for (const auto& term : numerator_) {
        if (term.first == 1) {
            oss << "(x - " << term.second << ")";
        } else {
            oss << "(x^" << term.first << " - " << term.second << ")";
        }
    }
    if (!exclude_.empty()) {
        oss << " / ";
        for (const auto& e : exclude_) {
            oss << "(x - " << e << ")";
        }
    }
    return oss.str();
}

} // namespace starkcomp
