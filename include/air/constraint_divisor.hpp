#pragma once

#include "types/b_field_element.hpp"
#include "air/assertion.hpp"
#include <string>
#include <utility>
#include <vector>

namespace starkcomp {

/**
 * ConstraintDivisor - the vanishing polynomial a constraint is divided by
 *
 * Represents prod_k (x^{a_k} - b_k) / prod_i (x - e_i). The numerator is a
 * product of sparse terms (degree, constant), the denominator removes the
 * exclusion points. The composition engine only handles a single numerator
 * term with at most one exclusion point; the general shape is still
 * representable so that callers can describe it and get a precise rejection.
 */
class ConstraintDivisor {
public:
    using NumeratorTerm = std::pair<size_t, BFieldElement>;

    ConstraintDivisor(std::vector<NumeratorTerm> numerator, std::vector<BFieldElement> exclude);

    /**
     * (x^n - 1) / (x - g^(n-1)): vanishes on every trace step except the last,
     * where g generates the trace domain of length n.
     */
    static ConstraintDivisor from_transition(size_t trace_length);

    /**
     * Single assertion at step s: (x - g^s).
     * Periodic assertion with m steps starting at s: (x^m - g^(s*m)).
     */
    static ConstraintDivisor from_assertion(const Assertion& assertion, size_t trace_length);

    const std::vector<NumeratorTerm>& numerator() const { return numerator_; }
    const std::vector<BFieldElement>& exclude() const { return exclude_; }

    // Degree of numerator minus number of exclusion points
    size_t degree() const;

    BFieldElement evaluate_at(BFieldElement x) const;

    bool operator==(const ConstraintDivisor& other) const;
    bool operator!=(const ConstraintDivisor& other) const { return !(*this == other); }

    std::string to_string() const;

private:
    std::vector<NumeratorTerm> numerator_;
    std::vector<BFieldElement> exclude_;
};

} // namespace starkcomp
