#pragma once

#include "types/b_field_element.hpp"
#include "types/x_field_element.hpp"
#include "air/constraint_divisor.hpp"
#include "parallel/executor.hpp"
#include <vector>

namespace starkcomp {

// Smallest chunk of domain points handed to one task by the accumulation kernels
constexpr size_t MIN_ACCUMULATION_BATCH_SIZE = 128;

/**
 * Throws std::invalid_argument unless the divisor has exactly one numerator
 * term x^a - b with a dividing domain_size, and at most one exclusion point.
 */
void validate_divisor_shape(const ConstraintDivisor& divisor, size_t domain_size);

/**
 * Computes 1 / (x^a - b) for the divisor's numerator over the coset
 * domain_offset * <g>, |<g>| = domain_size.
 *
 * x^a repeats with period domain_size / a as x walks the domain, so only
 * that many values are produced; the value for domain point j is at index
 * j mod (domain_size / a).
 */
std::vector<BFieldElement> get_inv_evaluation(
    const ConstraintDivisor& divisor,
    size_t domain_size,
    BFieldElement domain_offset,
    parallel::Executor& executor);

/**
 * Divides column (evaluations over the coset domain) by the divisor and adds
 * the quotient's evaluations into result.
 *
 * Boundary divisor (x^a - b):           result[j] += column[j] * z[j]
 * Transition divisor (x^a - b)/(x - e): result[j] += column[j] * (x_j - e) * z[j]
 *
 * The divisor shape is checked before result is touched.
 */
template<typename E>
void accumulate_column(
    const std::vector<E>& column,
    const ConstraintDivisor& divisor,
    BFieldElement domain_offset,
    std::vector<E>& result,
    parallel::Executor& executor);

extern template void accumulate_column<BFieldElement>(
    const std::vector<BFieldElement>&, const ConstraintDivisor&, BFieldElement,
    std::vector<BFieldElement>&, parallel::Executor&);
extern template void accumulate_column<XFieldElement>(
    const std::vector<XFieldElement>&, const ConstraintDivisor&, BFieldElement,
    std::vector<XFieldElement>&, parallel::Executor&);

} // namespace starkcomp
