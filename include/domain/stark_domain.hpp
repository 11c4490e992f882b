#pragma once

#include "types/b_field_element.hpp"
#include <vector>

namespace starkcomp {

/**
 * ArithmeticDomain - coset offset * <generator> of power-of-two length
 */
struct ArithmeticDomain {
    size_t length;
    BFieldElement offset;
    BFieldElement generator;

    static ArithmeticDomain of_length(size_t length);
    ArithmeticDomain with_offset(BFieldElement offset) const;
    BFieldElement element(size_t index) const;
    std::vector<BFieldElement> values() const;
};

/**
 * StarkDomain - the trace domain and the constraint evaluation domain of one proof
 *
 * The constraint evaluation domain is the trace domain blown up by
 * ce_blowup_factor and shifted off the subgroup by offset, so that no
 * divisor of the form x^n - 1 vanishes on it.
 */
class StarkDomain {
public:
    StarkDomain(size_t trace_length, size_t ce_blowup_factor, BFieldElement offset);

    size_t trace_length() const { return trace_domain_.length; }
    size_t ce_blowup_factor() const { return ce_blowup_factor_; }
    size_t ce_domain_size() const { return ce_domain_.length; }
    BFieldElement offset() const { return ce_domain_.offset; }

    BFieldElement trace_generator() const { return trace_domain_.generator; }
    BFieldElement ce_generator() const { return ce_domain_.generator; }

    const ArithmeticDomain& trace_domain() const { return trace_domain_; }
    const ArithmeticDomain& ce_domain() const { return ce_domain_; }

private:
    ArithmeticDomain trace_domain_;
    ArithmeticDomain ce_domain_;
    size_t ce_blowup_factor_;
};

bool is_power_of_two(size_t n);
size_t next_power_of_two(size_t n);

} // namespace starkcomp
