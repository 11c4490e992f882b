#include "domain/stark_domain.hpp"
#include "ntt/ntt.hpp"
#include <stdexcept>
#include <string>

namespace starkcomp {

bool is_power_of_two(size_t n) {
    return n != 0 && (n & (n - 1)) == 0;
}

size_t next_power_of_two(size_t n) {
    size_t result = 1;
    while (result < n) {
        result <<= 1;
    }
    return result;
}

ArithmeticDomain ArithmeticDomain::of_length(size_t length) {
    if (!is_power_of_two(length)) {
        throw std::invalid_argument("Domain length must be a power of 2");
    }

    ArithmeticDomain domain;
    domain.length = length;
    domain.offset = BFieldElement::one();
    domain.generator = BFieldElement::primitive_root_of_unity(NTT::log2_of(length));
    return domain;
}

ArithmeticDomain ArithmeticDomain::with_offset(BFieldElement offset) const {
    ArithmeticDomain result = *this;
    result.offset = offset;
    return result;
}

BFieldElement ArithmeticDomain::element(size_t index) const {
    return offset * generator.pow(index);
}

std::vector<BFieldElement> ArithmeticDomain::values() const {
    std::vector<BFieldElement> domain_values;
    domain_values.reserve(length);
    BFieldElement current = offset;
    for (size_t i = 0; i < length; ++i) {
        domain_values.push_back(current);
        current *= generator;
    }
    return domain_values;
}

StarkDomain::StarkDomain(size_t trace_length, size_t ce_blowup_factor, BFieldElement offset)
    : trace_domain_(ArithmeticDomain::of_length(trace_length))
    , ce_domain_()
    , ce_blowup_factor_(ce_blowup_factor) {
    if (!is_power_of_two(ce_blowup_factor)) {
        throw std::invalid_argument(
            "Constraint evaluation blowup factor must be a power of 2, got " +
            std::to_string(ce_blowup_factor));
    }
    if (offset.is_zero()) {
        throw std::invalid_argument("Domain offset must be non-zero");
    }
    ce_domain_ = ArithmeticDomain::of_length(trace_length * ce_blowup_factor).with_offset(offset);
}

} // namespace starkcomp
