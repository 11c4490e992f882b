#include "types/b_field_element.hpp"
#include <stdexcept>

namespace starkcomp {

namespace {

// 2^64 mod p
constexpr uint64_t EPSILON = 0xFFFFFFFFULL;

} // namespace

// Writing the product as lo + 2^64 * (hi_lo + 2^32 * hi_hi) and using
// 2^64 = EPSILON and 2^96 = -1 (mod p) gives lo - hi_hi + hi_lo * EPSILON.
uint64_t BFieldElement::reduce(uint128_t value) {
    const uint64_t lo = static_cast<uint64_t>(value);
    const uint64_t hi = static_cast<uint64_t>(value >> 64);
    const uint64_t hi_hi = hi >> 32;
    const uint64_t hi_lo = hi & EPSILON;

    const bool borrow = lo < hi_hi;
    uint64_t folded = lo - hi_hi;
    if (borrow) {
        folded -= EPSILON;
    }

    const uint64_t scaled = hi_lo * EPSILON;
    const uint64_t sum = folded + scaled;
    uint64_t result = sum < scaled ? sum + EPSILON : sum;
    if (result >= MODULUS) {
        result -= MODULUS;
    }
    return result;
}

BFieldElement& BFieldElement::operator+=(const BFieldElement& rhs) {
    // a wrap past 2^64 and a sum in [p, 2^64) both take one subtraction of p
    const uint64_t sum = value_ + rhs.value_;
    value_ = (sum < value_ || sum >= MODULUS) ? sum - MODULUS : sum;
    return *this;
}

BFieldElement& BFieldElement::operator-=(const BFieldElement& rhs) {
    value_ = value_ >= rhs.value_ ? value_ - rhs.value_ : value_ - rhs.value_ + MODULUS;
    return *this;
}

BFieldElement& BFieldElement::operator*=(const BFieldElement& rhs) {
    value_ = reduce(static_cast<uint128_t>(value_) * rhs.value_);
    return *this;
}

BFieldElement& BFieldElement::operator/=(const BFieldElement& rhs) {
    return *this *= rhs.inverse();
}

BFieldElement BFieldElement::operator+(const BFieldElement& rhs) const {
    BFieldElement result = *this;
    return result += rhs;
}

BFieldElement BFieldElement::operator-(const BFieldElement& rhs) const {
    BFieldElement result = *this;
    return result -= rhs;
}

BFieldElement BFieldElement::operator*(const BFieldElement& rhs) const {
    BFieldElement result = *this;
    return result *= rhs;
}

BFieldElement BFieldElement::operator/(const BFieldElement& rhs) const {
    BFieldElement result = *this;
    return result /= rhs;
}

BFieldElement BFieldElement::operator-() const {
    return BFieldElement() - *this;
}

// Left-to-right square and multiply
BFieldElement BFieldElement::pow(uint64_t exp) const {
    BFieldElement result = BFieldElement::one();
    for (int bit = 63; bit >= 0; --bit) {
        result *= result;
        if ((exp >> bit) & 1) {
            result *= *this;
        }
    }
    return result;
}

BFieldElement BFieldElement::inverse() const {
    if (is_zero()) {
        throw std::domain_error("Cannot invert zero");
    }
    // a^(p-2) = a^(-1) for every non-zero a
    return pow(MODULUS - 2);
}

std::vector<BFieldElement> BFieldElement::batch_inversion(const std::vector<BFieldElement>& elements) {
    // forward pass leaves the product of all earlier elements in each slot
    std::vector<BFieldElement> inverses;
    inverses.reserve(elements.size());
    BFieldElement running = BFieldElement::one();
    for (const auto& element : elements) {
        if (element.is_zero()) {
            throw std::domain_error("batch_inversion encountered zero element");
        }
        inverses.push_back(running);
        running *= element;
    }
    if (inverses.empty()) {
        return inverses;
    }

    // running^-1 peels one element off per step on the way back
    BFieldElement suffix_inverse = running.inverse();
    for (size_t i = elements.size(); i-- > 0;) {
        inverses[i] *= suffix_inverse;
        suffix_inverse *= elements[i];
    }
    return inverses;
}

BFieldElement BFieldElement::primitive_root_of_unity(uint32_t log2_order) {
    if (log2_order > TWO_ADICITY) {
        throw std::invalid_argument("log2_order must be <= 32");
    }

    // g^((p-1) / 2^k) has order exactly 2^k since g generates the whole group
    BFieldElement g(GENERATOR);
    uint64_t exp = (MODULUS - 1) >> log2_order;
    return g.pow(exp);
}

std::string BFieldElement::to_string() const {
    return std::to_string(value_);
}

std::ostream& operator<<(std::ostream& os, const BFieldElement& elem) {
    return os << elem.value_;
}

} // namespace starkcomp
