#pragma once

#include "types/b_field_element.hpp"
#include <array>
#include <string>

namespace starkcomp {

/**
 * XFieldElement - Extension Field Element
 *
 * Element of the degree-3 extension of the Goldilocks field, represented as
 * a + b*X + c*X^2 with X^3 = X - 1. Composition coefficients are drawn from
 * this field so that the evaluation table can carry extension values while
 * the trace and divisors stay in the base field.
 */
class XFieldElement {
public:
    static constexpr size_t EXTENSION_DEGREE = 3;

    constexpr XFieldElement() : coeffs_{BFieldElement::zero(), BFieldElement::zero(), BFieldElement::zero()} {}

    constexpr XFieldElement(BFieldElement c0, BFieldElement c1, BFieldElement c2)
        : coeffs_{c0, c1, c2} {}

    // Embed a base field element as a constant polynomial
    constexpr explicit XFieldElement(BFieldElement base)
        : coeffs_{base, BFieldElement::zero(), BFieldElement::zero()} {}

    static constexpr XFieldElement zero() { return XFieldElement(); }
    static constexpr XFieldElement one() { return XFieldElement(BFieldElement::one()); }

    constexpr const std::array<BFieldElement, 3>& coefficients() const { return coeffs_; }
    constexpr BFieldElement coeff(size_t i) const { return coeffs_[i]; }

    XFieldElement operator+(const XFieldElement& rhs) const;
    XFieldElement operator-(const XFieldElement& rhs) const;
    XFieldElement operator*(const XFieldElement& rhs) const;
    XFieldElement operator/(const XFieldElement& rhs) const;
    XFieldElement operator-() const;

    XFieldElement& operator+=(const XFieldElement& rhs);
    XFieldElement& operator-=(const XFieldElement& rhs);
    XFieldElement& operator*=(const XFieldElement& rhs);
    XFieldElement& operator/=(const XFieldElement& rhs);

    // Mixed arithmetic with BFieldElement
    XFieldElement operator+(const BFieldElement& rhs) const;
    XFieldElement operator-(const BFieldElement& rhs) const;
    XFieldElement operator*(const BFieldElement& rhs) const;

    bool operator==(const XFieldElement& rhs) const { return coeffs_ == rhs.coeffs_; }
    bool operator!=(const XFieldElement& rhs) const { return !(*this == rhs); }

    XFieldElement inverse() const;
    XFieldElement pow(uint64_t exp) const;
    bool is_zero() const;

    std::string to_string() const;

    friend std::ostream& operator<<(std::ostream& os, const XFieldElement& elem);
    friend XFieldElement operator*(const BFieldElement& lhs, const XFieldElement& rhs);

private:
    std::array<BFieldElement, 3> coeffs_;
};

using XFE = XFieldElement;

} // namespace starkcomp
