#include "types/x_field_element.hpp"
#include <sstream>
#include <stdexcept>

namespace starkcomp {

XFieldElement XFieldElement::operator+(const XFieldElement& rhs) const {
    return XFieldElement(
        coeffs_[0] + rhs.coeffs_[0],
        coeffs_[1] + rhs.coeffs_[1],
        coeffs_[2] + rhs.coeffs_[2]);
}

XFieldElement XFieldElement::operator-(const XFieldElement& rhs) const {
    return XFieldElement(
        coeffs_[0] - rhs.coeffs_[0],
        coeffs_[1] - rhs.coeffs_[1],
        coeffs_[2] - rhs.coeffs_[2]);
}

XFieldElement XFieldElement::operator*(const XFieldElement& rhs) const {
    const auto& a = coeffs_;
    const auto& b = rhs.coeffs_;

    BFieldElement c0 = a[0] * b[0];
    BFieldElement c1 = a[0] * b[1] + a[1] * b[0];
    BFieldElement c2 = a[0] * b[2] + a[1] * b[1] + a[2] * b[0];
    BFieldElement c3 = a[1] * b[2] + a[2] * b[1];
    BFieldElement c4 = a[2] * b[2];

    // X^3 = X - 1 and X^4 = X^2 - X
    return XFieldElement(
        c0 - c3,
        c1 + c3 - c4,
        c2 + c4);
}

XFieldElement XFieldElement::operator-() const {
    return XFieldElement(-coeffs_[0], -coeffs_[1], -coeffs_[2]);
}

XFieldElement& XFieldElement::operator+=(const XFieldElement& rhs) {
    *this = *this + rhs;
    return *this;
}

XFieldElement& XFieldElement::operator-=(const XFieldElement& rhs) {
    *this = *this - rhs;
    return *this;
}

XFieldElement& XFieldElement::operator*=(const XFieldElement& rhs) {
    *this = *this * rhs;
    return *this;
}

XFieldElement& XFieldElement::operator/=(const XFieldElement& rhs) {
    *this = *this / rhs;
    return *this;
}

XFieldElement XFieldElement::operator+(const BFieldElement& rhs) const {
    return XFieldElement(coeffs_[0] + rhs, coeffs_[1], coeffs_[2]);
}

XFieldElement XFieldElement::operator-(const BFieldElement& rhs) const {
    return XFieldElement(coeffs_[0] - rhs, coeffs_[1], coeffs_[2]);
}

XFieldElement XFieldElement::operator*(const BFieldElement& rhs) const {
    return XFieldElement(coeffs_[0] * rhs, coeffs_[1] * rhs, coeffs_[2] * rhs);
}

XFieldElement operator*(const BFieldElement& lhs, const XFieldElement& rhs) {
    return rhs * lhs;
}

bool XFieldElement::is_zero() const {
    return coeffs_[0].is_zero() && coeffs_[1].is_zero() && coeffs_[2].is_zero();
}

XFieldElement XFieldElement::inverse() const {
    if (is_zero()) {
        throw std::domain_error("Cannot invert zero");
    }

    // Multiplication by (a + bX + cX^2) is the matrix
    //   [ a   -c    -b  ]
    //   [ b   a+c   b-c ]
    //   [ c   b     a+c ]
    // and the inverse is the first column of its adjugate over its determinant.
    const BFieldElement& a = coeffs_[0];
    const BFieldElement& b = coeffs_[1];
    const BFieldElement& c = coeffs_[2];

    const BFieldElement a_plus_c = a + c;
    const BFieldElement adj0 = a_plus_c * a_plus_c - b * (b - c);
    const BFieldElement adj1 = -(a * b + c * c);
    const BFieldElement adj2 = b * b - a_plus_c * c;

    const BFieldElement det = a * adj0 - c * adj1 - b * adj2;
    const BFieldElement det_inv = det.inverse();

    return XFieldElement(adj0 * det_inv, adj1 * det_inv, adj2 * det_inv);
}

XFieldElement XFieldElement::operator/(const XFieldElement& rhs) const {
    return *this * rhs.inverse();
}

XFieldElement XFieldElement::pow(uint64_t exp) const {
    XFieldElement result = XFieldElement::one();
    XFieldElement base = *this;

    while (exp > 0) {
        if (exp & 1) {
            result *= base;
        }
        base *= base;
        exp >>= 1;
    }

    return result;
}

std::string XFieldElement::to_string() const {
    std::ostringstream oss;
    oss << "(" << coeffs_[0].value()
        << ", " << coeffs_[1].value()
        << ", " << coeffs_[2].value() << ")";
    return oss.str();
}

std::ostream& operator<<(std::ostream& os, const XFieldElement& elem) {
    return os << elem.to_string();
}

} // namespace starkcomp
