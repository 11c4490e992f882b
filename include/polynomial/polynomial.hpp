#pragma once

#include "types/b_field_element.hpp"
#include "types/x_field_element.hpp"
#include <utility>
#include <vector>

namespace starkcomp {

/**
 * Returns the degree of the polynomial with the given coefficients, i.e. the
 * index of the highest non-zero coefficient. The zero polynomial has degree 0.
 */
template<typename Field>
size_t degree_of(const std::vector<Field>& coeffs) {
    for (size_t i = coeffs.size(); i-- > 0;) {
        if (!(coeffs[i] == Field())) {
            return i;
        }
    }
    return 0;
}

/**
 * Polynomial in coefficient form:
 *   p(x) = c0 + c1*x + c2*x^2 + ... + c_{n-1}*x^{n-1}
 */
template<typename Field>
class Polynomial {
public:
    Polynomial() = default;
    explicit Polynomial(const std::vector<Field>& coefficients) : coeffs_(coefficients) {}
    explicit Polynomial(std::vector<Field>&& coefficients) : coeffs_(std::move(coefficients)) {}

    const std::vector<Field>& coefficients() const { return coeffs_; }

    size_t degree() const { return degree_of(coeffs_); }
    size_t size() const { return coeffs_.size(); }

    const Field& operator[](size_t i) const { return coeffs_[i]; }

    // Horner evaluation; Point may be Field or the base field
    template<typename Point>
    Field evaluate(const Point& x) const {
        Field result = Field();
        for (size_t i = coeffs_.size(); i-- > 0;) {
            result = result * x + coeffs_[i];
        }
        return result;
    }

private:
    std::vector<Field> coeffs_;
};

using BPolynomial = Polynomial<BFieldElement>;
using XPolynomial = Polynomial<XFieldElement>;

} // namespace starkcomp
