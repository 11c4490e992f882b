#pragma once

#include "types/b_field_element.hpp"
#include "types/x_field_element.hpp"
#include <vector>

namespace starkcomp {

/**
 * CompositionPoly - all divided constraints combined into one polynomial
 *
 * Stored in coefficient form. For the commitment stage the polynomial H of
 * degree < m * trace_length is viewed as m column polynomials H_i of degree
 * < trace_length with H(x) = sum_i x^i * H_i(x^m).
 */
template<typename E>
class CompositionPoly {
public:
    CompositionPoly(std::vector<E> coefficients, size_t trace_length);

    const std::vector<E>& coefficients() const { return coefficients_; }
    size_t trace_length() const { return trace_length_; }

    size_t degree() const;

    size_t num_columns() const { return coefficients_.size() / trace_length_; }

    // Column i holds coefficients i, i + m, i + 2m, ...
    std::vector<std::vector<E>> columns() const;

    // Highest degree over all column polynomials
    size_t column_degree() const;

    E evaluate_at(const E& z) const;

    // H_i(z^m) for every column i
    std::vector<E> evaluate_columns_at(const E& z) const;

private:
    std::vector<E> coefficients_;
    size_t trace_length_;
};

extern template class CompositionPoly<BFieldElement>;
extern template class CompositionPoly<XFieldElement>;

} // namespace starkcomp
