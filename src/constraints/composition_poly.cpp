#include "constraints/composition_poly.hpp"
#include "domain/stark_domain.hpp"
#include "polynomial/polynomial.hpp"
#include <algorithm>
#include <stdexcept>
#include <utility>

namespace starkcomp {

template<typename E>
CompositionPoly<E>::CompositionPoly(std::vector<E> coefficients, size_t trace_length)
    : coefficients_(std::move(coefficients))
    , trace_length_(trace_length) {
    if (!is_power_of_two(trace_length)) {
        throw std::invalid_argument("Trace length must be a power of 2");
    }
    if (!is_power_of_two(coefficients_.size()) || coefficients_.size() < trace_length) {
        throw std::invalid_argument(
            "Composition polynomial size must be a power of 2 no smaller than the trace length");
    }
}

template<typename E>
size_t CompositionPoly<E>::degree() const {
    return degree_of(coefficients_);
}

template<typename E>
std::vector<std::vector<E>> CompositionPoly<E>::columns() const {
    const size_t m = num_columns();
    std::vector<std::vector<E>> result(m, std::vector<E>(trace_length_));
    for (size_t i = 0; i < coefficients_.size(); ++i) {
        result[i % m][i / m] = coefficients_[i];
    }
    return result;
}

template<typename E>
size_t CompositionPoly<E>::column_degree() const {
    size_t result = 0;
    for (const auto& column : columns()) {
        result = std::max(result, degree_of(column));
    }
    return result;
}

template<typename E>
E CompositionPoly<E>::evaluate_at(const E& z) const {
    return Polynomial<E>(coefficients_).evaluate(z);
}

template<typename E>
std::vector<E> CompositionPoly<E>::evaluate_columns_at(const E& z) const {
    const E z_m = z.pow(num_columns());
    std::vector<E> result;
    result.reserve(num_columns());
    for (auto& column : columns()) {
        result.push_back(Polynomial<E>(std::move(column)).evaluate(z_m));
    }
    return result;
}

template class CompositionPoly<BFieldElement>;
template class CompositionPoly<XFieldElement>;

} // namespace starkcomp
