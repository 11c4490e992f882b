#pragma once

#include "types/b_field_element.hpp"
#include "types/x_field_element.hpp"
#include <vector>

namespace starkcomp {

/**
 * Number Theoretic Transform over the Goldilocks field
 *
 * Twiddles always live in the base field; the transformed values may be base
 * or extension field elements (instantiated for BFieldElement and
 * XFieldElement).
 *
 * Used for:
 * - Interpolation: evaluations -> polynomial coefficients (inverse NTT)
 * - Evaluation: polynomial coefficients -> evaluations (forward NTT)
 */
class NTT {
public:
    /**
     * Forward NTT: coefficients [c0..c_{n-1}] -> [f(w^0), ..., f(w^{n-1})]
     * where w is the primitive n-th root of unity. In-place; n must be a
     * power of two.
     */
    template<typename E>
    static void forward(std::vector<E>& coeffs);

    /**
     * Inverse NTT: evaluations over <w> -> coefficients. In-place.
     */
    template<typename E>
    static void inverse(std::vector<E>& evals);

    template<typename E>
    static std::vector<E> interpolate(const std::vector<E>& values);

    /**
     * Coset interpolation: given f(offset * w^i) for all i, replaces the
     * values with the coefficients of f.
     */
    template<typename E>
    static void interpolate_with_offset(std::vector<E>& values, BFieldElement offset);

    /**
     * Evaluate polynomial on the coset offset * <w> of the given length.
     * The coefficient vector is zero-padded to domain_length.
     */
    template<typename E>
    static std::vector<E> evaluate_on_coset(
        const std::vector<E>& coeffs,
        size_t domain_length,
        BFieldElement offset);

    static uint32_t log2_of(size_t n);

private:
    template<typename E>
    static void bit_reverse_permutation(std::vector<E>& data);

    template<typename E>
    static void ntt_core(std::vector<E>& data, BFieldElement omega, bool inverse);
};

} // namespace starkcomp
