#pragma once

#include "types/b_field_element.hpp"
#include "types/x_field_element.hpp"
#include "chacha12_rng.hpp"
#include <vector>

namespace starkcomp {

// Uniform field element from the RNG (negligible bias from reducing a u64)
template<typename E>
E draw_element(ChaCha12Rng& rng);

template<>
inline BFieldElement draw_element<BFieldElement>(ChaCha12Rng& rng) {
    return BFieldElement(rng.next_u64());
}

template<>
inline XFieldElement draw_element<XFieldElement>(ChaCha12Rng& rng) {
    BFieldElement c0(rng.next_u64());
    BFieldElement c1(rng.next_u64());
    BFieldElement c2(rng.next_u64());
    return XFieldElement(c0, c1, c2);
}

/**
 * Random weights of the linear combination that merges constraints into
 * table columns: one per transition constraint and one per assertion (in
 * Air::get_assertions() order).
 */
template<typename E>
struct CompositionCoefficients {
    std::vector<E> transition;
    std::vector<E> boundary;

    static CompositionCoefficients draw(ChaCha12Rng& rng, size_t num_transition, size_t num_assertions) {
        CompositionCoefficients result;
        result.transition.reserve(num_transition);
        for (size_t i = 0; i < num_transition; ++i) {
            result.transition.push_back(draw_element<E>(rng));
        }
        result.boundary.reserve(num_assertions);
        for (size_t i = 0; i < num_assertions; ++i) {
            result.boundary.push_back(draw_element<E>(rng));
        }
        return result;
    }
};

} // namespace starkcomp
