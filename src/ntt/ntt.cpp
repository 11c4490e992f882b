#include "ntt/ntt.hpp"
#include <stdexcept>
#include <utility>

namespace starkcomp {

namespace {

void require_power_of_two(size_t n) {
    if (n == 0 || (n & (n - 1)) != 0) {
        throw std::invalid_argument("NTT size must be a power of 2");
    }
}

} // namespace

uint32_t NTT::log2_of(size_t n) {
    uint32_t log_n = 0;
    while ((size_t(1) << log_n) < n) log_n++;
    return log_n;
}

template<typename E>
void NTT::bit_reverse_permutation(std::vector<E>& data) {
    const size_t n = data.size();
    const uint32_t log_n = log2_of(n);

    for (size_t i = 0; i < n; i++) {
        size_t rev = 0;
        for (uint32_t j = 0; j < log_n; j++) {
            if (i & (size_t(1) << j)) {
                rev |= (size_t(1) << (log_n - 1 - j));
            }
        }
        if (i < rev) {
            std::swap(data[i], data[rev]);
        }
    }
}

template<typename E>
void NTT::ntt_core(std::vector<E>& data, BFieldElement omega, bool inverse) {
    const size_t n = data.size();

    bit_reverse_permutation(data);

    // Iterative Cooley-Tukey
    for (size_t len = 2; len <= n; len *= 2) {
        // omega^(n/len) is the len-th root of unity
        BFieldElement omega_len = omega.pow(n / len);

        for (size_t i = 0; i < n; i += len) {
            BFieldElement w = BFieldElement::one();
            for (size_t j = 0; j < len / 2; j++) {
                E u = data[i + j];
                E v = data[i + j + len / 2] * w;
                data[i + j] = u + v;
                data[i + j + len / 2] = u - v;
                w *= omega_len;
            }
        }
    }

    if (inverse) {
        BFieldElement n_inv = BFieldElement(n).inverse();
        for (size_t i = 0; i < n; i++) {
            data[i] = data[i] * n_inv;
        }
    }
}

template<typename E>
void NTT::forward(std::vector<E>& coeffs) {
    require_power_of_two(coeffs.size());
    BFieldElement omega = BFieldElement::primitive_root_of_unity(log2_of(coeffs.size()));
    ntt_core(coeffs, omega, false);
}

template<typename E>
void NTT::inverse(std::vector<E>& evals) {
    require_power_of_two(evals.size());
    BFieldElement omega = BFieldElement::primitive_root_of_unity(log2_of(evals.size()));
    ntt_core(evals, omega.inverse(), true);
}

template<typename E>
std::vector<E> NTT::interpolate(const std::vector<E>& values) {
    std::vector<E> coeffs = values;
    inverse(coeffs);
    return coeffs;
}

template<typename E>
void NTT::interpolate_with_offset(std::vector<E>& values, BFieldElement offset) {
    // h(x) = f(offset * x) interpolates over <w>; f's i-th coefficient is h's
    // i-th coefficient times offset^-i
    inverse(values);

    BFieldElement offset_inv = offset.inverse();
    BFieldElement scale = BFieldElement::one();
    for (auto& value : values) {
        value = value * scale;
        scale *= offset_inv;
    }
}

template<typename E>
std::vector<E> NTT::evaluate_on_coset(
    const std::vector<E>& coeffs,
    size_t domain_length,
    BFieldElement offset
) {
    if (coeffs.size() > domain_length) {
        throw std::invalid_argument("Polynomial has more coefficients than the evaluation domain");
    }

    std::vector<E> extended(domain_length, E());
    // c_i -> c_i * offset^i shifts evaluation from {w^j} to {offset * w^j}
    BFieldElement scale = BFieldElement::one();
    for (size_t i = 0; i < coeffs.size(); i++) {
        extended[i] = coeffs[i] * scale;
        scale *= offset;
    }

    forward(extended);
    return extended;
}

template void NTT::forward<BFieldElement>(std::vector<BFieldElement>&);
template void NTT::forward<XFieldElement>(std::vector<XFieldElement>&);
template void NTT::inverse<BFieldElement>(std::vector<BFieldElement>&);
template void NTT::inverse<XFieldElement>(std::vector<XFieldElement>&);
template std::vector<BFieldElement> NTT::interpolate<BFieldElement>(const std::vector<BFieldElement>&);
template std::vector<XFieldElement> NTT::interpolate<XFieldElement>(const std::vector<XFieldElement>&);
template void NTT::interpolate_with_offset<BFieldElement>(std::vector<BFieldElement>&, BFieldElement);
template void NTT::interpolate_with_offset<XFieldElement>(std::vector<XFieldElement>&, BFieldElement);
template std::vector<BFieldElement> NTT::evaluate_on_coset<BFieldElement>(
    const std::vector<BFieldElement>&, size_t, BFieldElement);
template std::vector<XFieldElement> NTT::evaluate_on_coset<XFieldElement>(
    const std::vector<XFieldElement>&, size_t, BFieldElement);

} // namespace starkcomp
