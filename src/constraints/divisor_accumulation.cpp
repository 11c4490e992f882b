#include "constraints/divisor_accumulation.hpp"
#include "domain/stark_domain.hpp"
#include "ntt/ntt.hpp"
#include <stdexcept>
#include <string>

namespace starkcomp {

void validate_divisor_shape(const ConstraintDivisor& divisor, size_t domain_size) {
    if (divisor.numerator().size() != 1) {
        throw std::invalid_argument("complex divisors are not yet supported");
    }
    if (divisor.exclude().size() > 1) {
        throw std::invalid_argument("multiple exclusion points are not yet supported");
    }
    if (!is_power_of_two(domain_size)) {
        throw std::invalid_argument("Evaluation domain size must be a power of 2");
    }
    const size_t a = divisor.numerator()[0].first;
    if (a == 0 || domain_size % a != 0) {
        throw std::invalid_argument(
            "Divisor numerator degree " + std::to_string(a) +
            " must divide the evaluation domain size " + std::to_string(domain_size));
    }
}

std::vector<BFieldElement> get_inv_evaluation(
    const ConstraintDivisor& divisor,
    size_t domain_size,
    BFieldElement domain_offset,
    parallel::Executor& executor
) {
    validate_divisor_shape(divisor, domain_size);

    const uint64_t a = divisor.numerator()[0].first;
    const BFieldElement b = divisor.numerator()[0].second;

    const size_t n = domain_size / a;
    const BFieldElement g = BFieldElement::primitive_root_of_unity(NTT::log2_of(domain_size)).pow(a);
    const BFieldElement offset_a = domain_offset.pow(a);

    // x^a - b for every x, each batch starting from its own power of g
    std::vector<BFieldElement> evaluations(n);
    parallel::for_each_batch(executor, n, MIN_ACCUMULATION_BATCH_SIZE, [&](size_t begin, size_t end) {
        BFieldElement x = offset_a * g.pow(begin);
        for (size_t i = begin; i < end; ++i) {
            evaluations[i] = x - b;
            x *= g;
        }
    });

    return BFieldElement::batch_inversion(evaluations);
}

template<typename E>
void accumulate_column(
    const std::vector<E>& column,
    const ConstraintDivisor& divisor,
    BFieldElement domain_offset,
    std::vector<E>& result,
    parallel::Executor& executor
) {
    const size_t domain_size = column.size();
    validate_divisor_shape(divisor, domain_size);
    if (result.size() != domain_size) {
        throw std::invalid_argument("Accumulator and column must have the same length");
    }

    const std::vector<BFieldElement> z = get_inv_evaluation(divisor, domain_size, domain_offset, executor);
    const size_t period = z.size();

    if (divisor.exclude().empty()) {
        // boundary constraints: value / (x^a - b) = value * z
        parallel::for_each_batch(executor, domain_size, MIN_ACCUMULATION_BATCH_SIZE, [&](size_t begin, size_t end) {
            for (size_t j = begin; j < end; ++j) {
                result[j] += column[j] * z[j % period];
            }
        });
        return;
    }

    // transition constraints: value / ((x^a - b) / (x - e)) = value * (x - e) * z
    const BFieldElement g = BFieldElement::primitive_root_of_unity(NTT::log2_of(domain_size));
    const BFieldElement e = divisor.exclude()[0];

    parallel::for_each_batch(executor, domain_size, MIN_ACCUMULATION_BATCH_SIZE, [&](size_t begin, size_t end) {
        BFieldElement x = domain_offset * g.pow(begin);
        for (size_t j = begin; j < end; ++j) {
            const BFieldElement factor = (x - e) * z[j % period];
            x *= g;
            result[j] += column[j] * factor;
        }
    });
}

template void accumulate_column<BFieldElement>(
    const std::vector<BFieldElement>&, const ConstraintDivisor&, BFieldElement,
    std::vector<BFieldElement>&, parallel::Executor&);
template void accumulate_column<XFieldElement>(
    const std::vector<XFieldElement>&, const ConstraintDivisor&, BFieldElement,
    std::vector<XFieldElement>&, parallel::Executor&);

} // namespace starkcomp
