#include "constraints/composition_prover.hpp"
#include "constraints/composition_coefficients.hpp"
#include "constraints/constraint_evaluator.hpp"
#include "common/debug_control.hpp"
#include "domain/stark_domain.hpp"
#include <chrono>
#include <stdexcept>
#include <utility>

namespace starkcomp {

namespace {

double elapsed_ms(std::chrono::high_resolution_clock::time_point since) {
    auto now = std::chrono::high_resolution_clock::now();
    return std::chrono::duration<double, std::milli>(now - since).count();
}

} // namespace

template<typename E>
CompositionProver<E>::CompositionProver(ProverOptions options)
    : options_(std::move(options))
    , executor_() {
    options_.validate();
    executor_ = parallel::make_executor(options_.executor);
}

template<typename E>
CompositionPoly<E> CompositionProver<E>::build_composition_poly(const Air& air, const ExecutionTrace& trace) const {
    if (trace.width() != air.trace_width() || trace.length() != air.trace_length()) {
        throw std::invalid_argument("Execution trace shape does not match the AIR");
    }

    auto total_start = std::chrono::high_resolution_clock::now();
    const StarkDomain domain(air.trace_length(), air.context().ce_blowup_factor(), options_.domain_offset);
    STARKCOMP_DEBUG_COUT("Composition prover options:\n" << options_.to_json_string() << std::endl);

    auto start = std::chrono::high_resolution_clock::now();
    const LdeTrace lde = trace.extend(domain);
    STARKCOMP_PROFILE_PRINT("  [composition] trace extension: %.3f ms (%zu -> %zu rows)\n",
                            elapsed_ms(start), domain.trace_length(), domain.ce_domain_size());

    ChaCha12Rng rng(options_.seed);
    auto coefficients = CompositionCoefficients<E>::draw(
        rng, air.context().num_transition_constraints(), air.get_assertions().size());

    start = std::chrono::high_resolution_clock::now();
    ConstraintEvaluator<E> evaluator(air, std::move(coefficients));
    ConstraintEvaluationTable<E> table = evaluator.evaluate(lde, domain, options_, *executor_);
    STARKCOMP_PROFILE_PRINT("  [composition] constraint evaluation: %.3f ms (%zu columns)\n",
                            elapsed_ms(start), table.num_columns());

    start = std::chrono::high_resolution_clock::now();
    CompositionPoly<E> poly = std::move(table).into_composition_poly(*executor_);
    STARKCOMP_PROFILE_PRINT("  [composition] division and interpolation: %.3f ms\n", elapsed_ms(start));

    STARKCOMP_PROFILE_PRINT("  [composition] total: %.3f ms\n", elapsed_ms(total_start));
    return poly;
}

template class CompositionProver<BFieldElement>;
template class CompositionProver<XFieldElement>;

} // namespace starkcomp
