#pragma once

#include "air/air.hpp"
#include "config/prover_options.hpp"
#include "constraints/composition_poly.hpp"
#include "parallel/executor.hpp"
#include "trace/execution_trace.hpp"
#include <memory>

namespace starkcomp {

/**
 * CompositionProver - one prover round from execution trace to composition polynomial
 *
 * Extends the trace onto the constraint evaluation domain, draws the
 * composition coefficients from the configured seed, evaluates all
 * constraints into a table in parallel and reduces the table.
 */
template<typename E>
class CompositionProver {
public:
    explicit CompositionProver(ProverOptions options);

    const ProverOptions& options() const { return options_; }
    parallel::Executor& executor() const { return *executor_; }

    CompositionPoly<E> build_composition_poly(const Air& air, const ExecutionTrace& trace) const;

private:
    ProverOptions options_;
    std::unique_ptr<parallel::Executor> executor_;
};

extern template class CompositionProver<BFieldElement>;
extern template class CompositionProver<XFieldElement>;

} // namespace starkcomp
