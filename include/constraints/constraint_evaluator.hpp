#pragma once

#include "air/air.hpp"
#include "constraints/composition_coefficients.hpp"
#include "constraints/evaluation_table.hpp"
#include "config/prover_options.hpp"
#include "domain/stark_domain.hpp"
#include "parallel/executor.hpp"
#include "trace/execution_trace.hpp"
#include <vector>

namespace starkcomp {

/**
 * ConstraintEvaluator - evaluates an AIR's constraints over the extended trace
 *
 * Produces a table whose column 0 is the weighted sum of all transition
 * constraints (divided later by the transition divisor) and whose column
 * 1 + k is the weighted sum of trace[col] - value over the assertions of
 * boundary group k.
 */
template<typename E>
class ConstraintEvaluator {
public:
    ConstraintEvaluator(const Air& air, CompositionCoefficients<E> coefficients);

    size_t num_columns() const { return 1 + boundary_groups_.size(); }
    const std::vector<BoundaryConstraintGroup>& boundary_groups() const { return boundary_groups_; }

    /**
     * Builds the table over the domain, splits it into fragments and fills
     * them through the executor. In verification mode the table also
     * receives every raw transition constraint value.
     */
    ConstraintEvaluationTable<E> evaluate(
        const LdeTrace& trace,
        const StarkDomain& domain,
        const ProverOptions& options,
        parallel::Executor& executor) const;

private:
    void evaluate_fragment(EvaluationTableFragment<E>& fragment, const LdeTrace& trace) const;

    const Air& air_;
    CompositionCoefficients<E> coefficients_;
    ConstraintDivisor transition_divisor_;
    std::vector<BoundaryConstraintGroup> boundary_groups_;
};

extern template class ConstraintEvaluator<BFieldElement>;
extern template class ConstraintEvaluator<XFieldElement>;

} // namespace starkcomp
