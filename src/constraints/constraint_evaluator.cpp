#include "constraints/constraint_evaluator.hpp"
#include "common/debug_control.hpp"
#include <algorithm>
#include <stdexcept>
#include <string>
#include <utility>

namespace starkcomp {

template<typename E>
ConstraintEvaluator<E>::ConstraintEvaluator(const Air& air, CompositionCoefficients<E> coefficients)
    : air_(air)
    , coefficients_(std::move(coefficients))
    , transition_divisor_(air.transition_divisor())
    , boundary_groups_(air.boundary_constraint_groups()) {
    if (coefficients_.transition.size() != air.context().num_transition_constraints()) {
        throw std::invalid_argument(
            "Expected " + std::to_string(air.context().num_transition_constraints()) +
            " transition coefficients, got " + std::to_string(coefficients_.transition.size()));
    }
    size_t num_assertions = 0;
    for (const auto& group : boundary_groups_) {
        num_assertions += group.assertions.size();
    }
    if (coefficients_.boundary.size() != num_assertions) {
        throw std::invalid_argument(
            "Expected " + std::to_string(num_assertions) +
            " boundary coefficients, got " + std::to_string(coefficients_.boundary.size()));
    }
}

template<typename E>
ConstraintEvaluationTable<E> ConstraintEvaluator<E>::evaluate(
    const LdeTrace& trace,
    const StarkDomain& domain,
    const ProverOptions& options,
    parallel::Executor& executor
) const {
    if (domain.trace_length() != air_.trace_length()) {
        throw std::invalid_argument("Domain trace length does not match the AIR");
    }
    if (trace.width() != air_.trace_width() || trace.num_rows() != domain.ce_domain_size()) {
        throw std::invalid_argument("Extended trace does not match the AIR and evaluation domain");
    }
    if (trace.blowup() != domain.ce_blowup_factor()) {
        throw std::invalid_argument("Extended trace blowup does not match the evaluation domain");
    }

    std::vector<ConstraintDivisor> divisors;
    divisors.reserve(num_columns());
    divisors.push_back(transition_divisor_);
    for (const auto& group : boundary_groups_) {
        divisors.push_back(group.divisor);
    }

    auto table = options.verification_mode
        ? ConstraintEvaluationTable<E>(domain.ce_domain_size(), domain.offset(), domain.trace_length(),
                                       std::move(divisors), air_.transition_evaluation_degrees(),
                                       options.min_fragment_size)
        : ConstraintEvaluationTable<E>(domain.ce_domain_size(), domain.offset(), domain.trace_length(),
                                       std::move(divisors), options.min_fragment_size);

    const size_t num_fragments = options.resolve_num_fragments(table.num_rows(), executor.concurrency());
    auto fragments = table.fragments(num_fragments);

    executor.parallel_for(fragments.size(), [&](size_t i) {
        evaluate_fragment(fragments[i], trace);
    });

    STARKCOMP_DEBUG_PRINT("Evaluated %zu constraint columns over %zu rows with %s executor\n",
                          table.num_columns(), table.num_rows(), executor.name());
    return table;
}

template<typename E>
void ConstraintEvaluator<E>::evaluate_fragment(EvaluationTableFragment<E>& fragment, const LdeTrace& trace) const {
    const size_t num_transition = coefficients_.transition.size();

    EvaluationFrame frame(trace.width());
    std::vector<BFieldElement> t_evaluations(num_transition, BFieldElement::zero());
    std::vector<E> row(num_columns(), E());

    for (size_t i = 0; i < fragment.num_rows(); ++i) {
        const size_t step = fragment.offset() + i;
        trace.read_row_into(step, frame.current);
        trace.read_row_into(trace.next_row(step), frame.next);

        std::fill(t_evaluations.begin(), t_evaluations.end(), BFieldElement::zero());
        air_.evaluate_transition(frame, t_evaluations);

        E transition = E();
        for (size_t k = 0; k < num_transition; ++k) {
            transition += coefficients_.transition[k] * t_evaluations[k];
        }
        row[0] = transition;

        for (size_t g = 0; g < boundary_groups_.size(); ++g) {
            const auto& group = boundary_groups_[g];
            E boundary = E();
            for (size_t a = 0; a < group.assertions.size(); ++a) {
                const Assertion& assertion = group.assertions[a];
                const BFieldElement deviation = frame.current[assertion.column()] - assertion.value();
                boundary += coefficients_.boundary[group.assertion_indices[a]] * deviation;
            }
            row[1 + g] = boundary;
        }

        fragment.update_row(i, row);
        if (fragment.has_transition_evaluations()) {
            fragment.update_transition_evaluations(i, t_evaluations);
        }
    }
}

template class ConstraintEvaluator<BFieldElement>;
template class ConstraintEvaluator<XFieldElement>;

} // namespace starkcomp
