#pragma once

#include "types/b_field_element.hpp"
#include "air/assertion.hpp"
#include "air/constraint_divisor.hpp"
#include <utility>
#include <vector>

namespace starkcomp {

/**
 * TransitionConstraintDegree - algebraic degree of a transition constraint
 * in the trace registers.
 *
 * A constraint of degree d over trace polynomials of degree n - 1 evaluates
 * to a polynomial of degree d * (n - 1) over the evaluation domain.
 */
class TransitionConstraintDegree {
public:
    explicit TransitionConstraintDegree(size_t base);

    size_t base() const { return base_; }
    size_t evaluation_degree(size_t trace_length) const;

private:
    size_t base_;
};

/**
 * AirContext - shape of a computation's arithmetization
 */
class AirContext {
public:
    AirContext(size_t trace_width, size_t trace_length, std::vector<TransitionConstraintDegree> degrees);

    size_t trace_width() const { return trace_width_; }
    size_t trace_length() const { return trace_length_; }
    size_t num_transition_constraints() const { return degrees_.size(); }
    const std::vector<TransitionConstraintDegree>& transition_constraint_degrees() const { return degrees_; }

    // Smallest power-of-two blowup, at least 2, that holds every constraint
    size_t ce_blowup_factor() const;
    size_t ce_domain_size() const { return trace_length_ * ce_blowup_factor(); }

private:
    size_t trace_width_;
    size_t trace_length_;
    std::vector<TransitionConstraintDegree> degrees_;
};

/**
 * EvaluationFrame - two consecutive trace rows seen by a transition constraint
 */
struct EvaluationFrame {
    std::vector<BFieldElement> current;
    std::vector<BFieldElement> next;

    explicit EvaluationFrame(size_t width)
        : current(width, BFieldElement::zero()), next(width, BFieldElement::zero()) {}
};

/**
 * BoundaryConstraintGroup - assertions sharing one divisor
 *
 * All assertions in a group are combined into a single evaluation table column.
 */
struct BoundaryConstraintGroup {
    ConstraintDivisor divisor;
    std::vector<Assertion> assertions;
    // Index of each assertion in Air::get_assertions() order
    std::vector<size_t> assertion_indices;
};

/**
 * Air - algebraic intermediate representation of a computation
 */
class Air {
public:
    explicit Air(AirContext context) : context_(std::move(context)) {}
    virtual ~Air() = default;

    const AirContext& context() const { return context_; }
    size_t trace_length() const { return context_.trace_length(); }
    size_t trace_width() const { return context_.trace_width(); }

    /**
     * Evaluates every transition constraint on the frame; result has one
     * entry per constraint and is zero everywhere a valid trace steps.
     */
    virtual void evaluate_transition(const EvaluationFrame& frame, std::vector<BFieldElement>& result) const = 0;

    virtual std::vector<Assertion> get_assertions() const = 0;

    ConstraintDivisor transition_divisor() const;

    // Assertions grouped by divisor, groups in order of first appearance
    std::vector<BoundaryConstraintGroup> boundary_constraint_groups() const;

    // One entry per transition constraint: expected degree over the evaluation domain
    std::vector<size_t> transition_evaluation_degrees() const;

private:
    AirContext context_;
};

} // namespace starkcomp
