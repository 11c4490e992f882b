#include "air/air.hpp"
#include "domain/stark_domain.hpp"
#include <algorithm>
#include <stdexcept>

namespace starkcomp {

TransitionConstraintDegree::TransitionConstraintDegree(size_t base) : base_(base) {
    if (base == 0) {
        throw std::invalid_argument("Transition constraint degree must be at least 1");
    }
}

size_t TransitionConstraintDegree::evaluation_degree(size_t trace_length) const {
    return base_ * (trace_length - 1);
}

AirContext::AirContext(size_t trace_width, size_t trace_length, std::vector<TransitionConstraintDegree> degrees)
    : trace_width_(trace_width)
    , trace_length_(trace_length)
    , degrees_(std::move(degrees)) {
    if (trace_width == 0) {
        throw std::invalid_argument("Trace width must be at least 1");
    }
    if (!is_power_of_two(trace_length) || trace_length < 8) {
        throw std::invalid_argument("Trace length must be a power of 2 and at least 8");
    }
    if (degrees_.empty()) {
        throw std::invalid_argument("At least one transition constraint must be declared");
    }
}

size_t AirContext::ce_blowup_factor() const {
    size_t max_base = 0;
    for (const auto& degree : degrees_) {
        max_base = std::max(max_base, degree.base());
    }
    return std::max<size_t>(2, next_power_of_two(max_base));
}

ConstraintDivisor Air::transition_divisor() const {
    return ConstraintDivisor::from_transition(trace_length());
}

std::vector<BoundaryConstraintGroup> Air::boundary_constraint_groups() const {
    std::vector<BoundaryConstraintGroup> groups;
    const auto assertions = get_assertions();

    for (size_t i = 0; i < assertions.size(); ++i) {
        const Assertion& assertion = assertions[i];
        assertion.validate(trace_width(), trace_length());
        ConstraintDivisor divisor = ConstraintDivisor::from_assertion(assertion, trace_length());

        auto it = std::find_if(groups.begin(), groups.end(),
            [&](const BoundaryConstraintGroup& group) { return group.divisor == divisor; });
        if (it == groups.end()) {
            groups.push_back(BoundaryConstraintGroup{divisor, {assertion}, {i}});
        } else {
            it->assertions.push_back(assertion);
            it->assertion_indices.push_back(i);
        }
    }

    return groups;
}

std::vector<size_t> Air::transition_evaluation_degrees() const {
    std::vector<size_t> degrees;
    degrees.reserve(context_.num_transition_constraints());
    for (const auto& degree : context_.transition_constraint_degrees()) {
        degrees.push_back(degree.evaluation_degree(trace_length()));
    }
    return degrees;
}

} // namespace starkcomp
