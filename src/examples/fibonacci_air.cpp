#include "examples/fibonacci_air.hpp"
#include "domain/stark_domain.hpp"
#include <stdexcept>
#include <string>

namespace starkcomp {

namespace {

constexpr size_t TRACE_WIDTH = 2;

AirContext fibonacci_context(size_t trace_length) {
    return AirContext(TRACE_WIDTH, trace_length,
                      {TransitionConstraintDegree(1), TransitionConstraintDegree(1)});
}

} // namespace

FibonacciAir::FibonacciAir(size_t trace_length, BFieldElement result)
    : Air(fibonacci_context(trace_length))
    , result_(result) {}

void FibonacciAir::evaluate_transition(const EvaluationFrame& frame, std::vector<BFieldElement>& result) const {
    const auto& current = frame.current;
    const auto& next = frame.next;

    result[0] = next[0] - (current[0] + current[1]);
    result[1] = next[1] - (current[1] + next[0]);
}

std::vector<Assertion> FibonacciAir::get_assertions() const {
    const size_t last_step = trace_length() - 1;
    return {
        Assertion::single(0, 0, BFieldElement::one()),
        Assertion::single(1, 0, BFieldElement::one()),
        Assertion::single(1, last_step, result_),
    };
}

ExecutionTrace build_fibonacci_trace(size_t sequence_length) {
    if (!is_power_of_two(sequence_length) || sequence_length < 16) {
        throw std::invalid_argument(
            "Fibonacci sequence length must be a power of 2 and at least 16, got " +
            std::to_string(sequence_length));
    }

    ExecutionTrace trace(TRACE_WIDTH, sequence_length / 2);
    trace.fill(
        [](std::vector<BFieldElement>& state) {
            state[0] = BFieldElement::one();
            state[1] = BFieldElement::one();
        },
        [](size_t, std::vector<BFieldElement>& state) {
            state[0] += state[1];
            state[1] += state[0];
        });
    return trace;
}

BFieldElement compute_fibonacci_term(size_t sequence_length) {
    BFieldElement t0 = BFieldElement::zero();
    BFieldElement t1 = BFieldElement::one();
    for (size_t i = 1; i < sequence_length; ++i) {
        BFieldElement t = t0 + t1;
        t0 = t1;
        t1 = t;
    }
    return sequence_length == 0 ? BFieldElement::zero() : t1;
}

} // namespace starkcomp
