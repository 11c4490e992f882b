#pragma once

#include "air/air.hpp"
#include "trace/execution_trace.hpp"
#include <vector>

namespace starkcomp {

/**
 * FibonacciAir - proves the value of the n-th Fibonacci term
 *
 * Two registers hold consecutive terms and each step advances them by two:
 *   next[0] = cur[0] + cur[1]
 *   next[1] = cur[1] + next[0]
 * The first row is pinned to (1, 1) and the last register of the last row to
 * the claimed result. A trace of length n therefore covers 2n terms.
 */
class FibonacciAir : public Air {
public:
    FibonacciAir(size_t trace_length, BFieldElement result);

    BFieldElement result() const { return result_; }

    void evaluate_transition(const EvaluationFrame& frame, std::vector<BFieldElement>& result) const override;
    std::vector<Assertion> get_assertions() const override;

private:
    BFieldElement result_;
};

// Trace of sequence_length / 2 rows (sequence_length a power of 2, at least 16)
ExecutionTrace build_fibonacci_trace(size_t sequence_length);

// The sequence_length-th Fibonacci term, counting F(1) = F(2) = 1
BFieldElement compute_fibonacci_term(size_t sequence_length);

} // namespace starkcomp
