#include <gtest/gtest.h>
#include "constraints/composition_coefficients.hpp"
#include "constraints/composition_prover.hpp"
#include "constraints/constraint_evaluator.hpp"
#include "constraints/prover_error.hpp"
#include "examples/fibonacci_air.hpp"
#include <stdexcept>

using namespace starkcomp;

namespace {

// next[0] = cur[0]^2, declared as degree 1 although it is degree 2
class MisdeclaredSquaringAir : public Air {
public:
    explicit MisdeclaredSquaringAir(size_t trace_length)
        : Air(AirContext(1, trace_length, {TransitionConstraintDegree(1)})) {}

    void evaluate_transition(const EvaluationFrame& frame, std::vector<BFieldElement>& result) const override {
        result[0] = frame.next[0] - frame.current[0] * frame.current[0];
    }

    std::vector<Assertion> get_assertions() const override {
        return {Assertion::single(0, 0, BFieldElement(2))};
    }
};

} // namespace

class FibonacciCompositionTest : public ::testing::Test {
protected:
    static constexpr size_t SEQUENCE_LENGTH = 64;
    static constexpr size_t TRACE_LENGTH = SEQUENCE_LENGTH / 2;

    void SetUp() override {
        options_.executor = parallel::ExecutorKind::Sequential;
        for (size_t i = 0; i < options_.seed.size(); ++i) {
            options_.seed[i] = static_cast<uint8_t>(i * 13 + 1);
        }
    }

    FibonacciAir valid_air() const {
        return FibonacciAir(TRACE_LENGTH, compute_fibonacci_term(SEQUENCE_LENGTH));
    }

    ProverOptions options_;
};

TEST_F(FibonacciCompositionTest, TraceHoldsSequence) {
    ExecutionTrace trace = build_fibonacci_trace(16);
    EXPECT_EQ(trace.width(), 2u);
    EXPECT_EQ(trace.length(), 8u);
    EXPECT_EQ(trace.get(0, 0), BFieldElement(1));
    EXPECT_EQ(trace.get(1, 0), BFieldElement(1));
    EXPECT_EQ(trace.get(0, 1), BFieldElement(2));
    EXPECT_EQ(trace.get(1, 1), BFieldElement(3));
    EXPECT_EQ(trace.get(1, 7), BFieldElement(987));
    EXPECT_EQ(compute_fibonacci_term(16), BFieldElement(987));

    EXPECT_THROW(build_fibonacci_trace(8), std::invalid_argument);
    EXPECT_THROW(build_fibonacci_trace(48), std::invalid_argument);
}

TEST_F(FibonacciCompositionTest, AirShape) {
    FibonacciAir air = valid_air();
    EXPECT_EQ(air.trace_width(), 2u);
    EXPECT_EQ(air.context().num_transition_constraints(), 2u);
    EXPECT_EQ(air.context().ce_blowup_factor(), 2u);
    EXPECT_EQ(air.context().ce_domain_size(), 2 * TRACE_LENGTH);
    EXPECT_EQ(air.get_assertions().size(), 3u);
    EXPECT_EQ(air.transition_evaluation_degrees(), (std::vector<size_t>{TRACE_LENGTH - 1, TRACE_LENGTH - 1}));

    // both step-0 assertions share the divisor (x - 1)
    auto groups = air.boundary_constraint_groups();
    ASSERT_EQ(groups.size(), 2u);
    EXPECT_EQ(groups[0].assertions.size(), 2u);
    EXPECT_EQ(groups[0].assertion_indices, (std::vector<size_t>{0, 1}));
    EXPECT_EQ(groups[1].assertion_indices, (std::vector<size_t>{2}));
}

TEST_F(FibonacciCompositionTest, ValidTraceGivesLowDegreeComposition) {
    FibonacciAir air = valid_air();
    ExecutionTrace trace = build_fibonacci_trace(SEQUENCE_LENGTH);

    CompositionProver<XFieldElement> prover(options_);
    CompositionPoly<XFieldElement> poly = prover.build_composition_poly(air, trace);

    EXPECT_EQ(poly.coefficients().size(), 2 * TRACE_LENGTH);
    EXPECT_EQ(poly.num_columns(), 2u);
    EXPECT_LT(poly.degree(), TRACE_LENGTH);
    EXPECT_LT(poly.column_degree(), TRACE_LENGTH / 2);
}

TEST_F(FibonacciCompositionTest, CorruptedTraceGivesHighDegreeComposition) {
    FibonacciAir air = valid_air();
    ExecutionTrace trace = build_fibonacci_trace(SEQUENCE_LENGTH);
    trace.set(0, TRACE_LENGTH / 2, trace.get(0, TRACE_LENGTH / 2) + BFieldElement::one());

    CompositionProver<XFieldElement> prover(options_);
    CompositionPoly<XFieldElement> poly = prover.build_composition_poly(air, trace);
    EXPECT_GE(poly.degree(), TRACE_LENGTH);
}

TEST_F(FibonacciCompositionTest, WrongClaimGivesHighDegreeComposition) {
    FibonacciAir air(TRACE_LENGTH, compute_fibonacci_term(SEQUENCE_LENGTH) + BFieldElement::one());
    ExecutionTrace trace = build_fibonacci_trace(SEQUENCE_LENGTH);

    CompositionProver<BFieldElement> prover(options_);
    CompositionPoly<BFieldElement> poly = prover.build_composition_poly(air, trace);
    EXPECT_GE(poly.degree(), TRACE_LENGTH);
}

TEST_F(FibonacciCompositionTest, WrongClaimRejectedInVerificationMode) {
    options_.verification_mode = true;
    FibonacciAir air(TRACE_LENGTH, compute_fibonacci_term(SEQUENCE_LENGTH) + BFieldElement::one());
    ExecutionTrace trace = build_fibonacci_trace(SEQUENCE_LENGTH);

    CompositionProver<BFieldElement> prover(options_);
    try {
        prover.build_composition_poly(air, trace);
        FAIL() << "expected ProverError";
    } catch (const ProverError& e) {
        // transition column, first-step group, last-step group
        EXPECT_EQ(e.kind(), ProverError::Kind::MismatchedColumnDegrees);
        EXPECT_STREQ(to_string(e.kind()), "MismatchedColumnDegrees");
        EXPECT_EQ(e.expected(), (std::vector<size_t>{0, TRACE_LENGTH - 2, TRACE_LENGTH - 2}));
        ASSERT_EQ(e.actual().size(), 3u);
        EXPECT_LE(e.actual()[0], e.expected()[0]);
        EXPECT_LE(e.actual()[1], e.expected()[1]);
        EXPECT_GT(e.actual()[2], e.expected()[2]);
    }
}

TEST_F(FibonacciCompositionTest, VerificationModePasses) {
    options_.verification_mode = true;
    FibonacciAir air = valid_air();
    ExecutionTrace trace = build_fibonacci_trace(SEQUENCE_LENGTH);

    CompositionProver<XFieldElement> prover(options_);
    CompositionPoly<XFieldElement> poly = prover.build_composition_poly(air, trace);
    EXPECT_LT(poly.degree(), TRACE_LENGTH);
}

TEST_F(FibonacciCompositionTest, VerificationModeCatchesMisdeclaredDegree) {
    options_.verification_mode = true;
    MisdeclaredSquaringAir air(16);
    ExecutionTrace trace(1, 16);
    trace.fill(
        [](std::vector<BFieldElement>& state) { state[0] = BFieldElement(2); },
        [](size_t, std::vector<BFieldElement>& state) { state[0] += BFieldElement::one(); });

    CompositionProver<BFieldElement> prover(options_);
    try {
        prover.build_composition_poly(air, trace);
        FAIL() << "expected ProverError";
    } catch (const ProverError& e) {
        EXPECT_EQ(e.kind(), ProverError::Kind::MismatchedTransitionDegrees);
        EXPECT_EQ(e.expected(), std::vector<size_t>{15});
        EXPECT_EQ(e.actual(), std::vector<size_t>{30});
    }
}

TEST_F(FibonacciCompositionTest, ResultIndependentOfFragmentationAndExecutor) {
    FibonacciAir air = valid_air();
    ExecutionTrace trace = build_fibonacci_trace(SEQUENCE_LENGTH);
    trace.set(1, 5, BFieldElement(12345));

    options_.num_fragments = 1;
    const auto reference = CompositionProver<XFieldElement>(options_).build_composition_poly(air, trace);

    for (auto kind : {parallel::ExecutorKind::Sequential, parallel::ExecutorKind::Tbb,
                      parallel::ExecutorKind::OpenMp}) {
        for (size_t k : {2u, 4u}) {
            ProverOptions options = options_;
            options.executor = kind;
            options.num_fragments = k;
            const auto poly = CompositionProver<XFieldElement>(options).build_composition_poly(air, trace);
            EXPECT_EQ(poly.coefficients(), reference.coefficients())
                << parallel::to_string(kind) << " with " << k << " fragments";
        }
    }
}

TEST_F(FibonacciCompositionTest, SeedDeterminesCoefficients) {
    ChaCha12Rng a(options_.seed);
    ChaCha12Rng b(options_.seed);
    auto first = CompositionCoefficients<XFieldElement>::draw(a, 2, 3);
    auto second = CompositionCoefficients<XFieldElement>::draw(b, 2, 3);
    EXPECT_EQ(first.transition, second.transition);
    EXPECT_EQ(first.boundary, second.boundary);
    EXPECT_EQ(first.transition.size(), 2u);
    EXPECT_EQ(first.boundary.size(), 3u);
    EXPECT_NE(first.transition[0], first.transition[1]);
}

TEST_F(FibonacciCompositionTest, EvaluatorFillsOneColumnPerDivisorGroup) {
    FibonacciAir air = valid_air();
    ExecutionTrace trace = build_fibonacci_trace(SEQUENCE_LENGTH);
    StarkDomain domain(TRACE_LENGTH, air.context().ce_blowup_factor(), options_.domain_offset);
    LdeTrace lde = trace.extend(domain);

    ChaCha12Rng rng(options_.seed);
    ConstraintEvaluator<XFieldElement> evaluator(
        air, CompositionCoefficients<XFieldElement>::draw(rng, 2, 3));
    parallel::SequentialExecutor executor;
    auto table = evaluator.evaluate(lde, domain, options_, executor);

    EXPECT_EQ(table.num_columns(), 3u);
    EXPECT_EQ(table.num_rows(), 2 * TRACE_LENGTH);
    EXPECT_EQ(table.divisors()[0], air.transition_divisor());
    EXPECT_FALSE(table.verification_enabled());

    // the last-step group column holds beta_2 * (trace[1] - result) at every row
    ChaCha12Rng replay(options_.seed);
    const auto coefficients = CompositionCoefficients<XFieldElement>::draw(replay, 2, 3);
    auto columns = std::move(table).into_columns();
    for (size_t row = 0; row < lde.num_rows(); row += 7) {
        const XFieldElement expected = coefficients.boundary[2] * (lde.get(1, row) - air.result());
        EXPECT_EQ(columns[2][row], expected) << "row " << row;
    }
}

TEST_F(FibonacciCompositionTest, RejectsMismatchedInputs) {
    FibonacciAir air = valid_air();
    ExecutionTrace short_trace = build_fibonacci_trace(SEQUENCE_LENGTH / 2);
    CompositionProver<XFieldElement> prover(options_);
    EXPECT_THROW(prover.build_composition_poly(air, short_trace), std::invalid_argument);

    ChaCha12Rng rng(options_.seed);
    EXPECT_THROW(ConstraintEvaluator<XFieldElement>(air, CompositionCoefficients<XFieldElement>::draw(rng, 1, 3)),
                 std::invalid_argument);
    EXPECT_THROW(ConstraintEvaluator<XFieldElement>(air, CompositionCoefficients<XFieldElement>::draw(rng, 2, 2)),
                 std::invalid_argument);

    ProverOptions bad = options_;
    bad.num_fragments = 3;
    EXPECT_THROW(CompositionProver<XFieldElement>{bad}, std::invalid_argument);
}
