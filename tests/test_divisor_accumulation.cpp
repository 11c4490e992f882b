#include <gtest/gtest.h>
#include "constraints/divisor_accumulation.hpp"
#include "ntt/ntt.hpp"
#include "polynomial/polynomial.hpp"
#include <stdexcept>

using namespace starkcomp;

class DivisorAccumulationTest : public ::testing::Test {
protected:
    const BFieldElement offset_ = BFieldElement(7);

    static std::vector<BFieldElement> coset(size_t size, BFieldElement offset) {
        const BFieldElement g = BFieldElement::primitive_root_of_unity(NTT::log2_of(size));
        std::vector<BFieldElement> points;
        BFieldElement x = offset;
        for (size_t i = 0; i < size; ++i) {
            points.push_back(x);
            x *= g;
        }
        return points;
    }

    // Evaluations of quotient * divisor over the coset
    static std::vector<BFieldElement> dividend_column(
        const BPolynomial& quotient, const ConstraintDivisor& divisor, const std::vector<BFieldElement>& points) {
        std::vector<BFieldElement> column;
        for (const auto& x : points) {
            column.push_back(quotient.evaluate(x) * divisor.evaluate_at(x));
        }
        return column;
    }

    static BPolynomial sample_quotient(size_t num_coeffs) {
        std::vector<BFieldElement> coeffs;
        for (size_t i = 0; i < num_coeffs; ++i) {
            coeffs.push_back(BFieldElement(31 * i * i + 17 * i + 5));
        }
        return BPolynomial(coeffs);
    }

    parallel::SequentialExecutor sequential_;
};

TEST_F(DivisorAccumulationTest, InverseEvaluationsArePeriodic) {
    ConstraintDivisor divisor({{4, BFieldElement::one()}}, {});
    auto z = get_inv_evaluation(divisor, 8, offset_, sequential_);

    // x^4 repeats every 2 points of an 8-element coset
    ASSERT_EQ(z.size(), 2u);
    const auto points = coset(8, offset_);
    for (size_t j = 0; j < points.size(); ++j) {
        EXPECT_EQ(z[j % 2] * (points[j].pow(4) - BFieldElement::one()), BFieldElement::one()) << "point " << j;
    }
}

TEST_F(DivisorAccumulationTest, NumeratorMustNotVanishOnDomain) {
    // x^n - 1 is zero on the trace domain itself, so offset 1 hits a zero numerator
    const auto divisor = ConstraintDivisor::from_transition(16);
    EXPECT_THROW(get_inv_evaluation(divisor, 64, BFieldElement::one(), sequential_), std::domain_error);

    std::vector<BFieldElement> column(64, BFieldElement::one());
    std::vector<BFieldElement> result(64, BFieldElement::zero());
    EXPECT_THROW(accumulate_column(column, divisor, BFieldElement::one(), result, sequential_), std::domain_error);

    // a proper coset keeps every numerator value invertible
    const auto z = get_inv_evaluation(divisor, 64, offset_, sequential_);
    ASSERT_EQ(z.size(), 4u);
    for (const auto& value : z) {
        EXPECT_FALSE(value.is_zero());
    }
}

TEST_F(DivisorAccumulationTest, BoundaryDivisionRecoversQuotient) {
    // domain of 8 points, trace length 4, divisor x^4 - 1
    ConstraintDivisor divisor({{4, BFieldElement::one()}}, {});
    const BPolynomial quotient = sample_quotient(4);
    const auto column = dividend_column(quotient, divisor, coset(8, offset_));

    std::vector<BFieldElement> result(8, BFieldElement::zero());
    accumulate_column(column, divisor, offset_, result, sequential_);

    NTT::interpolate_with_offset(result, offset_);
    for (size_t i = 0; i < 8; ++i) {
        const BFieldElement expected = i < 4 ? quotient[i] : BFieldElement::zero();
        EXPECT_EQ(result[i], expected) << "coefficient " << i;
    }
}

TEST_F(DivisorAccumulationTest, TransitionDivisionRecoversQuotient) {
    auto divisor = ConstraintDivisor::from_transition(4);
    const BPolynomial quotient = sample_quotient(5);
    const auto column = dividend_column(quotient, divisor, coset(8, offset_));

    std::vector<BFieldElement> result(8, BFieldElement::zero());
    accumulate_column(column, divisor, offset_, result, sequential_);

    NTT::interpolate_with_offset(result, offset_);
    for (size_t i = 0; i < 8; ++i) {
        const BFieldElement expected = i < 5 ? quotient[i] : BFieldElement::zero();
        EXPECT_EQ(result[i], expected) << "coefficient " << i;
    }
}

TEST_F(DivisorAccumulationTest, AccumulationAddsToExistingValues) {
    ConstraintDivisor divisor({{1, BFieldElement(3)}}, {});
    std::vector<BFieldElement> column(8, BFieldElement(10));
    std::vector<BFieldElement> result(8, BFieldElement(100));

    accumulate_column(column, divisor, offset_, result, sequential_);

    const auto points = coset(8, offset_);
    for (size_t j = 0; j < 8; ++j) {
        EXPECT_EQ(result[j], BFieldElement(100) + BFieldElement(10) / (points[j] - BFieldElement(3)));
    }
}

TEST_F(DivisorAccumulationTest, ExtensionColumnMatchesComponentwiseDivision) {
    auto divisor = ConstraintDivisor::from_transition(8);
    std::vector<XFieldElement> column;
    std::vector<BFieldElement> c0, c1, c2;
    for (uint64_t j = 0; j < 32; ++j) {
        column.push_back(XFieldElement(BFieldElement(j + 1), BFieldElement(3 * j), BFieldElement(j * j)));
        c0.push_back(column.back().coeff(0));
        c1.push_back(column.back().coeff(1));
        c2.push_back(column.back().coeff(2));
    }

    std::vector<XFieldElement> result(32, XFieldElement::zero());
    accumulate_column(column, divisor, offset_, result, sequential_);

    std::vector<BFieldElement> r0(32), r1(32), r2(32);
    accumulate_column(c0, divisor, offset_, r0, sequential_);
    accumulate_column(c1, divisor, offset_, r1, sequential_);
    accumulate_column(c2, divisor, offset_, r2, sequential_);
    for (size_t j = 0; j < 32; ++j) {
        EXPECT_EQ(result[j], XFieldElement(r0[j], r1[j], r2[j])) << "point " << j;
    }
}

TEST_F(DivisorAccumulationTest, ParallelBatchesMatchSequential) {
    // large enough that every executor splits the domain into several batches
    constexpr size_t domain_size = 4096;
    auto divisor = ConstraintDivisor::from_transition(1024);
    std::vector<BFieldElement> column;
    for (uint64_t j = 0; j < domain_size; ++j) {
        column.push_back(BFieldElement(j * 0x9E3779B97F4A7C15ULL + 1));
    }

    std::vector<BFieldElement> expected(domain_size, BFieldElement::zero());
    accumulate_column(column, divisor, offset_, expected, sequential_);

    parallel::TbbExecutor tbb;
    std::vector<BFieldElement> tbb_result(domain_size, BFieldElement::zero());
    accumulate_column(column, divisor, offset_, tbb_result, tbb);
    EXPECT_EQ(tbb_result, expected);

    parallel::OpenMpExecutor openmp;
    std::vector<BFieldElement> openmp_result(domain_size, BFieldElement::zero());
    accumulate_column(column, divisor, offset_, openmp_result, openmp);
    EXPECT_EQ(openmp_result, expected);
}

TEST_F(DivisorAccumulationTest, RejectsUnsupportedDivisorsWithoutTouchingResult) {
    std::vector<BFieldElement> column(8, BFieldElement::one());
    std::vector<BFieldElement> result(8, BFieldElement(42));

    ConstraintDivisor two_terms({{4, BFieldElement::one()}, {2, BFieldElement(3)}}, {});
    EXPECT_THROW(accumulate_column(column, two_terms, offset_, result, sequential_), std::invalid_argument);

    ConstraintDivisor two_exclusions({{4, BFieldElement::one()}}, {BFieldElement(2), BFieldElement(3)});
    EXPECT_THROW(accumulate_column(column, two_exclusions, offset_, result, sequential_), std::invalid_argument);

    ConstraintDivisor non_dividing({{3, BFieldElement::one()}}, {});
    EXPECT_THROW(accumulate_column(column, non_dividing, offset_, result, sequential_), std::invalid_argument);

    std::vector<BFieldElement> short_result(4, BFieldElement(42));
    ConstraintDivisor valid({{4, BFieldElement::one()}}, {});
    EXPECT_THROW(accumulate_column(column, valid, offset_, short_result, sequential_), std::invalid_argument);

    for (const auto& value : result) {
        EXPECT_EQ(value, BFieldElement(42));
    }
}

TEST_F(DivisorAccumulationTest, ShapeErrorMessages) {
    ConstraintDivisor two_terms({{4, BFieldElement::one()}, {2, BFieldElement(3)}}, {});
    try {
        validate_divisor_shape(two_terms, 8);
        FAIL() << "expected std::invalid_argument";
    } catch (const std::invalid_argument& e) {
        EXPECT_STREQ(e.what(), "complex divisors are not yet supported");
    }

    ConstraintDivisor two_exclusions({{4, BFieldElement::one()}}, {BFieldElement(2), BFieldElement(3)});
    try {
        validate_divisor_shape(two_exclusions, 8);
        FAIL() << "expected std::invalid_argument";
    } catch (const std::invalid_argument& e) {
        EXPECT_STREQ(e.what(), "multiple exclusion points are not yet supported");
    }
}
