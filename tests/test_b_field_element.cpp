#include <gtest/gtest.h>
#include "types/b_field_element.hpp"
#include <stdexcept>

using namespace starkcomp;

class BFieldElementTest : public ::testing::Test {
protected:
    const BFieldElement minus_one_ = BFieldElement(BFieldElement::MODULUS - 1);
};

TEST_F(BFieldElementTest, ConstructionReducesModulus) {
    EXPECT_EQ(BFieldElement().value(), 0ULL);
    EXPECT_EQ(BFieldElement(42).value(), 42ULL);
    EXPECT_EQ(BFieldElement(BFieldElement::MODULUS + 5).value(), 5ULL);
    EXPECT_EQ(BFieldElement::MODULUS, 0xFFFFFFFF00000001ULL);
}

TEST_F(BFieldElementTest, AdditionWrapsAroundModulus) {
    BFieldElement a(BFieldElement::MODULUS - 5);
    EXPECT_EQ((a + BFieldElement(10)).value(), 5ULL);
    EXPECT_EQ((minus_one_ + BFieldElement::one()), BFieldElement::zero());
}

TEST_F(BFieldElementTest, SubtractionWrapsAroundZero) {
    EXPECT_EQ((BFieldElement(5) - BFieldElement(10)).value(), BFieldElement::MODULUS - 5);
    EXPECT_EQ(-BFieldElement::zero(), BFieldElement::zero());
    EXPECT_EQ(-BFieldElement::one(), minus_one_);
}

TEST_F(BFieldElementTest, MultiplicationReducesWideProducts) {
    // 2^64 = 2^32 - 1 (mod p)
    BFieldElement two_32(1ULL << 32);
    EXPECT_EQ((two_32 * two_32).value(), (1ULL << 32) - 1);

    // (p - 1)^2 = 1
    EXPECT_EQ(minus_one_ * minus_one_, BFieldElement::one());
}

TEST_F(BFieldElementTest, CompoundAssignmentMatchesBinaryOperators) {
    BFieldElement a(123456789);
    BFieldElement b(987654321);

    BFieldElement c = a;
    c += b;
    EXPECT_EQ(c, a + b);
    c -= b;
    EXPECT_EQ(c, a);
    c *= b;
    EXPECT_EQ(c, a * b);
    c /= b;
    EXPECT_EQ(c, a);
}

TEST_F(BFieldElementTest, Pow) {
    EXPECT_EQ(BFieldElement(5).pow(0), BFieldElement::one());
    EXPECT_EQ(BFieldElement(2).pow(10).value(), 1024ULL);
    EXPECT_EQ(BFieldElement(3).square().value(), 9ULL);

    // Fermat: a^(p-1) = 1
    EXPECT_EQ(BFieldElement(0xDEADBEEF).pow(BFieldElement::MODULUS - 1), BFieldElement::one());
}

TEST_F(BFieldElementTest, InverseAndDivision) {
    BFieldElement a(12345);
    EXPECT_EQ(a * a.inverse(), BFieldElement::one());
    EXPECT_EQ(BFieldElement::generator() * BFieldElement::generator().inverse(), BFieldElement::one());
    EXPECT_EQ((BFieldElement(100) / BFieldElement(5)).value(), 20ULL);

    BFieldElement b(67890);
    EXPECT_EQ((a / b) * b, a);
}

TEST_F(BFieldElementTest, InverseOfZeroThrows) {
    EXPECT_THROW(BFieldElement::zero().inverse(), std::domain_error);
    EXPECT_THROW(BFieldElement(7) / BFieldElement::zero(), std::domain_error);
}

TEST_F(BFieldElementTest, BatchInversionMatchesSingleInversion) {
    std::vector<BFieldElement> elements;
    for (uint64_t i = 1; i <= 33; ++i) {
        elements.push_back(BFieldElement(i * 0x9E3779B97F4A7C15ULL));
    }

    auto inverses = BFieldElement::batch_inversion(elements);
    ASSERT_EQ(inverses.size(), elements.size());
    for (size_t i = 0; i < elements.size(); ++i) {
        EXPECT_EQ(inverses[i], elements[i].inverse()) << "at index " << i;
    }
}

TEST_F(BFieldElementTest, BatchInversionOfEmptyInput) {
    EXPECT_TRUE(BFieldElement::batch_inversion({}).empty());
}

TEST_F(BFieldElementTest, BatchInversionRejectsZero) {
    std::vector<BFieldElement> elements = {BFieldElement(3), BFieldElement::zero(), BFieldElement(5)};
    EXPECT_THROW(BFieldElement::batch_inversion(elements), std::domain_error);
}

TEST_F(BFieldElementTest, PrimitiveRootsOfUnityHaveExactOrder) {
    for (uint32_t log2 : {1u, 2u, 3u, 10u, 32u}) {
        const BFieldElement root = BFieldElement::primitive_root_of_unity(log2);
        const uint64_t order = 1ULL << log2;
        EXPECT_EQ(root.pow(order), BFieldElement::one()) << "log2 order " << log2;
        EXPECT_NE(root.pow(order / 2), BFieldElement::one()) << "log2 order " << log2;
    }
    EXPECT_EQ(BFieldElement::primitive_root_of_unity(0), BFieldElement::one());
    EXPECT_EQ(BFieldElement::primitive_root_of_unity(1), minus_one_);
}

TEST_F(BFieldElementTest, PrimitiveRootBeyondTwoAdicityThrows) {
    EXPECT_THROW(BFieldElement::primitive_root_of_unity(BFieldElement::TWO_ADICITY + 1), std::invalid_argument);
}

TEST_F(BFieldElementTest, ToString) {
    EXPECT_EQ(BFieldElement(42).to_string(), "42");
}
