#pragma once

#include <cstdint>
#include <string>
#include <ostream>
#include <vector>

namespace starkcomp {

// 128-bit unsigned integer type for intermediate products
using uint128_t = __uint128_t;

/**
 * BFieldElement - Base Field Element
 *
 * Element of the Goldilocks prime field with modulus p = 2^64 - 2^32 + 1.
 * The multiplicative group has order 2^32 * (2^32 - 1), so the field holds
 * roots of unity of every power-of-two order up to 2^32.
 */
class BFieldElement {
public:
    // The Goldilocks prime: 2^64 - 2^32 + 1
    static constexpr uint64_t MODULUS = 18446744069414584321ULL;

    // Generator of the multiplicative group
    static constexpr uint64_t GENERATOR = 7ULL;

    // log2 of the largest power-of-two subgroup
    static constexpr uint32_t TWO_ADICITY = 32;

    constexpr BFieldElement() : value_(0) {}
    constexpr explicit BFieldElement(uint64_t value) : value_(value % MODULUS) {}

    static constexpr BFieldElement zero() { return BFieldElement(0); }
    static constexpr BFieldElement one() { return BFieldElement(1); }
    static constexpr BFieldElement generator() { return BFieldElement(GENERATOR); }

    constexpr uint64_t value() const { return value_; }

    BFieldElement operator+(const BFieldElement& rhs) const;
    BFieldElement operator-(const BFieldElement& rhs) const;
    BFieldElement operator*(const BFieldElement& rhs) const;
    BFieldElement operator/(const BFieldElement& rhs) const;
    BFieldElement operator-() const;

    BFieldElement& operator+=(const BFieldElement& rhs);
    BFieldElement& operator-=(const BFieldElement& rhs);
    BFieldElement& operator*=(const BFieldElement& rhs);
    BFieldElement& operator/=(const BFieldElement& rhs);

    bool operator==(const BFieldElement& rhs) const { return value_ == rhs.value_; }
    bool operator!=(const BFieldElement& rhs) const { return value_ != rhs.value_; }

    // Field operations
    BFieldElement inverse() const;
    BFieldElement pow(uint64_t exp) const;
    BFieldElement square() const { return *this * *this; }
    bool is_zero() const { return value_ == 0; }
    bool is_one() const { return value_ == 1; }

    /**
     * Montgomery's trick: inverts every element with a single field inversion.
     * Throws std::domain_error if any element is zero.
     */
    static std::vector<BFieldElement> batch_inversion(const std::vector<BFieldElement>& elements);

    // Primitive root of unity of order 2^log2_order
    static BFieldElement primitive_root_of_unity(uint32_t log2_order);

    std::string to_string() const;

    friend std::ostream& operator<<(std::ostream& os, const BFieldElement& elem);

private:
    uint64_t value_;

    static uint64_t reduce(uint128_t value);
};

using BFE = BFieldElement;

} // namespace starkcomp
