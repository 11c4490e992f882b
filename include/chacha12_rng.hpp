#pragma once

#include <array>
#include <cstddef>
#include <cstdint>

namespace starkcomp {

/**
 * ChaCha12Rng - ChaCha stream cipher with 12 rounds used as a seeded RNG
 *
 * Drives every random choice of the prover (composition coefficients) so
 * that the same seed reproduces the same composition polynomial.
 */
class ChaCha12Rng {
public:
    using Seed = std::array<uint8_t, 32>;

    explicit ChaCha12Rng(const Seed& seed);

    uint64_t next_u64();

    uint32_t next_u32() {
        return static_cast<uint32_t>(next_u64() & 0xFFFFFFFFULL);
    }

private:
    std::array<uint32_t, 16> state_;
    std::array<uint8_t, 64> buffer_;
    size_t index_;

    static void quarter_round(uint32_t& a, uint32_t& b, uint32_t& c, uint32_t& d);

    // Next 64-byte block of keystream
    void generate_block();
};

} // namespace starkcomp
