#include "chacha12_rng.hpp"

namespace starkcomp {

namespace {

inline uint32_t rotl(uint32_t v, int n) {
    return (v << n) | (v >> (32 - n));
}

} // namespace

void ChaCha12Rng::quarter_round(uint32_t& a, uint32_t& b, uint32_t& c, uint32_t& d) {
    a += b; d ^= a; d = rotl(d, 16);
    c += d; b ^= c; b = rotl(b, 12);
    a += b; d ^= a; d = rotl(d, 8);
    c += d; b ^= c; b = rotl(b, 7);
}

void ChaCha12Rng::generate_block() {
    std::array<uint32_t, 16> x = state_;

    // 6 double rounds
    for (int i = 0; i < 6; ++i) {
        quarter_round(x[0], x[4], x[8], x[12]);
        quarter_round(x[1], x[5], x[9], x[13]);
        quarter_round(x[2], x[6], x[10], x[14]);
        quarter_round(x[3], x[7], x[11], x[15]);

        quarter_round(x[0], x[5], x[10], x[15]);
        quarter_round(x[1], x[6], x[11], x[12]);
        quarter_round(x[2], x[7], x[8], x[13]);
        quarter_round(x[3], x[4], x[9], x[14]);
    }

    for (size_t i = 0; i < 16; ++i) {
        const uint32_t word = x[i] + state_[i];
        for (size_t b = 0; b < 4; ++b) {
            buffer_[i * 4 + b] = static_cast<uint8_t>(word >> (8 * b));
        }
    }

    // 64-bit block counter in words 12 and 13
    if (++state_[12] == 0) {
        ++state_[13];
    }

    index_ = 0;
}

ChaCha12Rng::ChaCha12Rng(const Seed& seed) : state_{}, buffer_{}, index_(64) {
    // "expand 32-byte k"
    state_[0] = 0x61707865;
    state_[1] = 0x3320646e;
    state_[2] = 0x79622d32;
    state_[3] = 0x6b206574;

    for (size_t i = 0; i < 8; ++i) {
        state_[4 + i] = static_cast<uint32_t>(seed[i * 4]) |
                        (static_cast<uint32_t>(seed[i * 4 + 1]) << 8) |
                        (static_cast<uint32_t>(seed[i * 4 + 2]) << 16) |
                        (static_cast<uint32_t>(seed[i * 4 + 3]) << 24);
    }

    // counter and nonce start at zero
}

uint64_t ChaCha12Rng::next_u64() {
    if (index_ + 8 > 64) {
        generate_block();
    }

    uint64_t result = 0;
    for (size_t i = 0; i < 8; ++i) {
        result |= static_cast<uint64_t>(buffer_[index_ + i]) << (i * 8);
    }

    index_ += 8;
    return result;
}

} // namespace starkcomp
