// =============================================================================
// MersenneTwister.hpp - MT19937 with array-key seeding
// =============================================================================
// std::mt19937 only takes a single 32-bit seed or a seed_seq, and neither
// reproduces the reference init_by_array() key schedule. Identifier synthesis
// needs that schedule so a given user id yields the same digits everywhere,
// so the generator is spelled out here.
//
// Seeding an integer: |n| is split into 32-bit words, least significant first
// (0 -> one zero word), and fed to init_by_array().
// =============================================================================
#pragma once

#include <array>
#include <cstdint>
#include <vector>

namespace Integra {

class MersenneTwister {
public:
    static constexpr int N = 624;

    explicit MersenneTwister(int64_t seed);
    explicit MersenneTwister(const std::vector<uint32_t>& key);

    uint32_t next_u32();

    // Top `k` bits of one output word, 1 <= k <= 32.
    uint32_t next_bits(int k);

    // Uniform integer in [0, n) by rejection on bit_length(n) bits.
    uint32_t below(uint32_t n);

    static std::vector<uint32_t> keyFromInteger(int64_t seed);

private:
    void init_genrand(uint32_t s);
    void init_by_array(const std::vector<uint32_t>& key);
    void twist();

    std::array<uint32_t, N> mt_{};
    int index_ = N + 1;
};

} // namespace Integra
