#include "integra/risk/MersenneTwister.hpp"

#include <algorithm>

namespace Integra {

namespace {
constexpr int      M          = 397;
constexpr uint32_t MATRIX_A   = 0x9908b0dfU;
constexpr uint32_t UPPER_MASK = 0x80000000U;
constexpr uint32_t LOWER_MASK = 0x7fffffffU;
} // namespace

MersenneTwister::MersenneTwister(int64_t seed) {
    init_by_array(keyFromInteger(seed));
}

MersenneTwister::MersenneTwister(const std::vector<uint32_t>& key) {
    init_by_array(key.empty() ? std::vector<uint32_t>{0} : key);
}

std::vector<uint32_t> MersenneTwister::keyFromInteger(int64_t seed) {
    // Magnitude through uint64 so INT64_MIN is representable.
    uint64_t n = seed < 0 ? (~static_cast<uint64_t>(seed) + 1) : static_cast<uint64_t>(seed);
    std::vector<uint32_t> key;
    if (n == 0) {
        key.push_back(0);
        return key;
    }
    while (n != 0) {
        key.push_back(static_cast<uint32_t>(n & 0xffffffffU));
        n >>= 32;
    }
    return key;
}

void MersenneTwister::init_genrand(uint32_t s) {
    mt_[0] = s;
    for (int i = 1; i < N; ++i) {
        mt_[i] = 1812433253U * (mt_[i - 1] ^ (mt_[i - 1] >> 30)) + static_cast<uint32_t>(i);
    }
    index_ = N;
}

void MersenneTwister::init_by_array(const std::vector<uint32_t>& key) {
    init_genrand(19650218U);

    const int key_length = static_cast<int>(key.size());
    int i = 1;
    int j = 0;

    for (int k = std::max(N, key_length); k > 0; --k) {
        mt_[i] = (mt_[i] ^ ((mt_[i - 1] ^ (mt_[i - 1] >> 30)) * 1664525U))
                 + key[j] + static_cast<uint32_t>(j);
        ++i;
        ++j;
        if (i >= N) { mt_[0] = mt_[N - 1]; i = 1; }
        if (j >= key_length) j = 0;
    }
    for (int k = N - 1; k > 0; --k) {
        mt_[i] = (mt_[i] ^ ((mt_[i - 1] ^ (mt_[i - 1] >> 30)) * 1566083941U))
                 - static_cast<uint32_t>(i);
        ++i;
        if (i >= N) { mt_[0] = mt_[N - 1]; i = 1; }
    }

    mt_[0] = 0x80000000U;   // non-zero initial state guaranteed
    index_ = N;
}

void MersenneTwister::twist() {
    for (int k = 0; k < N; ++k) {
        uint32_t y = (mt_[k] & UPPER_MASK) | (mt_[(k + 1) % N] & LOWER_MASK);
        mt_[k] = mt_[(k + M) % N] ^ (y >> 1) ^ ((y & 1U) ? MATRIX_A : 0U);
    }
    index_ = 0;
}

uint32_t MersenneTwister::next_u32() {
    if (index_ >= N) twist();

    uint32_t y = mt_[index_++];
    y ^= (y >> 11);
    y ^= (y << 7)  & 0x9d2c5680U;
    y ^= (y << 15) & 0xefc60000U;
    y ^= (y >> 18);
    return y;
}

uint32_t MersenneTwister::next_bits(int k) {
    if (k <= 0) return 0;
    if (k >= 32) return next_u32();
    return next_u32() >> (32 - k);
}

uint32_t MersenneTwister::below(uint32_t n) {
    if (n <= 1) return 0;
    int bits = 0;
    for (uint32_t v = n; v != 0; v >>= 1) ++bits;

    uint32_t r = next_bits(bits);
    while (r >= n) r = next_bits(bits);
    return r;
}

} // namespace Integra
