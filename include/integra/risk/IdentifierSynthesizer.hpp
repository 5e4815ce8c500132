// =============================================================================
// IdentifierSynthesizer.hpp - Deterministic pseudo national identifier
// =============================================================================
// ALGORITHM:
//   1. Fresh MersenneTwister seeded with the user id (never shared).
//   2. Nine digits d0..d8, each uniform in [0,9].
//   3. c1 = (sum d[i]*(10-i)) * 10 mod 11, 10 -> 0
//   4. c2 = (sum d[i]*(11-i) + c1*2) * 10 mod 11, 10 -> 0
//   5. "ddd.ddd.ddd-cc"
//
// A pure function of the seed: no I/O, no state kept between calls.
// =============================================================================
#pragma once

#include <array>
#include <cstdint>
#include <string>

namespace Integra {

struct PseudoIdentifier {
    std::array<uint8_t, 11> digits{};   // 9 body digits + 2 check digits

    std::string formatted() const;      // ddd.ddd.ddd-dd
    std::string plain() const;          // 11 digits, no punctuation
    uint8_t lastDigit() const { return digits[10]; }
};

class IdentifierSynthesizer {
public:
    static PseudoIdentifier synthesize(int64_t seed);

    // Check digits for a 9-digit body.
    static uint8_t firstCheckDigit(const std::array<uint8_t, 9>& body);
    static uint8_t secondCheckDigit(const std::array<uint8_t, 9>& body, uint8_t first);
};

} // namespace Integra
