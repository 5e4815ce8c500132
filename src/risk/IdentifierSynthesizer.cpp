#include "integra/risk/IdentifierSynthesizer.hpp"
#include "integra/risk/MersenneTwister.hpp"

namespace Integra {

std::string PseudoIdentifier::plain() const {
    std::string out;
    out.reserve(digits.size());
    for (uint8_t d : digits) out.push_back(static_cast<char>('0' + d));
    return out;
}

std::string PseudoIdentifier::formatted() const {
    const std::string p = plain();
    return p.substr(0, 3) + "." + p.substr(3, 3) + "." + p.substr(6, 3) + "-" + p.substr(9, 2);
}

uint8_t IdentifierSynthesizer::firstCheckDigit(const std::array<uint8_t, 9>& body) {
    int sum = 0;
    for (int i = 0; i < 9; ++i) sum += body[i] * (10 - i);
    int d = (sum * 10) % 11;
    return static_cast<uint8_t>(d == 10 ? 0 : d);
}

uint8_t IdentifierSynthesizer::secondCheckDigit(const std::array<uint8_t, 9>& body, uint8_t first) {
    int sum = 0;
    for (int i = 0; i < 9; ++i) sum += body[i] * (11 - i);
    sum += first * 2;
    int d = (sum * 10) % 11;
    return static_cast<uint8_t>(d == 10 ? 0 : d);
}

PseudoIdentifier IdentifierSynthesizer::synthesize(int64_t seed) {
    MersenneTwister rng(seed);

    std::array<uint8_t, 9> body{};
    for (auto& d : body) d = static_cast<uint8_t>(rng.below(10));

    const uint8_t c1 = firstCheckDigit(body);
    const uint8_t c2 = secondCheckDigit(body, c1);

    PseudoIdentifier id;
    for (size_t i = 0; i < body.size(); ++i) id.digits[i] = body[i];
    id.digits[9]  = c1;
    id.digits[10] = c2;
    return id;
}

} // namespace Integra
