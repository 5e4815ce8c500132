// =============================================================================
// RiskEngine.hpp - (user, product) -> bounded risk score + reasons
// =============================================================================
// RULE ORDER (fixed, determines reason order):
//   1. email syntax / domain
//   2. pseudo-identifier parity
//   3. product category
//   4. price tier
//   5. unusual characters in the display name
//   6. email local part vs. display name
//   7. clamp to [0,100]
//
// Pure: no I/O, never throws on malformed record fields. Safe to call from
// several threads on the same instance.
// =============================================================================
#pragma once

#include "integra/core/Records.hpp"
#include "integra/risk/RiskAssessment.hpp"
#include "integra/risk/RiskRules.hpp"

#include <string>
#include <utility>

namespace Integra {

// Rule result: penalty and the reason that explains it.
using RuleScore = std::pair<int, std::string>;

class RiskEngine {
public:
    RiskEngine() = default;
    explicit RiskEngine(RiskRules rules) : rules_(std::move(rules)) {}

    RiskAssessment score(const UserRecord& user, const ProductRecord& product) const;

    // --- Individual rules (exposed for tests and the console breakdown) ---
    static bool isValidEmail(const std::string& email);

    // Domain evaluation for an address that passed isValidEmail().
    RuleScore emailDomainRisk(const std::string& email) const;
    RuleScore identifierRisk(int64_t user_id) const;
    int       categoryRisk(const std::string& category) const;
    RuleScore priceRisk(double price) const;

    static bool hasUnusualNameCharacters(const std::string& name);
    static bool emailLocalMatchesName(const std::string& email, const std::string& name);

    const RiskRules& rules() const { return rules_; }

private:
    RiskRules rules_;
};

} // namespace Integra
