// =============================================================================
// RiskRules.hpp - Weights and tables for the risk engine
// =============================================================================
// Defaults reproduce the production rule set. Tests tweak individual fields
// (e.g. a negative base score) to reach branches the defaults cannot.
// =============================================================================
#pragma once

#include <map>
#include <set>
#include <string>
#include <vector>

namespace Integra {

struct PriceTier {
    double      min_price;
    int         penalty;
    const char* reason;
};

struct RiskRules {
    int base_score = 10;

    // --- Email ---
    int invalid_email_penalty = 40;
    std::set<std::string> disposable_domains = {
        "mailinator.com", "tempmail.com", "10minutemail.com", "disposablemail.com"
    };
    int    disposable_domain_penalty = 50;
    size_t long_domain_length        = 30;   // strictly longer is suspicious
    int    long_domain_penalty       = 10;

    // --- Pseudo identifier ---
    int odd_identifier_penalty = 25;

    // --- Product category (keys lower-case) ---
    std::map<std::string, int> category_risk = {
        {"electronics",      30},
        {"jewelery",         40},
        {"men's clothing",   10},
        {"women's clothing", 10},
    };
    int unknown_category_risk = 15;

    // --- Price, highest tier first ---
    std::vector<PriceTier> price_tiers = {
        {500.0, 35, "very high price"},
        {100.0, 20, "elevated price"},
        { 50.0, 10, "moderate price"},
    };

    // --- Name heuristics ---
    int unusual_name_penalty        = 8;
    int name_email_mismatch_penalty = 5;

    // --- Decision ---
    int block_threshold = 70;   // score >= threshold -> blocked
};

} // namespace Integra
