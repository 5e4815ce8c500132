// =============================================================================
// Records.hpp - Upstream user / product records
// =============================================================================
// Both records are read-only snapshots of what the upstream services returned.
// Decoding is tolerant: a missing or wrong-typed field becomes 0 / "" so the
// risk rules can still run and score the gap.
// =============================================================================
#pragma once

#include <nlohmann/json.hpp>

#include <cstdint>
#include <string>

namespace Integra {

struct UserRecord {
    int64_t     id = 0;
    std::string name;
    std::string email;
    std::string city;       // address.city
};

struct ProductRecord {
    int64_t     id = 0;
    std::string title;
    double      price = 0.0;
    std::string category;   // may be empty

    // Upstream price exactly as received when it was a JSON number, so an
    // integer price is written back as an integer. Null when built in code.
    nlohmann::json price_source;
};

UserRecord    decodeUser(const nlohmann::json& j);
ProductRecord decodeProduct(const nlohmann::json& j);

// Upstream "not found" shape: null or {}.
bool isAbsentBody(const nlohmann::json& j);

} // namespace Integra
