#include "integra/core/Records.hpp"

#include <cmath>
#include <cstdlib>

using json = nlohmann::json;

namespace Integra {

namespace {

std::string stringField(const json& obj, const char* key) {
    if (!obj.is_object()) return {};
    auto it = obj.find(key);
    if (it == obj.end() || !it->is_string()) return {};
    return it->get<std::string>();
}

int64_t intField(const json& obj, const char* key) {
    if (!obj.is_object()) return 0;
    auto it = obj.find(key);
    if (it == obj.end()) return 0;
    if (it->is_number_integer()) return it->get<int64_t>();
    if (it->is_number_float()) {
        // 2^63 is exact as a double; anything outside [-2^63, 2^63) or
        // non-finite has no int64 value.
        const double d = it->get<double>();
        constexpr double limit = 9223372036854775808.0;
        if (!std::isfinite(d) || d < -limit || d >= limit) return 0;
        return static_cast<int64_t>(d);
    }
    if (it->is_string()) {
        const std::string s = it->get<std::string>();
        char* end = nullptr;
        long long v = std::strtoll(s.c_str(), &end, 10);
        if (end != s.c_str() && *end == '\0') return static_cast<int64_t>(v);
    }
    return 0;
}

double numberField(const json& obj, const char* key) {
    if (!obj.is_object()) return 0.0;
    auto it = obj.find(key);
    if (it == obj.end()) return 0.0;
    if (it->is_number()) return it->get<double>();
    if (it->is_string()) {
        // Some feeds quote prices ("109.95").
        const std::string s = it->get<std::string>();
        char* end = nullptr;
        double v = std::strtod(s.c_str(), &end);
        if (end != s.c_str() && *end == '\0') return v;
    }
    return 0.0;
}

} // namespace

UserRecord decodeUser(const json& j) {
    UserRecord u;
    u.id    = intField(j, "id");
    u.name  = stringField(j, "name");
    u.email = stringField(j, "email");
    if (j.is_object()) {
        auto addr = j.find("address");
        if (addr != j.end()) u.city = stringField(*addr, "city");
    }
    return u;
}

ProductRecord decodeProduct(const json& j) {
    ProductRecord p;
    p.id       = intField(j, "id");
    p.title    = stringField(j, "title");
    p.price    = numberField(j, "price");
    if (j.is_object()) {
        auto price = j.find("price");
        if (price != j.end() && price->is_number()) p.price_source = *price;
    }
    p.category = stringField(j, "category");
    return p;
}

bool isAbsentBody(const json& j) {
    if (j.is_null()) return true;
    if (j.is_object() && j.empty()) return true;
    return false;
}

} // namespace Integra
