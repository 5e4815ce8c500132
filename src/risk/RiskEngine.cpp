#include "integra/risk/RiskEngine.hpp"
#include "integra/risk/IdentifierSynthesizer.hpp"

#include <algorithm>
#include <regex>

namespace Integra {

namespace {

// Lower-cases ASCII and the Latin-1 capitals U+00C0..U+00DE (except U+00D7)
// in a UTF-8 string. Everything else is copied through.
std::string foldCase(const std::string& s) {
    std::string out;
    out.reserve(s.size());
    for (size_t i = 0; i < s.size(); ++i) {
        unsigned char c = static_cast<unsigned char>(s[i]);
        if (c >= 'A' && c <= 'Z') {
            out.push_back(static_cast<char>(c + ('a' - 'A')));
        } else if (c == 0xC3 && i + 1 < s.size()) {
            unsigned char n = static_cast<unsigned char>(s[i + 1]);
            if (n >= 0x80 && n <= 0x9E && n != 0x97) n = static_cast<unsigned char>(n + 0x20);
            out.push_back(static_cast<char>(c));
            out.push_back(static_cast<char>(n));
            ++i;
        } else {
            out.push_back(static_cast<char>(c));
        }
    }
    return out;
}

// Next code point of a UTF-8 string, or -1 on a malformed sequence.
long nextCodePoint(const std::string& s, size_t& i) {
    unsigned char c = static_cast<unsigned char>(s[i++]);
    if (c < 0x80) return c;

    int extra;
    long cp;
    if ((c & 0xE0) == 0xC0)      { extra = 1; cp = c & 0x1F; }
    else if ((c & 0xF0) == 0xE0) { extra = 2; cp = c & 0x0F; }
    else if ((c & 0xF8) == 0xF0) { extra = 3; cp = c & 0x07; }
    else return -1;

    for (int k = 0; k < extra; ++k) {
        if (i >= s.size()) return -1;
        unsigned char cc = static_cast<unsigned char>(s[i]);
        if ((cc & 0xC0) != 0x80) return -1;
        cp = (cp << 6) | (cc & 0x3F);
        ++i;
    }
    return cp;
}

bool isNameCodePoint(long cp) {
    if (cp >= 'A' && cp <= 'Z') return true;
    if (cp >= 'a' && cp <= 'z') return true;
    if (cp >= 0xC0 && cp <= 0xFF) return true;    // accented Latin-1 letters
    return cp == ' ' || cp == '-' || cp == '.';
}

} // namespace

bool RiskEngine::isValidEmail(const std::string& email) {
    static const std::regex pattern(
        R"(^[a-zA-Z0-9_.+\-]+@[a-zA-Z0-9\-]+\.[a-zA-Z0-9.\-]+$)");
    return std::regex_match(email, pattern);
}

RuleScore RiskEngine::emailDomainRisk(const std::string& email) const {
    size_t at = email.find('@');
    if (at == std::string::npos) {
        return {rules_.invalid_email_penalty, "malformed email"};
    }

    std::string domain = foldCase(email.substr(at + 1));

    if (rules_.disposable_domains.count(domain)) {
        return {rules_.disposable_domain_penalty, "disposable domain (" + domain + ")"};
    }
    if (domain.size() > rules_.long_domain_length) {
        return {rules_.long_domain_penalty, "suspicious long domain"};
    }
    return {0, "common domain"};
}

RuleScore RiskEngine::identifierRisk(int64_t user_id) const {
    PseudoIdentifier id = IdentifierSynthesizer::synthesize(user_id);
    if (id.lastDigit() % 2 == 1) {
        return {rules_.odd_identifier_penalty,
                "pseudo-identifier ends in an odd digit"};
    }
    return {0, "pseudo-identifier pattern acceptable"};
}

int RiskEngine::categoryRisk(const std::string& category) const {
    auto it = rules_.category_risk.find(foldCase(category));
    if (it == rules_.category_risk.end()) return rules_.unknown_category_risk;
    return it->second;
}

RuleScore RiskEngine::priceRisk(double price) const {
    for (const auto& tier : rules_.price_tiers) {
        if (price >= tier.min_price) return {tier.penalty, tier.reason};
    }
    return {0, "low price"};
}

bool RiskEngine::hasUnusualNameCharacters(const std::string& name) {
    size_t i = 0;
    while (i < name.size()) {
        long cp = nextCodePoint(name, i);
        if (cp < 0 || !isNameCodePoint(cp)) return true;
    }
    return false;
}

bool RiskEngine::emailLocalMatchesName(const std::string& email, const std::string& name) {
    std::string local = email.substr(0, email.find('@'));
    std::string token = foldCase(local.substr(0, local.find('.')));

    std::string haystack = name;
    std::replace(haystack.begin(), haystack.end(), '.', ' ');
    haystack = foldCase(haystack);

    return haystack.find(token) != std::string::npos;
}

RiskAssessment RiskEngine::score(const UserRecord& user, const ProductRecord& product) const {
    RiskAssessment a;
    int total = rules_.base_score;

    // 1. Email
    if (!isValidEmail(user.email)) {
        a.reasons.emplace_back("invalid email format");
        total += rules_.invalid_email_penalty;
    } else {
        RuleScore r = emailDomainRisk(user.email);
        if (r.first != 0) a.reasons.push_back(r.second);
        total += r.first;
    }

    // 2. Pseudo identifier parity (both branches explain themselves)
    {
        RuleScore r = identifierRisk(user.id);
        a.reasons.push_back(r.second);
        total += r.first;
    }

    // 3. Category
    {
        int r = categoryRisk(product.category);
        if (r != 0) {
            a.reasons.push_back("category: " +
                                (product.category.empty() ? std::string("(none)") : product.category) +
                                " (risk " + std::to_string(r) + ")");
        }
        total += r;
    }

    // 4. Price
    {
        RuleScore r = priceRisk(product.price);
        if (r.first > 0) a.reasons.push_back(r.second);
        total += r.first;
    }

    // 5. Display name shape
    if (hasUnusualNameCharacters(user.name)) {
        a.reasons.emplace_back("user name contains unusual characters");
        total += rules_.unusual_name_penalty;
    }

    // 6. Name vs. email local part
    if (user.email.find('@') != std::string::npos &&
        !emailLocalMatchesName(user.email, user.name)) {
        a.reasons.emplace_back("name and email local part do not match");
        total += rules_.name_email_mismatch_penalty;
    }

    // 7. Clamp
    a.raw_score = total;
    a.score = std::clamp(total, 0, 100);
    if (a.score != total) {
        a.reasons.emplace_back("score adjusted to the 0-100 range");
    }

    a.blocked = a.score >= rules_.block_threshold;
    return a;
}

} // namespace Integra
