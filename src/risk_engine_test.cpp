// =============================================================================
// risk_engine_test.cpp - RiskEngine rules, scenarios and invariants
// =============================================================================
// Parity of the synthesized identifier for the ids used below:
//   id 1 -> ...-38 (even)   id 2 -> ...-03 (odd)   id 4 -> ...-17 (odd)
// =============================================================================
#include "TestHarness.hpp"
#include "integra/risk/RiskEngine.hpp"

#include <algorithm>
#include <string>
#include <vector>

using namespace Integra;

namespace {

UserRecord makeUser(int64_t id, const std::string& name, const std::string& email) {
    UserRecord u;
    u.id = id;
    u.name = name;
    u.email = email;
    u.city = "Gwenborough";
    return u;
}

ProductRecord makeProduct(const std::string& category, double price) {
    ProductRecord p;
    p.id = 1;
    p.title = "Test product";
    p.category = category;
    p.price = price;
    return p;
}

bool hasReason(const RiskAssessment& a, const std::string& r) {
    return std::find(a.reasons.begin(), a.reasons.end(), r) != a.reasons.end();
}

bool hasReasonPrefix(const RiskAssessment& a, const std::string& prefix) {
    for (const auto& r : a.reasons) {
        if (r.compare(0, prefix.size(), prefix) == 0) return true;
    }
    return false;
}

const char* CLAMP_REASON = "score adjusted to the 0-100 range";

} // namespace

class RiskEngineTest : public TestSuite {
public:
    RiskEngineTest() : TestSuite("RISK ENGINE - UNIT TESTS") {}

    void run() override {
        test_scenario_disposable_high_value();
        test_scenario_plain_customer();
        test_scenario_malformed_email();
        test_email_rules();
        test_identifier_rule();
        test_category_rule();
        test_price_rule();
        test_name_shape_rule();
        test_locality_rule();
        test_clamp();
        test_threshold();
        test_bounds_and_monotonicity();
    }

private:
    RiskEngine engine_;

    void test_scenario_disposable_high_value() {
        section("Disposable email + expensive electronics");

        auto a = engine_.score(makeUser(1, "Test User", "test@mailinator.com"),
                               makeProduct("electronics", 600.0));
        check_eq(a.raw_score, 125, "Raw score 10+50+0+30+35");
        check_eq(a.score, 100, "Score clamped to 100");
        check(a.blocked, "Blocked");

        const std::vector<std::string> expected = {
            "disposable domain (mailinator.com)",
            "pseudo-identifier pattern acceptable",
            "category: electronics (risk 30)",
            "very high price",
            CLAMP_REASON,
        };
        check(a.reasons == expected, "Reasons in rule order");

        auto odd = engine_.score(makeUser(2, "Test User", "test@mailinator.com"),
                                 makeProduct("electronics", 600.0));
        check_eq(odd.raw_score, 150, "Odd identifier adds 25 before clamp");
        check(odd.score == 100 && odd.blocked, "Odd identifier variant also blocked at 100");
    }

    void test_scenario_plain_customer() {
        section("Ordinary customer, cheap clothing");

        auto even = engine_.score(makeUser(1, "John", "john@gmail.com"),
                                  makeProduct("men's clothing", 20.0));
        check_eq(even.score, 20, "Even identifier: 10 + category 10");
        check(!even.blocked, "Not blocked");
        const std::vector<std::string> expected = {
            "pseudo-identifier pattern acceptable",
            "category: men's clothing (risk 10)",
        };
        check(even.reasons == expected, "Only identifier and category reasons");

        auto odd = engine_.score(makeUser(2, "John", "john@gmail.com"),
                                 makeProduct("men's clothing", 20.0));
        check_eq(odd.score, 45, "Odd identifier: 10 + 25 + 10");
        check(!odd.blocked, "Odd variant not blocked");
        check(hasReason(odd, "pseudo-identifier ends in an odd digit"), "Odd identifier reason present");
    }

    void test_scenario_malformed_email() {
        section("Malformed email");

        auto a = engine_.score(makeUser(1, "Ann", "not-an-email"),
                               makeProduct("electronics", 10.0));
        check(hasReason(a, "invalid email format"), "Invalid email reason present");
        check_eq(a.reasons.front(), std::string("invalid email format"), "Invalid email reason first");
        check_eq(a.score, 80, "10 + 40 + 30, no locality rule without '@'");
        check(a.blocked, "Blocked at 80");

        auto empty = engine_.score(makeUser(1, "Ann", ""), makeProduct("electronics", 10.0));
        check_eq(empty.score, 80, "Missing email scored like malformed");
    }

    void test_email_rules() {
        section("Email syntax and domain");

        check(RiskEngine::isValidEmail("Sincere@april.biz"), "Plain address valid");
        check(RiskEngine::isValidEmail("first.last+tag@sub-domain.co.uk"), "Dots, plus and hyphen valid");
        check(!RiskEngine::isValidEmail("a@b"), "Missing TLD invalid");
        check(!RiskEngine::isValidEmail("a b@c.com"), "Space invalid");
        check(!RiskEngine::isValidEmail("a@b@c.com"), "Two '@' invalid");
        check(!RiskEngine::isValidEmail("a@sub.domain_x.com"), "Underscore in domain invalid");

        check(engine_.emailDomainRisk("x@MailInator.COM").first == 50, "Disposable lookup ignores case");
        check(engine_.emailDomainRisk("x@tempmail.com").second == "disposable domain (tempmail.com)",
              "Disposable reason names the domain");

        const std::string d30 = std::string(26, 'a') + ".com";   // 30 chars
        const std::string d31 = std::string(27, 'a') + ".com";   // 31 chars
        check(engine_.emailDomainRisk("x@" + d30).first == 0, "30-char domain is not long");
        auto longDom = engine_.emailDomainRisk("x@" + d31);
        check(longDom.first == 10 && longDom.second == "suspicious long domain", "31-char domain adds 10");

        auto common = engine_.emailDomainRisk("x@gmail.com");
        check(common.first == 0 && common.second == "common domain", "Common domain adds nothing");

        auto a = engine_.score(makeUser(1, "X", "x@" + d31), makeProduct("men's clothing", 1.0));
        check(hasReason(a, "suspicious long domain") && a.score == 30,
              "Long domain contributes through score()");
        check(!hasReason(engine_.score(makeUser(1, "X", "x@gmail.com"),
                                       makeProduct("men's clothing", 1.0)), "common domain"),
              "Zero-risk domain leaves no reason");
    }

    void test_identifier_rule() {
        section("Pseudo-identifier parity");

        check(engine_.identifierRisk(1).first == 0, "Even last digit adds 0");
        check(engine_.identifierRisk(4).first == 25, "Odd last digit adds 25");

        auto even = engine_.score(makeUser(1, "A", "a@gmail.com"), makeProduct("men's clothing", 1.0));
        auto odd  = engine_.score(makeUser(4, "A", "a@gmail.com"), makeProduct("men's clothing", 1.0));
        check(hasReason(even, "pseudo-identifier pattern acceptable"), "Even branch appends a reason");
        check(hasReason(odd, "pseudo-identifier ends in an odd digit"), "Odd branch appends a reason");
        check_eq(odd.score - even.score, 25, "Only the parity differs");
    }

    void test_category_rule() {
        section("Category risk");

        check_eq(engine_.categoryRisk("electronics"), 30, "electronics");
        check_eq(engine_.categoryRisk("jewelery"), 40, "jewelery");
        check_eq(engine_.categoryRisk("men's clothing"), 10, "men's clothing");
        check_eq(engine_.categoryRisk("women's clothing"), 10, "women's clothing");
        check_eq(engine_.categoryRisk("ELECTRONICS"), 30, "Lookup ignores case");
        check_eq(engine_.categoryRisk("books"), 15, "Unknown category defaults to 15");
        check_eq(engine_.categoryRisk(""), 15, "Empty category defaults to 15");

        auto a = engine_.score(makeUser(1, "A", "a@gmail.com"), makeProduct("", 1.0));
        check(hasReason(a, "category: (none) (risk 15)"), "Empty category reason");

        RiskRules rules;
        rules.category_risk["gift cards"] = 0;
        RiskEngine custom(rules);
        auto z = custom.score(makeUser(1, "A", "a@gmail.com"), makeProduct("Gift Cards", 1.0));
        check(!hasReasonPrefix(z, "category:"), "Zero-risk category leaves no reason");
    }

    void test_price_rule() {
        section("Price tiers");

        struct Case { double price; int risk; const char* reason; };
        const Case cases[] = {
            {1000.0, 35, "very high price"},
            { 500.0, 35, "very high price"},
            { 499.99, 20, "elevated price"},
            { 100.0, 20, "elevated price"},
            {  99.99, 10, "moderate price"},
            {  50.0, 10, "moderate price"},
            {  49.99, 0, "low price"},
            {   0.0, 0, "low price"},
        };
        for (const auto& c : cases) {
            auto r = engine_.priceRisk(c.price);
            check(r.first == c.risk && r.second == c.reason,
                  "price " + std::to_string(c.price), "got " + std::to_string(r.first));
        }

        auto low = engine_.score(makeUser(1, "A", "a@gmail.com"), makeProduct("men's clothing", 10.0));
        check(!hasReason(low, "low price"), "Low price appends no reason");
    }

    void test_name_shape_rule() {
        section("Display name characters");

        check(!RiskEngine::hasUnusualNameCharacters("Leanne Graham"), "ASCII letters and space");
        check(!RiskEngine::hasUnusualNameCharacters("Mrs. Dennis Schulist"), "Period allowed");
        check(!RiskEngine::hasUnusualNameCharacters("Anne-Marie"), "Hyphen allowed");
        check(!RiskEngine::hasUnusualNameCharacters("Jos\xC3\xA9 Conce\xC3\xA7\xC3\xA3o"), "Accented Latin allowed");
        check(RiskEngine::hasUnusualNameCharacters("John_Doe"), "Underscore flagged");
        check(RiskEngine::hasUnusualNameCharacters("R2D2"), "Digits flagged");
        check(RiskEngine::hasUnusualNameCharacters("O'Brien"), "Apostrophe flagged");
        check(RiskEngine::hasUnusualNameCharacters("\xC5\x81ukasz"), "Letter outside Latin-1 flagged");
        check(RiskEngine::hasUnusualNameCharacters("Bad\xFF"), "Invalid UTF-8 flagged");

        auto a = engine_.score(makeUser(1, "john_doe", "john@gmail.com"), makeProduct("men's clothing", 1.0));
        check(hasReason(a, "user name contains unusual characters") && a.score == 28,
              "Unusual name adds 8");
    }

    void test_locality_rule() {
        section("Email local part vs. name");

        check(RiskEngine::emailLocalMatchesName("nathan.smith@x.com", "Nathan Smith"), "First token of local part");
        check(RiskEngine::emailLocalMatchesName("JOHN@x.com", "john"), "Case-insensitive");
        check(RiskEngine::emailLocalMatchesName("smith@x.com", "Mr.Smith"), "Periods in name become spaces");
        check(RiskEngine::emailLocalMatchesName("@x.com", "Anyone"), "Empty local part matches");
        check(!RiskEngine::emailLocalMatchesName("Sincere@april.biz", "Leanne Graham"), "Unrelated local part");

        auto a = engine_.score(makeUser(1, "Leanne Graham", "Sincere@april.biz"),
                               makeProduct("men's clothing", 1.0));
        check(hasReason(a, "name and email local part do not match") && a.score == 25,
              "Mismatch adds 5");

        auto invalid = engine_.score(makeUser(1, "Ann", "bob smith@x"), makeProduct("men's clothing", 1.0));
        check(hasReason(invalid, "name and email local part do not match"),
              "Rule applies to invalid addresses containing '@'");
    }

    void test_clamp() {
        section("Clamp");

        auto inRange = engine_.score(makeUser(1, "John", "john@gmail.com"), makeProduct("men's clothing", 20.0));
        check(!hasReason(inRange, CLAMP_REASON), "No clamp reason when unchanged");
        check_eq(inRange.raw_score, inRange.score, "Raw equals final in range");

        RiskRules negative;
        negative.base_score = -100;
        RiskEngine low(negative);
        auto a = low.score(makeUser(1, "John", "john@gmail.com"), makeProduct("men's clothing", 20.0));
        check_eq(a.raw_score, -90, "Raw score can go negative");
        check_eq(a.score, 0, "Clamped to 0");
        check(hasReason(a, CLAMP_REASON), "Clamp reason on lower bound");
        check_eq(a.reasons.back(), std::string(CLAMP_REASON), "Clamp reason is last");
    }

    void test_threshold() {
        section("Block threshold");

        auto at = engine_.score(makeUser(1, "John", "john@gmail.com"), makeProduct("jewelery", 100.0));
        check_eq(at.score, 70, "10 + 40 + 20");
        check(at.blocked, "Score equal to threshold blocks");

        auto below = engine_.score(makeUser(1, "John", "john@gmail.com"), makeProduct("jewelery", 99.0));
        check_eq(below.score, 60, "10 + 40 + 10");
        check(!below.blocked, "Below threshold allowed");

        RiskRules strict;
        strict.block_threshold = 20;
        auto s = RiskEngine(strict).score(makeUser(1, "John", "john@gmail.com"),
                                          makeProduct("men's clothing", 20.0));
        check(s.blocked, "Threshold comes from the rules");
    }

    void test_bounds_and_monotonicity() {
        section("Bounds and monotonicity");

        const std::vector<std::string> emails = {
            "john@gmail.com", "x@mailinator.com", "bad", "", "a@" + std::string(40, 'b') + ".com"
        };
        const std::vector<std::string> names = {"John", "R2-D2!", "", "Jos\xC3\xA9"};
        const std::vector<std::string> cats = {"electronics", "jewelery", "", "other"};
        const std::vector<double> prices = {0.0, 49.0, 50.0, 100.0, 500.0, 1e9, -5.0};

        bool bounded = true;
        bool monotone = true;
        for (int64_t id = 0; id <= 10; ++id)
            for (const auto& e : emails)
                for (const auto& n : names)
                    for (const auto& c : cats) {
                        for (double p : prices) {
                            auto a = engine_.score(makeUser(id, n, e), makeProduct(c, p));
                            bounded = bounded && a.score >= 0 && a.score <= 100;
                        }
                        auto lo = engine_.score(makeUser(id, n, e), makeProduct(c, 40.0));
                        auto hi = engine_.score(makeUser(id, n, e), makeProduct(c, 60.0));
                        monotone = monotone && hi.score >= lo.score;
                    }
        check(bounded, "Score always within [0,100]");
        check(monotone, "Raising price 40 -> 60 never lowers the score");

        auto first  = engine_.score(makeUser(7, "A", "a@b.com"), makeProduct("x", 75.0));
        auto second = engine_.score(makeUser(7, "A", "a@b.com"), makeProduct("x", 75.0));
        check(first.score == second.score && first.reasons == second.reasons, "Scoring is deterministic");
    }
};

int main() {
    RiskEngineTest t;
    t.run();
    return t.finish();
}
