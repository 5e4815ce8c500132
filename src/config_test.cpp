// =============================================================================
// config_test.cpp - ConfigLoader + AppConfig
// =============================================================================
#include "TestHarness.hpp"
#include "integra/config/AppConfig.hpp"
#include "integra/config/ConfigLoader.hpp"

#include <cstdlib>
#include <sstream>
#include <string>

using namespace Integra;

class ConfigTest : public TestSuite {
public:
    ConfigTest() : TestSuite("CONFIG - UNIT TESTS") {}

    void run() override {
        unsetenv("INTEGRA_USERS_API");
        unsetenv("INTEGRA_PRODUCTS_API");

        test_parse();
        test_typed_getters();
        test_defaults();
        test_app_config();
        test_sanitising();
        test_env_override();
        test_missing_file();
    }

private:
    static ConfigLoader fromText(const std::string& text) {
        ConfigLoader loader;
        std::istringstream in(text);
        loader.parse(in);
        return loader;
    }

    void test_parse() {
        section("INI parsing");

        ConfigLoader l = fromText(
            "# comment\n"
            "; also a comment\n"
            "top = level\n"
            "[api]\n"
            "  users_base   =   http://u.test/users  \r\n"
            "[ fetch ]\n"
            "retries=5\n"
            "no equals sign here\n"
            "empty =\n");

        check_eq(l.get("", "top"), std::string("level"), "Key before any section");
        check_eq(l.get("api", "users_base"), std::string("http://u.test/users"), "Whitespace trimmed");
        check_eq(l.get("fetch", "retries"), std::string("5"), "Section name trimmed");
        check(l.get("fetch", "empty", "unset").empty(), "Empty value stored");
        check(l.dump().find("no equals sign") == std::string::npos, "Line without '=' ignored");
    }

    void test_typed_getters() {
        section("Typed getters");

        ConfigLoader l = fromText(
            "[x]\n"
            "i = 42\n"
            "bad_i = 42abc\n"
            "t = Yes\n"
            "f = off\n"
            "junk = maybe\n");

        check_eq(l.getInt("x", "i", 0), 42, "Integer");
        check_eq(l.getInt("x", "bad_i", 7), 7, "Trailing junk falls back");
        check(l.getBool("x", "t", false), "Yes is true");
        check(!l.getBool("x", "f", true), "off is false");
        check(l.getBool("x", "junk", true), "Unknown bool falls back");
        check_eq(l.getInt("x", "missing", -1), -1, "Missing key falls back");
    }

    void test_defaults() {
        section("Defaults");

        AppConfig cfg = loadAppConfig(ConfigLoader{});
        check_eq(cfg.risk_threshold, 70, "Threshold 70");
        check_eq(cfg.fetch.retries, 3, "Three retries");
        check(cfg.fetch.timeout == std::chrono::milliseconds(5000), "5s timeout");
        check(cfg.fetch.retry_delay == std::chrono::milliseconds(1000), "1s retry delay");
        check_eq(cfg.users_base, std::string("https://jsonplaceholder.typicode.com/users"), "Users base");
        check_eq(cfg.products_base, std::string("https://fakestoreapi.com/products"), "Products base");
        check(cfg.user_id_max == 10 && cfg.product_id_max == 20, "Console ranges");
        check_eq(cfg.logPath(), std::string("logs/integration.log"), "Log path");
    }

    void test_app_config() {
        section("AppConfig from file contents");

        ConfigLoader l = fromText(
            "[api]\n"
            "users_base = http://u.test/users/\n"
            "products_base = http://p.test/products\n"
            "[paths]\n"
            "log_dir = /var/log/integra/\n"
            "result_dir = out\n"
            "[risk]\n"
            "threshold = 55\n"
            "[fetch]\n"
            "retries = 4\n"
            "timeout_ms = 250\n"
            "retry_delay_ms = 0\n"
            "[console]\n"
            "color = false\n");

        AppConfig cfg = loadAppConfig(l);
        check_eq(cfg.users_base, std::string("http://u.test/users"), "Trailing slash stripped");
        check_eq(cfg.risk_threshold, 55, "Threshold read");
        check_eq(cfg.fetch.retries, 4, "Retries read");
        check(cfg.fetch.timeout == std::chrono::milliseconds(250), "Timeout read");
        check(cfg.fetch.retry_delay == std::chrono::milliseconds(0), "Zero delay allowed");
        check_eq(cfg.logPath(), std::string("/var/log/integra/integration.log"), "Log dir with slash");
        check_eq(cfg.result_dir, std::string("out"), "Result dir");
        check(!cfg.color, "Color disabled");
    }

    void test_sanitising() {
        section("Out-of-range values");

        ConfigLoader l = fromText(
            "[risk]\nthreshold = 250\n"
            "[fetch]\nretries = 0\ntimeout_ms = -5\n");
        AppConfig cfg = loadAppConfig(l);
        check_eq(cfg.risk_threshold, 100, "Threshold clamped to 100");
        check_eq(cfg.fetch.retries, 1, "Retries at least 1");
        check(cfg.fetch.timeout == std::chrono::milliseconds(5000), "Negative timeout keeps default");
    }

    void test_env_override() {
        section("Environment overrides");

        setenv("INTEGRA_USERS_API", "http://env.test/users/", 1);
        AppConfig cfg = loadAppConfig(fromText("[api]\nusers_base = http://file.test/users\n"));
        unsetenv("INTEGRA_USERS_API");
        check_eq(cfg.users_base, std::string("http://env.test/users"), "Environment wins over file");
    }

    void test_missing_file() {
        section("Missing file");

        ConfigLoader l;
        check(!l.load("definitely/not/here/integra.ini"), "load() reports failure");
        check_eq(l.searchedPaths().size(), size_t(2), "Fallback path searched");
        check(l.dump().empty(), "No values loaded");

        ConfigLoader s = fromText("[api]\napi_secret = hunter2\n");
        check(s.dump().find("hunter2") == std::string::npos, "Secrets masked in dump");
    }
};

int main() {
    ConfigTest t;
    t.run();
    return t.finish();
}
