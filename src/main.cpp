// =============================================================================
// main.cpp - Integra operator console
// =============================================================================
// Usage: integra [config.ini]
//
// Prompts for a user id and a product id, validates the pair, and repeats
// until the operator declines. Every evaluation is independent: a failure
// is reported and the prompt comes back.
// =============================================================================
#include "integra/config/AppConfig.hpp"
#include "integra/config/ConfigLoader.hpp"
#include "integra/logging/AuditLog.hpp"
#include "integra/net/CurlTransport.hpp"
#include "integra/net/Fetcher.hpp"
#include "integra/persist/JsonResultWriter.hpp"
#include "integra/pipeline/IntegrationValidator.hpp"
#include "integra/report/ConsoleReporter.hpp"
#include "integra/risk/RiskEngine.hpp"

#include <curl/curl.h>

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <exception>
#include <filesystem>
#include <iostream>
#include <optional>
#include <sstream>
#include <string>
#include <system_error>

using namespace Integra;

namespace {

// Whole-line integer, surrounding whitespace allowed.
std::optional<long long> parseId(const std::string& line) {
    size_t start = line.find_first_not_of(" \t\r");
    if (start == std::string::npos) return std::nullopt;
    size_t end = line.find_last_not_of(" \t\r");
    std::string s = line.substr(start, end - start + 1);

    try {
        size_t used = 0;
        long long v = std::stoll(s, &used);
        if (used != s.size()) return std::nullopt;
        return v;
    } catch (const std::exception&) {
        return std::nullopt;
    }
}

bool prompt(const std::string& text, std::string& line) {
    std::cout << text << std::flush;
    return static_cast<bool>(std::getline(std::cin, line));
}

bool wantsAnother(std::string answer) {
    std::transform(answer.begin(), answer.end(), answer.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    size_t start = answer.find_first_not_of(" \t\r");
    if (start == std::string::npos) return false;
    answer = answer.substr(start, answer.find_last_not_of(" \t\r") - start + 1);
    return answer == "y" || answer == "yes" || answer == "s";
}

void ensureDirectory(const std::string& dir, ConsoleReporter& console) {
    if (dir.empty()) return;
    std::error_code ec;
    std::filesystem::create_directories(dir, ec);
    if (ec) console.printWarning("Cannot create directory " + dir + ": " + ec.message());
}

} // namespace

int main(int argc, char** argv) {
    const std::string configPath = argc > 1 ? argv[1] : "integra.ini";

    ConfigLoader loader;
    const bool configFound = loader.load(configPath);
    const AppConfig cfg = loadAppConfig(loader);

    ConsoleReporter console(std::cout, cfg.color);
    if (configFound) {
        std::cout << "[CONFIG] Loaded " << loader.configPath() << "\n";
    } else if (argc > 1) {
        std::string searched;
        for (const auto& p : loader.searchedPaths()) {
            searched += (searched.empty() ? "" : ", ") + p;
        }
        console.printWarning("Config not found (searched " + searched + "), using defaults.");
    }

    ensureDirectory(cfg.log_dir, console);
    ensureDirectory(cfg.result_dir, console);

    AuditLog audit(cfg.logPath());
    if (!audit.is_open()) {
        console.printWarning("Audit log " + audit.path() + " could not be opened.");
    }

    if (configFound) {
        audit.info("Configuration loaded from " + loader.configPath());
        std::istringstream entries(loader.dump());
        std::string entry;
        while (std::getline(entries, entry)) audit.info("  " + entry);
    }

    if (curl_global_init(CURL_GLOBAL_DEFAULT) != CURLE_OK) {
        console.printError("curl_global_init failed");
        return EXIT_FAILURE;
    }

    int rc = EXIT_SUCCESS;
    try {
        CurlTransport transport;
        Fetcher fetcher(transport, cfg.fetch);

        RiskRules rules;
        rules.block_threshold = cfg.risk_threshold;
        RiskEngine engine(rules);

        JsonResultWriter writer(cfg.result_dir);
        IntegrationValidator validator(cfg, fetcher, engine, writer, audit, console);

        console.printBanner(cfg);

        std::string line;
        while (true) {
            if (!prompt("\nEnter user ID (" + std::to_string(cfg.user_id_min) + "-" +
                        std::to_string(cfg.user_id_max) + "): ", line)) break;
            auto userId = parseId(line);

            if (userId && !prompt("Enter product ID (" + std::to_string(cfg.product_id_min) + "-" +
                                  std::to_string(cfg.product_id_max) + "): ", line)) break;
            auto productId = userId ? parseId(line) : std::nullopt;

            if (!userId || !productId) {
                console.printWarning("Please enter valid numbers only!");
                continue;
            }

            if (*userId < cfg.user_id_min || *userId > cfg.user_id_max ||
                *productId < cfg.product_id_min || *productId > cfg.product_id_max) {
                console.printWarning("ID outside the expected range; querying anyway.");
            }

            try {
                validator.validate(*userId, *productId);
            } catch (const std::exception& e) {
                console.printError(std::string("Evaluation failed: ") + e.what());
                audit.error(std::string("Evaluation failed: ") + e.what());
            }

            if (!prompt("\nValidate another pair? (y/n): ", line) || !wantsAnother(line)) break;
        }

        console.printGoodbye();
    } catch (const std::exception& e) {
        console.printError(std::string("Fatal: ") + e.what());
        audit.error(std::string("Fatal: ") + e.what());
        rc = EXIT_FAILURE;
    }

    audit.info("Session closed after " + std::to_string(audit.entries()) + " audit entries");

    curl_global_cleanup();
    return rc;
}
