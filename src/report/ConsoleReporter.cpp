#include "integra/report/ConsoleReporter.hpp"

#include <iomanip>

namespace Integra {

namespace {
constexpr const char* GREEN  = "\033[92m";
constexpr const char* RED    = "\033[91m";
constexpr const char* YELLOW = "\033[93m";
constexpr const char* CYAN   = "\033[96m";
constexpr const char* BOLD   = "\033[1m";
constexpr const char* RESET  = "\033[0m";
} // namespace

ConsoleReporter::ConsoleReporter(std::ostream& out, bool color)
    : out_(out), color_(color) {}

void ConsoleReporter::printBanner(const AppConfig& cfg) {
    const std::string rule(80, '=');
    out_ << rule << "\n"
         << c(BOLD) << c(CYAN) << "INTEGRA - API INTEGRATION VALIDATOR + ANTIFRAUD" << c(RESET) << "\n"
         << rule << "\n"
         << "  Users    -> " << cfg.users_base << "\n"
         << "  Products -> " << cfg.products_base << "\n"
         << "  Block threshold = " << cfg.risk_threshold << "\n"
         << rule << "\n";
}

void ConsoleReporter::printWarning(const std::string& msg) {
    out_ << c(YELLOW) << msg << c(RESET) << "\n";
}

void ConsoleReporter::printError(const std::string& msg) {
    out_ << c(RED) << msg << c(RESET) << "\n";
}

void ConsoleReporter::printGoodbye() {
    out_ << c(CYAN) << "\nShutting down... goodbye!" << c(RESET) << "\n";
}

void ConsoleReporter::onFetchStarted(RecordKind kind, int64_t id, const std::string&) {
    if (kind == RecordKind::USER) out_ << "\n";
    out_ << c(CYAN) << "Fetching " << recordKindToString(kind)
         << " ID=" << id << "..." << c(RESET) << "\n";
}

void ConsoleReporter::onFetchTimeout(RecordKind, int attempt, int total) {
    out_ << c(YELLOW) << "Timeout (" << attempt << "/" << total << "), retrying..."
         << c(RESET) << "\n";
}

void ConsoleReporter::onFetchFailed(RecordKind, const std::string& detail) {
    out_ << c(RED) << "Request error: " << detail << c(RESET) << "\n";
}

void ConsoleReporter::onRecordMissing(RecordKind kind, int64_t) {
    out_ << c(RED) << recordKindToString(kind) << " not found." << c(RESET) << "\n";
}

void ConsoleReporter::onRecordsLoaded(const UserRecord& user, const ProductRecord& product) {
    out_ << "\n" << c(BOLD) << c(GREEN) << "User:" << c(RESET) << " "
         << user.name << " | " << user.email << "\n"
         << c(CYAN) << "City:" << c(RESET) << " " << user.city << "\n"
         << "\n" << c(BOLD) << c(GREEN) << "Product:" << c(RESET) << " " << product.title << "\n"
         << c(CYAN) << "Price:" << c(RESET) << " " << std::fixed << std::setprecision(2)
         << product.price << std::defaultfloat
         << " | Category: " << (product.category.empty() ? "-" : product.category) << "\n";
}

void ConsoleReporter::onAssessment(const RiskAssessment& a) {
    out_ << "\n" << c(YELLOW) << "Risk score: " << a.score << "/100" << c(RESET) << "\n";
    if (a.reasons.empty()) return;

    out_ << c(YELLOW) << "Reasons: ";
    for (size_t i = 0; i < a.reasons.size(); ++i) {
        if (i) out_ << ", ";
        out_ << a.reasons[i];
    }
    out_ << c(RESET) << "\n";
}

void ConsoleReporter::onDecision(bool blocked, int threshold) {
    if (blocked) {
        out_ << c(RED) << "\nIntegration BLOCKED - risk at or above threshold ("
             << threshold << ")." << c(RESET) << "\n";
    } else {
        out_ << c(GREEN) << "\nIntegration authorized - saving result." << c(RESET) << "\n";
    }
}

void ConsoleReporter::onResultSaved(const std::string& path) {
    out_ << c(CYAN) << "Result saved to " << path << c(RESET) << "\n";
}

} // namespace Integra
