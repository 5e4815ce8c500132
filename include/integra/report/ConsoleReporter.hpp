#pragma once

#include "integra/config/AppConfig.hpp"
#include "integra/report/ValidationObserver.hpp"

#include <ostream>
#include <string>

namespace Integra {

// ANSI-colored operator output. Colors can be switched off for pipes.
class ConsoleReporter final : public ValidationObserver {
public:
    ConsoleReporter(std::ostream& out, bool color);

    void printBanner(const AppConfig& cfg);
    void printWarning(const std::string& msg);
    void printError(const std::string& msg);
    void printGoodbye();

    void onFetchStarted(RecordKind kind, int64_t id, const std::string& url) override;
    void onFetchTimeout(RecordKind kind, int attempt, int total) override;
    void onFetchFailed(RecordKind kind, const std::string& detail) override;
    void onRecordMissing(RecordKind kind, int64_t id) override;
    void onRecordsLoaded(const UserRecord& user, const ProductRecord& product) override;
    void onAssessment(const RiskAssessment& assessment) override;
    void onDecision(bool blocked, int threshold) override;
    void onResultSaved(const std::string& path) override;

private:
    const char* c(const char* code) const { return color_ ? code : ""; }

    std::ostream& out_;
    bool color_;
};

} // namespace Integra
