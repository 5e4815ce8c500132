#include "integra/logging/AuditLog.hpp"
#include "integra/core/TimeFormat.hpp"

#include <chrono>

namespace Integra {

AuditLog::AuditLog(const std::string& path) : path_(path) {
    if (!path_.empty()) {
        file_.open(path_, std::ios::out | std::ios::app);
    }
}

AuditLog::~AuditLog() {
    if (file_.is_open()) {
        file_.close();
    }
}

void AuditLog::write(LogLevel level, const std::string& message) {
    std::lock_guard<std::mutex> lock(mtx_);
    ++entries_;
    if (!file_.is_open()) return;

    file_ << formatLocalTimeMs(std::chrono::system_clock::now())
          << " - " << logLevelToString(level)
          << " - " << message << "\n";
    file_.flush();
}

} // namespace Integra
