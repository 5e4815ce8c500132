// =============================================================================
// AuditLog.hpp - Append-only line log
// =============================================================================
// FORMAT: "YYYY-MM-DD HH:MM:SS,mmm - LEVEL - message"
//
// One entry per fetch failure, per missing record and per final decision.
// A log that failed to open drops entries silently; callers never branch on
// logging.
// =============================================================================
#pragma once

#include <cstdint>
#include <fstream>
#include <mutex>
#include <string>

namespace Integra {

enum class LogLevel : uint8_t {
    INFO    = 0,
    WARNING = 1,
    ERROR   = 2
};

inline const char* logLevelToString(LogLevel l) {
    switch (l) {
        case LogLevel::INFO:    return "INFO";
        case LogLevel::WARNING: return "WARNING";
        case LogLevel::ERROR:   return "ERROR";
        default:                return "UNKNOWN";
    }
}

class AuditLog {
public:
    // Empty path = disabled log (tests).
    explicit AuditLog(const std::string& path);
    ~AuditLog();

    AuditLog(const AuditLog&) = delete;
    AuditLog& operator=(const AuditLog&) = delete;

    void write(LogLevel level, const std::string& message);

    void info(const std::string& m)    { write(LogLevel::INFO, m); }
    void warning(const std::string& m) { write(LogLevel::WARNING, m); }
    void error(const std::string& m)   { write(LogLevel::ERROR, m); }

    bool is_open() const { return file_.is_open(); }
    const std::string& path() const { return path_; }
    uint64_t entries() const { return entries_; }

private:
    std::string   path_;
    std::ofstream file_;
    std::mutex    mtx_;
    uint64_t      entries_ = 0;
};

} // namespace Integra
