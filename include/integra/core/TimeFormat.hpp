#pragma once

#include <chrono>
#include <string>

namespace Integra {

// "YYYY-MM-DD HH:MM:SS" in local time.
std::string formatLocalTime(std::chrono::system_clock::time_point tp);

// "YYYY-MM-DD HH:MM:SS,mmm" in local time (audit log lines).
std::string formatLocalTimeMs(std::chrono::system_clock::time_point tp);

} // namespace Integra
