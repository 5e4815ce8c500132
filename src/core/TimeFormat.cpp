#include "integra/core/TimeFormat.hpp"

#include <ctime>
#include <iomanip>
#include <sstream>

namespace Integra {

static std::tm toLocal(std::time_t t) {
    std::tm out{};
#ifdef _WIN32
    localtime_s(&out, &t);
#else
    localtime_r(&t, &out);
#endif
    return out;
}

std::string formatLocalTime(std::chrono::system_clock::time_point tp) {
    std::tm tm = toLocal(std::chrono::system_clock::to_time_t(tp));
    std::ostringstream ss;
    ss << std::put_time(&tm, "%Y-%m-%d %H:%M:%S");
    return ss.str();
}

std::string formatLocalTimeMs(std::chrono::system_clock::time_point tp) {
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                  tp.time_since_epoch()).count() % 1000;
    std::ostringstream ss;
    ss << formatLocalTime(tp) << ','
       << std::setw(3) << std::setfill('0') << ms;
    return ss.str();
}

} // namespace Integra
