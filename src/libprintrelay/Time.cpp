#include "Time.hpp"

#include <chrono>
#include <cstdio>
#include <ctime>
#include <sstream>

namespace PrintRelay {
namespace Utils {

long long get_current_millis_utc()
{
    using namespace std::chrono;
    return duration_cast<milliseconds>(system_clock::now().time_since_epoch()).count();
}

std::string millis_to_iso8601(long long unix_millis)
{
    long long secs   = unix_millis / 1000;
    int       millis = static_cast<int>(unix_millis % 1000);
    if (millis < 0) {
        millis += 1000;
        --secs;
    }

    const time_t t = static_cast<time_t>(secs);
    std::tm      tms {};
#ifdef _WIN32
    if (gmtime_s(&tms, &t) != 0)
        return {};
#else
    if (gmtime_r(&t, &tms) == nullptr)
        return {};
#endif

    char buf[40];
    std::snprintf(buf, sizeof(buf), "%04d-%02d-%02dT%02d:%02d:%02d.%03dZ",
                  tms.tm_year + 1900, tms.tm_mon + 1, tms.tm_mday,
                  tms.tm_hour, tms.tm_min, tms.tm_sec, millis);
    return buf;
}

std::string format_duration(uint64_t millis)
{
    const uint64_t seconds = millis / 1000;
    const uint64_t minutes = seconds / 60;
    const uint64_t hours   = minutes / 60;
    const uint64_t days    = hours / 24;

    std::ostringstream out;
    if (days > 0)
        out << days << "d " << hours % 24 << "h " << minutes % 60 << "m";
    else if (hours > 0)
        out << hours << "h " << minutes % 60 << "m " << seconds % 60 << "s";
    else if (minutes > 0)
        out << minutes << "m " << seconds % 60 << "s";
    else
        out << seconds << "s";
    return out.str();
}

} // namespace Utils
} // namespace PrintRelay
