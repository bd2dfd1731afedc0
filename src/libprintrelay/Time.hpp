#ifndef printrelay_Utils_Time_hpp_
#define printrelay_Utils_Time_hpp_

#include <string>
#include <cstdint>

namespace PrintRelay {
namespace Utils {

// Milliseconds since the Unix epoch (wall clock).
long long get_current_millis_utc();

// /////////////////////////////////////////////////////////////////////////////
// Millisecond timestamps for the controller protocol
// Format: "YYYY-MM-DDTHH:MM:SS.sssZ" (ISO 8601, always 3 decimal places for milliseconds)

std::string millis_to_iso8601(long long unix_millis);

inline std::string iso_utc_millis_timestamp()
{
    return millis_to_iso8601(get_current_millis_utc());
}

// /////////////////////////////////////////////////////////////////////////////
// Human readable durations, e.g. uptime: "2d 3h 4m", "3h 4m 5s", "4m 5s", "5s"
std::string format_duration(uint64_t millis);

} // namespace Utils
} // namespace PrintRelay

#endif /* printrelay_Utils_Time_hpp_ */
