#include "common/TimeUtils.h"

#include <ctime>
#include <iomanip>
#include <sstream>

namespace tradesync {
namespace utils {

std::string formatIsoUtc(long long epoch_ms) {
    const std::time_t seconds = static_cast<std::time_t>(epoch_ms / 1000);
    const int millis = static_cast<int>(epoch_ms % 1000);

    std::tm tm_utc{};
    gmtime_r(&seconds, &tm_utc);

    std::ostringstream oss;
    oss << std::put_time(&tm_utc, "%Y-%m-%dT%H:%M:%S")
        << "." << std::setw(3) << std::setfill('0') << millis << "Z";
    return oss.str();
}

} // namespace utils
} // namespace tradesync
