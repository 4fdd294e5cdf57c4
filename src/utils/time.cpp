#include "switchboard/utils/time.hpp"

#include <chrono>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace switchboard::utils {

TimestampMs now_ms() {
    using namespace std::chrono;
    return duration_cast<milliseconds>(system_clock::now().time_since_epoch()).count();
}

std::string utc_date(TimestampMs timestamp) {
    const std::time_t seconds = static_cast<std::time_t>(timestamp / 1000);
    std::tm tm_value{};
#if defined(_WIN32)
    gmtime_s(&tm_value, &seconds);
#else
    gmtime_r(&seconds, &tm_value);
#endif
    std::ostringstream stream;
    stream << std::put_time(&tm_value, "%Y-%m-%d");
    return stream.str();
}

}
