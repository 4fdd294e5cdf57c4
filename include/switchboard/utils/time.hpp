#pragma once

#include <functional>

#include "switchboard/model/types.hpp"

namespace switchboard::utils {

using Clock = std::function<TimestampMs()>;

TimestampMs now_ms();

// UTC calendar date "YYYY-MM-DD" of an epoch-millisecond timestamp.
std::string utc_date(TimestampMs timestamp);

}
