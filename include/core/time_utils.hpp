#pragma once

#include <cstdint>
#include <string>

namespace camrelay {

int64_t nowSteadyNs();

// Local wall-clock time as "YYYY-MM-DD HH:MM:SS,mmm".
std::string localTimestamp();
// Local calendar date as "YYYY-MM-DD".
std::string localDate();

}  // namespace camrelay
