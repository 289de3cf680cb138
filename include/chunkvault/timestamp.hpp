#ifndef CHUNKVAULT_TIMESTAMP_HPP
#define CHUNKVAULT_TIMESTAMP_HPP

#include <chrono>
#include <string>

namespace chunkvault {

using Clock = std::chrono::system_clock;

// 2024-05-01T13:45:12.123456 (local time, inventory fields)
std::string iso_timestamp(Clock::time_point when = Clock::now());

// 2024-05-01 13:45:12.123 (local time, log lines)
std::string log_timestamp(Clock::time_point when = Clock::now());

// 20240501_134512 (local time, file name suffixes)
std::string compact_timestamp(Clock::time_point when = Clock::now());

// Seconds between two points as a double
double seconds_between(Clock::time_point start, Clock::time_point end);

} // namespace chunkvault

#endif // CHUNKVAULT_TIMESTAMP_HPP
