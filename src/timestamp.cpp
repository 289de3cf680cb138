#include "chunkvault/timestamp.hpp"
#include <ctime>
#include <iomanip>
#include <sstream>

namespace chunkvault {

namespace {

std::tm local_time(Clock::time_point when) {
    std::time_t tt = Clock::to_time_t(when);
    std::tm tm{};
    localtime_r(&tt, &tm);
    return tm;
}

long long micros_past_second(Clock::time_point when) {
    auto seconds = std::chrono::time_point_cast<std::chrono::seconds>(when);
    if (seconds > when) {
        seconds -= std::chrono::seconds(1);
    }
    return std::chrono::duration_cast<std::chrono::microseconds>(when - seconds).count();
}

} // namespace

std::string iso_timestamp(Clock::time_point when) {
    std::tm tm = local_time(when);
    std::ostringstream oss;
    oss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%S");
    oss << '.' << std::setw(6) << std::setfill('0') << micros_past_second(when);
    return oss.str();
}

std::string log_timestamp(Clock::time_point when) {
    std::tm tm = local_time(when);
    std::ostringstream oss;
    oss << std::put_time(&tm, "%Y-%m-%d %H:%M:%S");
    oss << '.' << std::setw(3) << std::setfill('0') << micros_past_second(when) / 1000;
    return oss.str();
}

std::string compact_timestamp(Clock::time_point when) {
    std::tm tm = local_time(when);
    std::ostringstream oss;
    oss << std::put_time(&tm, "%Y%m%d_%H%M%S");
    return oss.str();
}

double seconds_between(Clock::time_point start, Clock::time_point end) {
    return std::chrono::duration<double>(end - start).count();
}

} // namespace chunkvault
