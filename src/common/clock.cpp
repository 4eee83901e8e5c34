#include "access_guard/common/clock.hpp"
#include <ctime>

namespace access_guard {
namespace common {

Timestamp SystemClock::now() const {
    return std::chrono::system_clock::now();
}

ManualClock::ManualClock(Timestamp start) : now_(start) {}

ManualClock::ManualClock() : ManualClock(utc(2025, 1, 15, 12)) {}

Timestamp ManualClock::now() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return now_;
}

void ManualClock::set(Timestamp ts) {
    std::lock_guard<std::mutex> lock(mutex_);
    now_ = ts;
}

void ManualClock::advance(std::chrono::milliseconds delta) {
    std::lock_guard<std::mutex> lock(mutex_);
    now_ += delta;
}

Timestamp ManualClock::utc(int year, int month, int day, int hour, int minute, int second) {
    std::tm tm{};
    tm.tm_year = year - 1900;
    tm.tm_mon = month - 1;
    tm.tm_mday = day;
    tm.tm_hour = hour;
    tm.tm_min = minute;
    tm.tm_sec = second;
    return std::chrono::system_clock::from_time_t(timegm(&tm));
}

}}
