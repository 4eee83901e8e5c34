#pragma once

#include "types.hpp"
#include <chrono>
#include <mutex>

namespace access_guard {
namespace common {

class Clock {
public:
    virtual ~Clock() = default;
    virtual Timestamp now() const = 0;
};

class SystemClock : public Clock {
public:
    Timestamp now() const override;
};

// Test clock; time only moves when set() or advance() is called.
class ManualClock : public Clock {
public:
    explicit ManualClock(Timestamp start);
    ManualClock();

    Timestamp now() const override;
    void set(Timestamp ts);
    void advance(std::chrono::milliseconds delta);

    // Builds a UTC timestamp from calendar fields.
    static Timestamp utc(int year, int month, int day, int hour, int minute = 0, int second = 0);

private:
    mutable std::mutex mutex_;
    Timestamp now_;
};

}}
