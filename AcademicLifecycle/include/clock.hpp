#pragma once
#include <atomic>
#include <chrono>
#include "models.hpp"

/*
-------------------------------------------------------------------------------
 clock.hpp — Source of "now" for the engine
-------------------------------------------------------------------------------
Enrollment, activity, certificate and dropout timestamps all come from one
Clock so elapsed-day refunds can be driven deterministically.
-------------------------------------------------------------------------------
*/

class Clock {
public:
    virtual ~Clock() = default;
    virtual TimePoint now() const = 0;
};

class SystemClock : public Clock {
public:
    TimePoint now() const override {
        return std::chrono::duration_cast<std::chrono::seconds>(
            std::chrono::system_clock::now().time_since_epoch()).count();
    }
};

// Set by hand; drives elapsed-day scenarios in tests.
class ManualClock : public Clock {
public:
    explicit ManualClock(TimePoint start = 0) : now_(start) {}

    TimePoint now() const override { return now_.load(); }
    void set(TimePoint t) { now_.store(t); }
    void advance_days(int days) { now_.fetch_add(static_cast<TimePoint>(days) * kSecondsPerDay); }

private:
    std::atomic<TimePoint> now_;
};
