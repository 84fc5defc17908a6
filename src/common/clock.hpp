#pragma once

#include <chrono>

namespace sheltercontrol {

// Source of "now" for the report engine. Production code passes a
// SystemClock; tests pass a FixedClock so day counts and footers are stable.
class ClockInterface {
public:
    virtual ~ClockInterface() = default;

    virtual std::chrono::system_clock::time_point now() const = 0;
};

class SystemClock : public ClockInterface {
public:
    std::chrono::system_clock::time_point now() const override
    {
        return std::chrono::system_clock::now();
    }
};

class FixedClock : public ClockInterface {
public:
    explicit FixedClock(std::chrono::system_clock::time_point time)
        : m_time(time)
    {
    }

    std::chrono::system_clock::time_point now() const override
    {
        return m_time;
    }

private:
    std::chrono::system_clock::time_point m_time;
};

} // namespace sheltercontrol
