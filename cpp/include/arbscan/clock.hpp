#pragma once

#include <atomic>
#include <cstdint>

#include "arbscan/types.hpp"

namespace arbscan {

class Clock {
public:
    virtual ~Clock() = default;
    virtual TimePoint now() const = 0;
};

class SystemClock : public Clock {
public:
    TimePoint now() const override;
};

// Settable clock for tests and replays
class ManualClock : public Clock {
public:
    ManualClock();
    explicit ManualClock(TimePoint start);

    TimePoint now() const override;

    void set_time(TimePoint t);
    void advance(Duration delta);

private:
    std::atomic<std::int64_t> current_ms_;
};

} // namespace arbscan
