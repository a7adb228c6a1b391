#include "arbscan/clock.hpp"

namespace arbscan {

TimePoint SystemClock::now() const {
    return std::chrono::time_point_cast<Duration>(std::chrono::system_clock::now());
}

ManualClock::ManualClock()
    : current_ms_(0)
{
}

ManualClock::ManualClock(TimePoint start)
    : current_ms_(to_epoch_ms(start))
{
}

TimePoint ManualClock::now() const {
    return from_epoch_ms(current_ms_.load(std::memory_order_relaxed));
}

void ManualClock::set_time(TimePoint t) {
    current_ms_.store(to_epoch_ms(t), std::memory_order_relaxed);
}

void ManualClock::advance(Duration delta) {
    current_ms_.fetch_add(delta.count(), std::memory_order_relaxed);
}

} // namespace arbscan
