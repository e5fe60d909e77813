#include "fencelock/common/RetrySchedule.hpp"
#include "fencelock/common/RetryPolicy.hpp"

#include <optional>
#include <chrono>
#include <spdlog/spdlog.h>

namespace fencelock {

RetrySchedule::RetrySchedule(const RetryPolicy p)
    : policy {p} {}

std::optional<std::chrono::milliseconds> RetrySchedule::nextDelay() {
    if (current >= policy.attempts - 1) {
        return std::nullopt;
    }
    current++;
    spdlog::debug("RetrySchedule: Attempt {} of {} failed, delay: {}ms", current, policy.attempts, policy.interval.count());
    return policy.interval;
}

int RetrySchedule::attempt() const {
    return current + 1;
}

void RetrySchedule::reset() {
    current = 0;
}

} // namespace fencelock
