// SPDX-License-Identifier: AGPL-3.0-or-later
/*
 * FenceLock a Redis-backed distributed lock.
 * Copyright (C) 2025 Ahmed Refaat Gadalla Mohamed
 *
 * This program is free software: you can redistribute it and/or modify it under the terms of the GNU Affero General Public License as published by the Free Software Foundation, either version 3 of the License, or (at your option) any later version.
 *
 * This program is distributed in the hope that it will be useful, but WITHOUT ANY WARRANTY; without even the implied warranty of MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE. See the GNU Affero General Public License for more details.
 *
 * You should have received a copy of the GNU Affero General Public License along with this program. If not, see <https://www.gnu.org/licenses/>.
 */
#ifndef FENCELOCK_RETRY_SCHEDULE_H
#define FENCELOCK_RETRY_SCHEDULE_H

#include "fencelock/common/RetryPolicy.hpp"
#include <optional>
#include <chrono>

namespace fencelock {

// Yields the delay to wait before the next attempt, or nullopt once the
// last attempt has been made. N attempts produce exactly N - 1 delays.
class RetrySchedule {
public:
    explicit RetrySchedule(const RetryPolicy policy);
    std::optional<std::chrono::milliseconds> nextDelay();
    [[nodiscard]] int attempt() const;
    void reset();
private:
    RetryPolicy policy;
    int current{0};
};

} // namespace fencelock

#endif // FENCELOCK_RETRY_SCHEDULE_H
