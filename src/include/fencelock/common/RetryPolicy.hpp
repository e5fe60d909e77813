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
#ifndef FENCELOCK_RETRY_POLICY_H
#define FENCELOCK_RETRY_POLICY_H

#include <chrono>

namespace fencelock {

// How many times acquisition is attempted and how long to wait between
// two consecutive attempts. A single attempt is {1, 0ms}.
struct RetryPolicy {
    RetryPolicy(int a, std::chrono::milliseconds i);
    static RetryPolicy once();
    int attempts;
    std::chrono::milliseconds interval;
};

} // namespace fencelock

#endif // FENCELOCK_RETRY_POLICY_H
