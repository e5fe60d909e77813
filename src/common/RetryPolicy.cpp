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
#include "fencelock/common/RetryPolicy.hpp"
#include <stdexcept>
#include <chrono>

namespace fencelock {

RetryPolicy::RetryPolicy(int a, std::chrono::milliseconds i)
    : attempts(a),
      interval(i) {
    if (a < 1) {
        throw std::invalid_argument("Attempts must be >= one.");
    }
    if (i < std::chrono::milliseconds::zero()) {
        throw std::invalid_argument("Retry interval must be >= zero.");
    }
}

RetryPolicy RetryPolicy::once() {
    return RetryPolicy{1, std::chrono::milliseconds::zero()};
}

} // namespace fencelock
