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
#ifndef FENCELOCK_BLOCKING_STORE_HPP
#define FENCELOCK_BLOCKING_STORE_HPP

#include "fencelock/common/Error.hpp"
#include <chrono>
#include <expected>
#include <optional>
#include <string>
#include <vector>

namespace fencelock {

// The commands a lock needs from a key-value store, issued on the calling
// thread. Implementations must be safe to share between threads.
class BlockingStore {
public:
    virtual ~BlockingStore() = default;

    // SET key value NX PX ttl. true if the key was created.
    virtual std::expected<bool, Error> setNxPx(const std::string& key, const std::string& value, std::chrono::milliseconds ttl) = 0;
    virtual std::expected<std::optional<std::string>, Error> get(const std::string& key) = 0;
    virtual std::expected<long long, Error> eval(const std::string& script, const std::vector<std::string>& keys, const std::vector<std::string>& args) = 0;
};

} // namespace fencelock

#endif // FENCELOCK_BLOCKING_STORE_HPP
