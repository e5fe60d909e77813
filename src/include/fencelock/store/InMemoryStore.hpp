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
#ifndef FENCELOCK_IN_MEMORY_STORE_H
#define FENCELOCK_IN_MEMORY_STORE_H

#include <string>
#include <unordered_map>
#include <shared_mutex>
#include <chrono>
#include <expected>
#include <optional>
#include <vector>
#include "fencelock/common/Error.hpp"
#include "fencelock/store/BlockingStore.hpp"

namespace fencelock {

// Process-local store with Redis expiry semantics. eval only understands the
// compare-and-delete release script.
class InMemoryStore : public BlockingStore {
public:
    using Clock = std::chrono::steady_clock;

    InMemoryStore();
    std::expected<bool, Error> setNxPx(const std::string& key, const std::string& value, std::chrono::milliseconds ttl) override;
    std::expected<std::optional<std::string>, Error> get(const std::string& key) override;
    std::expected<long long, Error> eval(const std::string& script, const std::vector<std::string>& keys, const std::vector<std::string>& args) override;

    // Unconditional SET; a zero ttl means no expiry.
    void put(const std::string& key, const std::string& value, std::chrono::milliseconds ttl = std::chrono::milliseconds::zero());
    bool erase(const std::string& key);
    // Remaining time to live; nullopt if the key is absent or never expires.
    std::optional<std::chrono::milliseconds> ttl(const std::string& key) const;
    size_t size() const;
    // Drops every expired entry and returns how many went. Writes also do
    // this every sweepEvery calls; reads drop the expired key they hit.
    size_t purgeExpired();

    static constexpr size_t sweepEvery = 256;
private:
    struct Entry {
        std::string value;
        std::optional<Clock::time_point> expiresAt;
    };
    static bool live(const Entry& entry, Clock::time_point now);
    size_t sweepLocked(Clock::time_point now);
    void countWriteLocked(Clock::time_point now);
    std::unordered_map<std::string, Entry> store;
    size_t writes {0};
    mutable std::shared_mutex m;
};

} // namespace fencelock

#endif // FENCELOCK_IN_MEMORY_STORE_H
