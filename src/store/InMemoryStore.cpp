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
#include "fencelock/store/InMemoryStore.hpp"
#include "fencelock/lock/Protocol.hpp"
#include "fencelock/common/Error.hpp"
#include <expected>
#include <string>
#include <shared_mutex>
#include <mutex>
#include <cstddef>
#include <chrono>
#include <optional>
#include <vector>
#include <unordered_map>

namespace fencelock {

InMemoryStore::InMemoryStore() : store{}, m{} {}

bool InMemoryStore::live(const Entry& entry, Clock::time_point now) {
    return !entry.expiresAt.has_value() || entry.expiresAt.value() > now;
}

std::expected<bool, Error> InMemoryStore::setNxPx(const std::string& key, const std::string& value, std::chrono::milliseconds ttl) {
    if (ttl <= std::chrono::milliseconds::zero()) {
        return std::unexpected {Error{ErrorCode::InvalidArg, "invalid expire time in 'set' command", key}};
    }
    const std::unique_lock lock {m};
    auto now = Clock::now();
    auto i = store.find(key);
    if (i != store.end() && live(i->second, now)) {
        return false;
    }
    store.insert_or_assign(key, Entry{value, now + ttl});
    countWriteLocked(now);
    return true;
}

std::expected<std::optional<std::string>, Error> InMemoryStore::get(const std::string& key) {
    {
        const std::shared_lock lock {m};
        auto i = store.find(key);
        if (i == store.end()) {
            return std::nullopt;
        }
        if (live(i->second, Clock::now())) {
            return i->second.value;
        }
    }
    const std::unique_lock lock {m};
    auto i = store.find(key);
    if (i != store.end() && !live(i->second, Clock::now())) {
        store.erase(i);
    }
    return std::nullopt;
}

std::expected<long long, Error> InMemoryStore::eval(const std::string& script, const std::vector<std::string>& keys, const std::vector<std::string>& args) {
    if (script != releaseScript) {
        return std::unexpected {Error{ErrorCode::ScriptExecutionFailed, "NOSCRIPT only the release script is supported"}};
    }
    if (keys.size() != 1 || args.size() != 1) {
        return std::unexpected {Error{ErrorCode::ScriptExecutionFailed, "release script expects one key and one argument"}};
    }
    const std::unique_lock lock {m};
    auto i = store.find(keys.front());
    if (i == store.end()) {
        return 0;
    }
    if (!live(i->second, Clock::now())) {
        store.erase(i);
        return 0;
    }
    if (i->second.value != args.front()) {
        return 0;
    }
    store.erase(i);
    return 1;
}

void InMemoryStore::put(const std::string& key, const std::string& value, std::chrono::milliseconds ttl) {
    const std::unique_lock lock {m};
    auto now = Clock::now();
    std::optional<Clock::time_point> expiresAt;
    if (ttl > std::chrono::milliseconds::zero()) {
        expiresAt = now + ttl;
    }
    store.insert_or_assign(key, Entry{value, expiresAt});
    countWriteLocked(now);
}

bool InMemoryStore::erase(const std::string& key) {
    const std::unique_lock lock {m};
    auto i = store.find(key);
    if (i == store.end()) {
        return false;
    }
    auto wasLive = live(i->second, Clock::now());
    store.erase(i);
    return wasLive;
}

std::optional<std::chrono::milliseconds> InMemoryStore::ttl(const std::string& key) const {
    const std::shared_lock lock {m};
    auto now = Clock::now();
    auto i = store.find(key);
    if (i == store.end() || !live(i->second, now) || !i->second.expiresAt.has_value()) {
        return std::nullopt;
    }
    return std::chrono::duration_cast<std::chrono::milliseconds>(i->second.expiresAt.value() - now);
}

size_t InMemoryStore::size() const {
    const std::shared_lock lock {m};
    auto now = Clock::now();
    size_t n = 0;
    for (const auto& [key, entry] : store) {
        if (live(entry, now)) {
            ++n;
        }
    }
    return n;
}

size_t InMemoryStore::purgeExpired() {
    const std::unique_lock lock {m};
    return sweepLocked(Clock::now());
}

size_t InMemoryStore::sweepLocked(Clock::time_point now) {
    return std::erase_if(store, [now](const auto& item) {
        return !live(item.second, now);
    });
}

void InMemoryStore::countWriteLocked(Clock::time_point now) {
    if (++writes % sweepEvery == 0) {
        sweepLocked(now);
    }
}

} // namespace fencelock
