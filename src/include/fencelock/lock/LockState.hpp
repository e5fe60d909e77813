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
#ifndef FENCELOCK_LOCK_STATE_HPP
#define FENCELOCK_LOCK_STATE_HPP

#include <chrono>
#include <optional>
#include <string>

namespace fencelock {

// A lock handle over a store with the capability set Store. Only the
// specializations for BlockingStore (Lock) and AsyncStore (AsyncLock) exist.
template<typename Store>
class BasicLock;

// What a handle knows about its lease, independent of how the store is
// reached. A handle is held while token() is engaged. Once engaged the token
// only ever goes back to empty.
class LockState {
public:
    [[nodiscard]] bool held() const;
    [[nodiscard]] const std::string& key() const;
    [[nodiscard]] std::chrono::milliseconds ttl() const;
    [[nodiscard]] const std::optional<std::string>& token() const;

    // Scope end leaves the key alone; it expires with its TTL instead.
    // release() still works.
    void suppressAutoRelease();
    [[nodiscard]] bool autoReleaseSuppressed() const;
protected:
    LockState(std::string k, std::chrono::milliseconds t);
    LockState(const LockState&) = delete;
    LockState& operator=(const LockState&) = delete;
    LockState(LockState&& other) noexcept;
    LockState& operator=(LockState&& other) noexcept;
    ~LockState() = default;

    std::string lockKey;
    std::chrono::milliseconds lockTtl;
    std::optional<std::string> lockToken;
    bool suppressed {false};
};

} // namespace fencelock

#endif // FENCELOCK_LOCK_STATE_HPP
