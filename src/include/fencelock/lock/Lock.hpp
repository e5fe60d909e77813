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
#ifndef FENCELOCK_LOCK_H
#define FENCELOCK_LOCK_H

#include "fencelock/lock/LockState.hpp"
#include "fencelock/store/BlockingStore.hpp"
#include "fencelock/common/Error.hpp"
#include "fencelock/common/RetryPolicy.hpp"
#include <chrono>
#include <expected>
#include <memory>
#include <optional>
#include <string>
#include <variant>

namespace fencelock {

// Lease on one key, driven from the calling thread. Retry delays put the
// thread to sleep.
//
// Scope end releases the lease synchronously unless suppressAutoRelease()
// was called; a failure there is logged and dropped. Call release() to see
// the outcome.
template<>
class BasicLock<BlockingStore> : public LockState {
public:
    // An engaged optional is a held lock, an empty one means every attempt
    // found the key taken.
    using Result = std::expected<std::optional<BasicLock>, Error>;

    // Tries up to retry->attempts times, sleeping retry->interval between
    // attempts. Without a policy this is tryAcquire. Store errors abort the
    // loop.
    static Result acquire(std::shared_ptr<BlockingStore> store, std::string key, std::chrono::milliseconds ttl, std::optional<RetryPolicy> retry = std::nullopt);
    static Result tryAcquire(std::shared_ptr<BlockingStore> store, std::string key, std::chrono::milliseconds ttl);

    // Deletes the key only if it still holds our token. Idempotent. On error
    // the handle stays held so the call can be repeated.
    std::expected<std::monostate, Error> release();

    BasicLock(BasicLock&& other) noexcept;
    BasicLock& operator=(BasicLock&& other) noexcept;
    ~BasicLock();
private:
    BasicLock(std::shared_ptr<BlockingStore> s, std::string k, std::chrono::milliseconds t);
    std::expected<bool, Error> attempt();
    void releaseOnScopeEnd();
    std::shared_ptr<BlockingStore> store;
};

using Lock = BasicLock<BlockingStore>;

} // namespace fencelock

#endif // FENCELOCK_LOCK_H
