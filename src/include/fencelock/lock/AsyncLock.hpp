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
#ifndef FENCELOCK_ASYNC_LOCK_H
#define FENCELOCK_ASYNC_LOCK_H

#include "fencelock/lock/LockState.hpp"
#include "fencelock/store/AsyncStore.hpp"
#include "fencelock/common/Error.hpp"
#include "fencelock/common/RetryPolicy.hpp"
#include <boost/asio/awaitable.hpp>
#include <chrono>
#include <expected>
#include <memory>
#include <optional>
#include <string>
#include <variant>

namespace fencelock {

// Lease on one key, driven from a coroutine. Store calls and retry delays
// suspend instead of blocking.
//
// A destructor cannot co_await, so scope end only *requests* the release:
// the compare-and-delete is spawned detached on store->executor() and the
// destructor returns at once. Consequences:
//  - the key may still be present right after the handle is gone;
//  - a later acquire of the same key from this process can run before the
//    release and find the key taken;
//  - a failing release is logged and nobody else hears about it.
// Callers that need ordering co_await release() before the handle goes away.
//
// If the coroutine driving acquire() is destroyed while suspended on a SET,
// the candidate token is released the same way, so a lease granted to an
// abandoned acquisition does not linger until its TTL. The frame is only
// destroyed from the caller's executor: its context must outlive every store
// call still in flight. With OffloadedStore that means the blocking call has
// completed and its reply is queued on the caller, which shutting the
// caller's context down then discards. Destroying the caller's context while
// the blocking call still runs is undefined.
template<>
class BasicLock<AsyncStore> : public LockState {
public:
    using Result = std::expected<std::optional<BasicLock>, Error>;

    // Retry delays run on a steady_timer bound to the awaiting coroutine's
    // executor; a timer aborted by its executor yields ErrorCode::Cancelled.
    static boost::asio::awaitable<Result> acquire(std::shared_ptr<AsyncStore> store, std::string key, std::chrono::milliseconds ttl, std::optional<RetryPolicy> retry = std::nullopt);
    static boost::asio::awaitable<Result> tryAcquire(std::shared_ptr<AsyncStore> store, std::string key, std::chrono::milliseconds ttl);

    boost::asio::awaitable<std::expected<std::monostate, Error>> release();

    BasicLock(BasicLock&& other) noexcept;
    BasicLock& operator=(BasicLock&& other) noexcept;
    ~BasicLock();
private:
    BasicLock(std::shared_ptr<AsyncStore> s, std::string k, std::chrono::milliseconds t);
    boost::asio::awaitable<std::expected<bool, Error>> attempt();
    void releaseOnScopeEnd();
    void spawnRelease(std::string t);
    static boost::asio::awaitable<void> releaseDetached(std::shared_ptr<AsyncStore> s, std::string k, std::string t);
    std::shared_ptr<AsyncStore> store;
    // Token of the SET currently awaiting its reply.
    std::optional<std::string> pending;
};

using AsyncLock = BasicLock<AsyncStore>;

} // namespace fencelock

#endif // FENCELOCK_ASYNC_LOCK_H
