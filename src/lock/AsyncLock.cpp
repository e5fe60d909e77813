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
#include "fencelock/lock/AsyncLock.hpp"
#include "fencelock/lock/Protocol.hpp"
#include "fencelock/common/Error.hpp"
#include "fencelock/common/RetrySchedule.hpp"
#include "fencelock/common/Util.hpp"
#include <boost/asio/awaitable.hpp>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>
#include <boost/asio/error.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/this_coro.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/system/error_code.hpp>
#include <spdlog/spdlog.h>
#include <chrono>
#include <expected>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <variant>
#include <vector>

namespace fencelock {

BasicLock<AsyncStore>::BasicLock(std::shared_ptr<AsyncStore> s, std::string k, std::chrono::milliseconds t)
    : LockState {std::move(k), t},
      store {std::move(s)} {}

BasicLock<AsyncStore>::BasicLock(BasicLock&& other) noexcept
    : LockState {std::move(other)},
      store {std::move(other.store)},
      pending {std::exchange(other.pending, std::nullopt)} {}

BasicLock<AsyncStore>& BasicLock<AsyncStore>::operator=(BasicLock&& other) noexcept {
    if (this != &other) {
        releaseOnScopeEnd();
        LockState::operator=(std::move(other));
        store = std::move(other.store);
        pending = std::exchange(other.pending, std::nullopt);
    }
    return *this;
}

BasicLock<AsyncStore>::~BasicLock() {
    releaseOnScopeEnd();
}

void BasicLock<AsyncStore>::releaseOnScopeEnd() {
    if (!store) {
        return;
    }
    if (lockToken.has_value() && !suppressed) {
        spawnRelease(std::exchange(lockToken, std::nullopt).value());
    } else if (pending.has_value()) {
        spdlog::warn("AsyncLock: acquisition of {} abandoned mid-flight, releasing its candidate", lockKey);
        spawnRelease(std::exchange(pending, std::nullopt).value());
    }
}

void BasicLock<AsyncStore>::spawnRelease(std::string t) {
    boost::asio::co_spawn(store->executor(), releaseDetached(store, lockKey, std::move(t)), boost::asio::detached);
}

boost::asio::awaitable<void> BasicLock<AsyncStore>::releaseDetached(std::shared_ptr<AsyncStore> s, std::string k, std::string t) {
    // Built outside the co_await: GCC 12 rejects braced lists inside it.
    std::vector<std::string> keys {k};
    std::vector<std::string> args {t};
    auto deleted = co_await s->eval(std::string{releaseScript}, std::move(keys), std::move(args));
    if (!deleted.has_value()) {
        spdlog::error("AsyncLock: automatic release of {} failed: {}", k, deleted.error().what);
        co_return;
    }
    logReleaseOutcome(k, deleted.value());
}

boost::asio::awaitable<AsyncLock::Result> BasicLock<AsyncStore>::acquire(std::shared_ptr<AsyncStore> store, std::string key, std::chrono::milliseconds ttl, std::optional<RetryPolicy> retry) {
    if (!store) {
        co_return std::unexpected {Error{ErrorCode::InvalidArg, "Lock store must not be null", key}};
    }
    auto valid = validateLockArgs(key, ttl);
    if (!valid.has_value()) {
        co_return std::unexpected {valid.error()};
    }
    RetrySchedule schedule {retry.value_or(RetryPolicy::once())};
    AsyncLock lock {std::move(store), std::move(key), ttl};
    while (true) {
        auto claimed = co_await lock.attempt();
        if (!claimed.has_value()) {
            co_return std::unexpected {claimed.error()};
        }
        if (claimed.value()) {
            spdlog::debug("AsyncLock: acquired {} on attempt {}", lock.lockKey, schedule.attempt());
            co_return std::optional<AsyncLock> {std::move(lock)};
        }
        auto delay = schedule.nextDelay();
        if (!delay.has_value()) {
            spdlog::debug("AsyncLock: {} still taken after {} attempt(s)", lock.lockKey, schedule.attempt());
            co_return std::optional<AsyncLock> {};
        }
        boost::asio::steady_timer timer {co_await boost::asio::this_coro::executor, delay.value()};
        boost::system::error_code ec;
        co_await timer.async_wait(boost::asio::redirect_error(boost::asio::use_awaitable, ec));
        if (ec == boost::asio::error::operation_aborted) {
            co_return std::unexpected {Error{ErrorCode::Cancelled, "Retry delay aborted", lock.lockKey}};
        }
        if (ec) {
            co_return std::unexpected {Error{ErrorCode::Unknown, ec.message(), lock.lockKey}};
        }
    }
}

boost::asio::awaitable<AsyncLock::Result> BasicLock<AsyncStore>::tryAcquire(std::shared_ptr<AsyncStore> store, std::string key, std::chrono::milliseconds ttl) {
    co_return co_await acquire(std::move(store), std::move(key), ttl, std::nullopt);
}

boost::asio::awaitable<std::expected<bool, Error>> BasicLock<AsyncStore>::attempt() {
    // pending stays engaged across every suspension below.
    pending = generate_token();
    auto set = co_await store->setNxPx(lockKey, pending.value(), lockTtl);
    if (set.has_value()) {
        if (set.value()) {
            lockToken = std::exchange(pending, std::nullopt);
        }
        pending.reset();
        co_return set.value();
    }
    spdlog::warn("AsyncLock: SET NX on {} failed ({}), checking whether it landed", lockKey, set.error().what);
    auto probe = co_await store->get(lockKey);
    auto settled = settleUncertainClaim(lockKey, pending.value(), set.error(), probe);
    if (!settled.has_value()) {
        pending.reset();
        co_return std::unexpected {settled.error()};
    }
    lockToken = std::exchange(pending, std::nullopt);
    co_return true;
}

boost::asio::awaitable<std::expected<std::monostate, Error>> BasicLock<AsyncStore>::release() {
    if (!lockToken.has_value()) {
        co_return std::monostate {};
    }
    // Built outside the co_await: GCC 12 rejects braced lists inside it.
    std::vector<std::string> keys {lockKey};
    std::vector<std::string> args {lockToken.value()};
    auto deleted = co_await store->eval(std::string{releaseScript}, std::move(keys), std::move(args));
    if (!deleted.has_value()) {
        co_return std::unexpected {deleted.error()};
    }
    logReleaseOutcome(lockKey, deleted.value());
    lockToken.reset();
    co_return std::monostate {};
}

} // namespace fencelock
