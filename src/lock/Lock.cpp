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
#include "fencelock/lock/Lock.hpp"
#include "fencelock/lock/Protocol.hpp"
#include "fencelock/common/Error.hpp"
#include "fencelock/common/RetrySchedule.hpp"
#include "fencelock/common/Util.hpp"
#include <spdlog/spdlog.h>
#include <chrono>
#include <expected>
#include <memory>
#include <optional>
#include <string>
#include <thread>
#include <utility>
#include <variant>

namespace fencelock {

BasicLock<BlockingStore>::BasicLock(std::shared_ptr<BlockingStore> s, std::string k, std::chrono::milliseconds t)
    : LockState {std::move(k), t},
      store {std::move(s)} {}

BasicLock<BlockingStore>::BasicLock(BasicLock&& other) noexcept
    : LockState {std::move(other)},
      store {std::move(other.store)} {}

BasicLock<BlockingStore>& BasicLock<BlockingStore>::operator=(BasicLock&& other) noexcept {
    if (this != &other) {
        releaseOnScopeEnd();
        LockState::operator=(std::move(other));
        store = std::move(other.store);
    }
    return *this;
}

BasicLock<BlockingStore>::~BasicLock() {
    releaseOnScopeEnd();
}

void BasicLock<BlockingStore>::releaseOnScopeEnd() {
    if (!lockToken.has_value() || suppressed) {
        return;
    }
    auto released = release();
    if (!released.has_value()) {
        spdlog::error("Lock: automatic release of {} failed: {}", lockKey, released.error().what);
    }
}

Lock::Result BasicLock<BlockingStore>::acquire(std::shared_ptr<BlockingStore> store, std::string key, std::chrono::milliseconds ttl, std::optional<RetryPolicy> retry) {
    if (!store) {
        return std::unexpected {Error{ErrorCode::InvalidArg, "Lock store must not be null", key}};
    }
    auto valid = validateLockArgs(key, ttl);
    if (!valid.has_value()) {
        return std::unexpected {valid.error()};
    }
    RetrySchedule schedule {retry.value_or(RetryPolicy::once())};
    Lock lock {std::move(store), std::move(key), ttl};
    while (true) {
        auto claimed = lock.attempt();
        if (!claimed.has_value()) {
            return std::unexpected {claimed.error()};
        }
        if (claimed.value()) {
            spdlog::debug("Lock: acquired {} on attempt {}", lock.lockKey, schedule.attempt());
            return std::optional<Lock> {std::move(lock)};
        }
        auto delay = schedule.nextDelay();
        if (!delay.has_value()) {
            spdlog::debug("Lock: {} still taken after {} attempt(s)", lock.lockKey, schedule.attempt());
            return std::optional<Lock> {};
        }
        std::this_thread::sleep_for(delay.value());
    }
    std::unreachable();
}

Lock::Result BasicLock<BlockingStore>::tryAcquire(std::shared_ptr<BlockingStore> store, std::string key, std::chrono::milliseconds ttl) {
    return acquire(std::move(store), std::move(key), ttl, std::nullopt);
}

std::expected<bool, Error> BasicLock<BlockingStore>::attempt() {
    auto candidate = generate_token();
    auto set = store->setNxPx(lockKey, candidate, lockTtl);
    if (set.has_value()) {
        if (set.value()) {
            lockToken = std::move(candidate);
        }
        return set.value();
    }
    spdlog::warn("Lock: SET NX on {} failed ({}), checking whether it landed", lockKey, set.error().what);
    auto settled = settleUncertainClaim(lockKey, candidate, set.error(), store->get(lockKey));
    if (!settled.has_value()) {
        return std::unexpected {settled.error()};
    }
    lockToken = std::move(candidate);
    return true;
}

std::expected<std::monostate, Error> BasicLock<BlockingStore>::release() {
    if (!lockToken.has_value()) {
        return {};
    }
    auto deleted = store->eval(std::string{releaseScript}, {lockKey}, {lockToken.value()});
    if (!deleted.has_value()) {
        return std::unexpected {deleted.error()};
    }
    logReleaseOutcome(lockKey, deleted.value());
    lockToken.reset();
    return {};
}

} // namespace fencelock
