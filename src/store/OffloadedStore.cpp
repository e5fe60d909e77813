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
#include "fencelock/store/OffloadedStore.hpp"
#include "fencelock/common/Error.hpp"
#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/awaitable.hpp>
#include <stdexcept>
#include <chrono>
#include <expected>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace fencelock {

OffloadedStore::OffloadedStore(std::shared_ptr<BlockingStore> s, boost::asio::any_io_executor blockingExecutor)
    : store {std::move(s)},
      ex {std::move(blockingExecutor)} {
    if (!store) {
        throw std::invalid_argument("OffloadedStore: blocking store must not be null");
    }
}

boost::asio::awaitable<std::expected<bool, Error>> OffloadedStore::setNxPx(std::string key, std::string value, std::chrono::milliseconds ttl) {
    // Named before the co_await: GCC 12 mis-copies a closure temporary passed
    // by value to a coroutine.
    auto call = [s = store, key = std::move(key), value = std::move(value), ttl] {
        return s->setNxPx(key, value, ttl);
    };
    co_return co_await offload(std::move(call));
}

boost::asio::awaitable<std::expected<std::optional<std::string>, Error>> OffloadedStore::get(std::string key) {
    // Named before the co_await: GCC 12 mis-copies a closure temporary passed
    // by value to a coroutine.
    auto call = [s = store, key = std::move(key)] {
        return s->get(key);
    };
    co_return co_await offload(std::move(call));
}

boost::asio::awaitable<std::expected<long long, Error>> OffloadedStore::eval(std::string script, std::vector<std::string> keys, std::vector<std::string> args) {
    // Named before the co_await: GCC 12 mis-copies a closure temporary passed
    // by value to a coroutine.
    auto call = [s = store, script = std::move(script), keys = std::move(keys), args = std::move(args)] {
        return s->eval(script, keys, args);
    };
    co_return co_await offload(std::move(call));
}

boost::asio::any_io_executor OffloadedStore::executor() {
    return ex;
}

} // namespace fencelock
