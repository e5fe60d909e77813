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
#ifndef FENCELOCK_ASYNC_STORE_HPP
#define FENCELOCK_ASYNC_STORE_HPP

#include "fencelock/common/Error.hpp"
#include <utility>
#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/awaitable.hpp>
#include <chrono>
#include <expected>
#include <optional>
#include <string>
#include <vector>

namespace fencelock {

// Non-blocking counterpart of BlockingStore. Every command is a suspension
// point; arguments are taken by value because they must outlive the caller's
// stack frame while the coroutine is suspended.
class AsyncStore {
public:
    virtual ~AsyncStore() = default;

    virtual boost::asio::awaitable<std::expected<bool, Error>> setNxPx(std::string key, std::string value, std::chrono::milliseconds ttl) = 0;
    virtual boost::asio::awaitable<std::expected<std::optional<std::string>, Error>> get(std::string key) = 0;
    virtual boost::asio::awaitable<std::expected<long long, Error>> eval(std::string script, std::vector<std::string> keys, std::vector<std::string> args) = 0;

    // Where detached work on behalf of this store (scope-end release) runs.
    virtual boost::asio::any_io_executor executor() = 0;
};

} // namespace fencelock

#endif // FENCELOCK_ASYNC_STORE_HPP
