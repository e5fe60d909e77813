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
#include "StoreTestFramework/StalledStore.hpp"
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/this_coro.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <chrono>
#include <utility>

using fencelock::Error;

StalledStore::StalledStore(std::shared_ptr<fencelock::InMemoryStore> s, boost::asio::any_io_executor background)
    : inner {std::move(s)},
      ex {std::move(background)} {}

boost::asio::awaitable<std::expected<bool, Error>> StalledStore::setNxPx(std::string key, std::string value, std::chrono::milliseconds ttl) {
    auto written = inner->setNxPx(key, value, ttl);
    boost::asio::steady_timer never {co_await boost::asio::this_coro::executor, std::chrono::hours{1}};
    co_await never.async_wait(boost::asio::use_awaitable);
    co_return written;
}

boost::asio::awaitable<std::expected<std::optional<std::string>, Error>> StalledStore::get(std::string key) {
    co_return inner->get(key);
}

boost::asio::awaitable<std::expected<long long, Error>> StalledStore::eval(std::string script, std::vector<std::string> keys, std::vector<std::string> args) {
    co_return inner->eval(script, keys, args);
}

boost::asio::any_io_executor StalledStore::executor() {
    return ex;
}
