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
#ifndef STALLED_STORE_H
#define STALLED_STORE_H

#include "fencelock/store/AsyncStore.hpp"
#include "fencelock/store/InMemoryStore.hpp"
#include "fencelock/common/Error.hpp"
#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/awaitable.hpp>
#include <chrono>
#include <expected>
#include <memory>
#include <optional>
#include <string>
#include <vector>

// AsyncStore whose SET NX writes the key and then never replies, leaving the
// caller suspended until its executor goes away. GET and EVAL answer at once.
// Detached work lands on the background executor.
class StalledStore : public fencelock::AsyncStore {
public:
    StalledStore(std::shared_ptr<fencelock::InMemoryStore> s, boost::asio::any_io_executor background);

    boost::asio::awaitable<std::expected<bool, fencelock::Error>> setNxPx(std::string key, std::string value, std::chrono::milliseconds ttl) override;
    boost::asio::awaitable<std::expected<std::optional<std::string>, fencelock::Error>> get(std::string key) override;
    boost::asio::awaitable<std::expected<long long, fencelock::Error>> eval(std::string script, std::vector<std::string> keys, std::vector<std::string> args) override;
    boost::asio::any_io_executor executor() override;

    const std::shared_ptr<fencelock::InMemoryStore> inner;
private:
    boost::asio::any_io_executor ex;
};

#endif // STALLED_STORE_H
