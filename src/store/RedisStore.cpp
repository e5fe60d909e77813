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
#include "fencelock/store/RedisStore.hpp"
#include "fencelock/store/StoreConfig.hpp"
#include "fencelock/common/Error.hpp"
#include "fencelock/common/ErrorConverter.hpp"
#include <sw/redis++/redis++.h>
#include <spdlog/spdlog.h>
#include <chrono>
#include <expected>
#include <memory>
#include <optional>
#include <string>
#include <type_traits>
#include <variant>
#include <vector>

namespace fencelock {

sw::redis::ConnectionOptions toConnectionOptions(const Endpoint& endpoint, const Timeouts& timeouts) {
    sw::redis::ConnectionOptions options;
    options.host = endpoint.host;
    options.port = endpoint.port;
    if (!endpoint.user.empty()) {
        options.user = endpoint.user;
    }
    options.password = endpoint.password;
    options.db = endpoint.db;
    options.connect_timeout = timeouts.connect;
    options.socket_timeout = timeouts.socket;
    return options;
}

sw::redis::ConnectionPoolOptions toPoolOptions(const PoolOptions& pool) {
    sw::redis::ConnectionPoolOptions options;
    options.size = pool.size;
    options.wait_timeout = pool.waitTimeout;
    options.connection_lifetime = pool.connectionLifetime;
    options.connection_idle_time = pool.connectionIdleTime;
    return options;
}

template<typename Client>
RedisStore<Client>::RedisStore(const sw::redis::ConnectionOptions& options, const sw::redis::ConnectionPoolOptions& pool)
    : client {options, pool} {}

template<typename Client>
std::expected<bool, Error> RedisStore<Client>::setNxPx(const std::string& key, const std::string& value, std::chrono::milliseconds ttl) {
    try {
        return client.set(key, value, ttl, sw::redis::UpdateType::NOT_EXIST);
    } catch (const sw::redis::Error& e) {
        return std::unexpected {toError(e, key)};
    }
}

template<typename Client>
std::expected<std::optional<std::string>, Error> RedisStore<Client>::get(const std::string& key) {
    try {
        auto reply = client.get(key);
        if (!reply) {
            return std::nullopt;
        }
        return std::optional<std::string> {*reply};
    } catch (const sw::redis::Error& e) {
        return std::unexpected {toError(e, key)};
    }
}

template<typename Client>
std::expected<long long, Error> RedisStore<Client>::eval(const std::string& script, const std::vector<std::string>& keys, const std::vector<std::string>& args) {
    auto key = keys.empty() ? std::string{} : keys.front();
    try {
        return client.template eval<long long>(script, keys.begin(), keys.end(), args.begin(), args.end());
    } catch (const sw::redis::Error& e) {
        return std::unexpected {toScriptError(e, key)};
    }
}

template<typename Client>
std::expected<std::monostate, Error> RedisStore<Client>::ping() {
    try {
        if constexpr (std::is_same_v<Client, sw::redis::RedisCluster>) {
            client.redis("fencelock", false).ping();
        } else {
            client.ping();
        }
        return {};
    } catch (const sw::redis::Error& e) {
        return std::unexpected {toError(e, "")};
    }
}

template class RedisStore<sw::redis::Redis>;
template class RedisStore<sw::redis::RedisCluster>;

namespace {

template<typename Store>
std::expected<std::shared_ptr<BlockingStore>, Error> open(const sw::redis::ConnectionOptions& options, const sw::redis::ConnectionPoolOptions& pool) {
    std::shared_ptr<Store> store;
    try {
        store = std::make_shared<Store>(options, pool);
    } catch (const sw::redis::Error& e) {
        return std::unexpected {toError(e, "")};
    }
    auto pong = store->ping();
    if (!pong.has_value()) {
        return std::unexpected {pong.error()};
    }
    return store;
}

} // namespace

std::expected<std::shared_ptr<BlockingStore>, Error> openBlockingStore(const StoreConfig& config) {
    const auto& first = config.endpoints.front();
    auto options = toConnectionOptions(first, config.timeouts);
    auto pool = toPoolOptions(config.pool);
    std::expected<std::shared_ptr<BlockingStore>, Error> store = std::unexpected {Error{ErrorCode::Unknown}};
    if (config.mode == StoreConfig::Mode::Cluster) {
        // Every seed is tried until one hands out the slot map.
        for (const auto& endpoint : config.endpoints) {
            store = open<ClusterRedisStore>(toConnectionOptions(endpoint, config.timeouts), pool);
            if (store.has_value()) {
                spdlog::info("Connected to cluster @ {}:{}", endpoint.host, endpoint.port);
                return store;
            }
            spdlog::warn("Could not connect to cluster seed @ {}:{}: {}", endpoint.host, endpoint.port, store.error().what);
        }
        return store;
    }
    store = open<SingleRedisStore>(options, pool);
    if (store.has_value()) {
        spdlog::info("Connected to store @ {}:{}/{}", first.host, first.port, first.db);
    } else {
        spdlog::warn("Could not connect to store @ {}:{}: {}", first.host, first.port, store.error().what);
    }
    return store;
}

} // namespace fencelock
