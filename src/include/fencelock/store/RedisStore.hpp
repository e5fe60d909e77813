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
#ifndef FENCELOCK_REDIS_STORE_H
#define FENCELOCK_REDIS_STORE_H

#include "fencelock/store/BlockingStore.hpp"
#include "fencelock/store/StoreConfig.hpp"
#include "fencelock/common/Error.hpp"
#include <sw/redis++/redis++.h>
#include <chrono>
#include <expected>
#include <memory>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace fencelock {

sw::redis::ConnectionOptions toConnectionOptions(const Endpoint& endpoint, const Timeouts& timeouts);
sw::redis::ConnectionPoolOptions toPoolOptions(const PoolOptions& pool);

// BlockingStore over a pooled redis-plus-plus client. Client is either
// sw::redis::Redis (one node) or sw::redis::RedisCluster (a cluster used as
// a single logical endpoint).
template<typename Client>
class RedisStore : public BlockingStore {
public:
    RedisStore(const sw::redis::ConnectionOptions& options, const sw::redis::ConnectionPoolOptions& pool);
    RedisStore(const RedisStore&) = delete;
    RedisStore& operator=(const RedisStore&) = delete;

    std::expected<bool, Error> setNxPx(const std::string& key, const std::string& value, std::chrono::milliseconds ttl) override;
    std::expected<std::optional<std::string>, Error> get(const std::string& key) override;
    std::expected<long long, Error> eval(const std::string& script, const std::vector<std::string>& keys, const std::vector<std::string>& args) override;
    [[nodiscard]] std::expected<std::monostate, Error> ping();
private:
    Client client;
};

extern template class RedisStore<sw::redis::Redis>;
extern template class RedisStore<sw::redis::RedisCluster>;

using SingleRedisStore = RedisStore<sw::redis::Redis>;
using ClusterRedisStore = RedisStore<sw::redis::RedisCluster>;

// Builds the client StoreConfig::mode asks for and checks it answers PING.
std::expected<std::shared_ptr<BlockingStore>, Error> openBlockingStore(const StoreConfig& config);

} // namespace fencelock

#endif // FENCELOCK_REDIS_STORE_H
