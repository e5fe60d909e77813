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
#ifndef FENCELOCK_STORE_CONFIG_H
#define FENCELOCK_STORE_CONFIG_H

#include <chrono>
#include <cstddef>
#include <string>
#include <vector>

namespace fencelock {

struct Endpoint {
    std::string host;
    int port = 6379;
    std::string user;
    std::string password;
    int db = 0;
};

// Parses redis://[[user:]password@]host[:port][/db]; tcp:// is accepted too.
// Throws std::invalid_argument on a malformed DSN.
Endpoint parseEndpoint(const std::string& dsn);

struct PoolOptions {
    std::size_t size = 100;
    std::chrono::milliseconds waitTimeout{0};
    std::chrono::milliseconds connectionLifetime{0};
    std::chrono::milliseconds connectionIdleTime{0};
};

struct Timeouts {
    std::chrono::milliseconds connect{10000};
    std::chrono::milliseconds socket{0};
};

class StoreConfig {
public:
    enum class Mode : char {
        Single,
        Cluster
    };
    StoreConfig(const std::vector<std::string>& dsns, Mode m = Mode::Single, PoolOptions p = {}, Timeouts t = {});
    const std::vector<Endpoint> endpoints;
    const Mode mode;
    const PoolOptions pool;
    const Timeouts timeouts;
private:
    static std::vector<Endpoint> parseAll(const std::vector<std::string>& dsns);
};

} // namespace fencelock

#endif // FENCELOCK_STORE_CONFIG_H
