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
#include "fencelock/store/StoreConfig.hpp"
#include <algorithm>
#include <cctype>
#include <chrono>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

namespace fencelock {

namespace {

int parseNumber(std::string_view text, const std::string& what, const std::string& dsn) {
    if (text.empty() || text.size() > 9 || !std::all_of(text.begin(), text.end(), [](unsigned char c) { return std::isdigit(c); })) {
        throw std::invalid_argument("Invalid " + what + " in DSN: " + dsn);
    }
    return std::stoi(std::string{text});
}

} // namespace

Endpoint parseEndpoint(const std::string& dsn) {
    std::string_view rest {dsn};
    if (rest.starts_with("redis://")) {
        rest.remove_prefix(8);
    } else if (rest.starts_with("tcp://")) {
        rest.remove_prefix(6);
    } else {
        throw std::invalid_argument("Unsupported DSN scheme: " + dsn);
    }

    Endpoint endpoint;
    auto at = rest.rfind('@');
    if (at != std::string_view::npos) {
        auto userinfo = rest.substr(0, at);
        auto colon = userinfo.find(':');
        if (colon == std::string_view::npos) {
            endpoint.password = std::string{userinfo};
        } else {
            endpoint.user = std::string{userinfo.substr(0, colon)};
            endpoint.password = std::string{userinfo.substr(colon + 1)};
        }
        rest.remove_prefix(at + 1);
    }

    auto slash = rest.find('/');
    if (slash != std::string_view::npos) {
        auto db = rest.substr(slash + 1);
        if (!db.empty()) {
            endpoint.db = parseNumber(db, "database", dsn);
        }
        rest = rest.substr(0, slash);
    }

    auto colon = rest.rfind(':');
    if (colon != std::string_view::npos) {
        endpoint.port = parseNumber(rest.substr(colon + 1), "port", dsn);
        if (endpoint.port < 1 || endpoint.port > 65535) {
            throw std::invalid_argument("Port out of range in DSN: " + dsn);
        }
        rest = rest.substr(0, colon);
    }

    if (rest.empty()) {
        throw std::invalid_argument("Missing host in DSN: " + dsn);
    }
    endpoint.host = std::string{rest};
    return endpoint;
}

std::vector<Endpoint> StoreConfig::parseAll(const std::vector<std::string>& dsns) {
    if (dsns.empty()) {
        throw std::invalid_argument("StoreConfig: No endpoints provided");
    }
    std::vector<Endpoint> result;
    result.reserve(dsns.size());
    for (const auto& dsn : dsns) {
        result.push_back(parseEndpoint(dsn));
    }
    return result;
}

StoreConfig::StoreConfig(const std::vector<std::string>& dsns, Mode m, PoolOptions p, Timeouts t)
    : endpoints {parseAll(dsns)},
      mode {m},
      pool {p},
      timeouts {t} {
    if (pool.size == 0) {
        throw std::invalid_argument("Pool size must be > zero.");
    }
    if (pool.waitTimeout < std::chrono::milliseconds::zero()) {
        throw std::invalid_argument("Pool wait timeout must be >= zero.");
    }
    if (pool.connectionLifetime < std::chrono::milliseconds::zero()) {
        throw std::invalid_argument("Connection lifetime must be >= zero.");
    }
    if (pool.connectionIdleTime < std::chrono::milliseconds::zero()) {
        throw std::invalid_argument("Connection idle time must be >= zero.");
    }
    if (timeouts.connect < std::chrono::milliseconds::zero()) {
        throw std::invalid_argument("Connect timeout must be >= zero.");
    }
    if (timeouts.socket < std::chrono::milliseconds::zero()) {
        throw std::invalid_argument("Socket timeout must be >= zero.");
    }
    if (mode == Mode::Cluster) {
        for (const auto& e : endpoints) {
            if (e.db != 0) {
                throw std::invalid_argument("Cluster endpoints must use database 0.");
            }
        }
    }
}

} // namespace fencelock
