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
#include "StoreTestFramework/FaultyStore.hpp"
#include "fencelock/common/Error.hpp"
#include <chrono>
#include <expected>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <utility>
#include <vector>

using fencelock::Error;
using fencelock::ErrorCode;

FaultyStore::FaultyStore(std::shared_ptr<fencelock::InMemoryStore> s)
    : inner {std::move(s)} {}

std::optional<Error> FaultyStore::disconnected(const std::string& key) const {
    if (connected) {
        return std::nullopt;
    }
    return Error{ErrorCode::StoreUnavailable, "Disconnected", key};
}

void FaultyStore::delay() const {
    std::chrono::milliseconds l;
    {
        std::lock_guard g{m};
        l = latency;
    }
    if (l > std::chrono::milliseconds::zero()) {
        std::this_thread::sleep_for(l);
    }
}

std::expected<bool, Error> FaultyStore::setNxPx(const std::string& key, const std::string& value, std::chrono::milliseconds ttl) {
    ++sets;
    delay();
    if (auto e = disconnected(key)) {
        return std::unexpected {e.value()};
    }
    std::optional<std::pair<SetFault, ErrorCode>> fault;
    {
        std::lock_guard g{m};
        fault = std::exchange(setFault, std::nullopt);
    }
    if (!fault.has_value()) {
        return inner->setNxPx(key, value, ttl);
    }
    if (fault->first == SetFault::FailAfterWrite) {
        auto written = inner->setNxPx(key, value, ttl);
        if (!written.has_value()) {
            return written;
        }
        return std::unexpected {Error{fault->second, "Timeout reading reply", key}};
    }
    return std::unexpected {Error{fault->second, "Connection reset", key}};
}

std::expected<std::optional<std::string>, Error> FaultyStore::get(const std::string& key) {
    ++gets;
    delay();
    if (auto e = disconnected(key)) {
        return std::unexpected {e.value()};
    }
    std::optional<ErrorCode> fault;
    {
        std::lock_guard g{m};
        fault = std::exchange(getFault, std::nullopt);
    }
    if (fault.has_value()) {
        return std::unexpected {Error{fault.value(), "Connection reset", key}};
    }
    return inner->get(key);
}

std::expected<long long, Error> FaultyStore::eval(const std::string& script, const std::vector<std::string>& keys, const std::vector<std::string>& args) {
    ++evals;
    delay();
    auto key = keys.empty() ? std::string{} : keys.front();
    if (auto e = disconnected(key)) {
        return std::unexpected {e.value()};
    }
    std::optional<ErrorCode> fault;
    {
        std::lock_guard g{m};
        fault = std::exchange(evalFault, std::nullopt);
    }
    if (fault.has_value()) {
        return std::unexpected {Error{fault.value(), "ERR Error running script", key}};
    }
    return inner->eval(script, keys, args);
}

void FaultyStore::failNextSet(SetFault f, ErrorCode c) {
    std::lock_guard g{m};
    setFault = std::make_pair(f, c);
}

void FaultyStore::failNextGet(ErrorCode c) {
    std::lock_guard g{m};
    getFault = c;
}

void FaultyStore::failNextEval(ErrorCode c) {
    std::lock_guard g{m};
    evalFault = c;
}

void FaultyStore::disconnect() {
    connected = false;
}

void FaultyStore::connect() {
    connected = true;
}

void FaultyStore::setLatency(std::chrono::milliseconds l) {
    std::lock_guard g{m};
    latency = l;
}

int FaultyStore::setCalls() const {
    return sets;
}

int FaultyStore::getCalls() const {
    return gets;
}

int FaultyStore::evalCalls() const {
    return evals;
}
