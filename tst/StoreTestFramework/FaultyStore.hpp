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
#ifndef FAULTY_STORE_H
#define FAULTY_STORE_H

#include "fencelock/store/BlockingStore.hpp"
#include "fencelock/store/InMemoryStore.hpp"
#include "fencelock/common/Error.hpp"
#include <atomic>
#include <chrono>
#include <expected>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <utility>
#include <vector>

// Wraps an InMemoryStore and injects failures into the next call of each
// command. A failed SET can be made to land anyway, the way a reply lost on
// the wire leaves the key written.
class FaultyStore : public fencelock::BlockingStore {
public:
    enum class SetFault : char {
        FailBeforeWrite,
        FailAfterWrite
    };

    explicit FaultyStore(std::shared_ptr<fencelock::InMemoryStore> s);

    std::expected<bool, fencelock::Error> setNxPx(const std::string& key, const std::string& value, std::chrono::milliseconds ttl) override;
    std::expected<std::optional<std::string>, fencelock::Error> get(const std::string& key) override;
    std::expected<long long, fencelock::Error> eval(const std::string& script, const std::vector<std::string>& keys, const std::vector<std::string>& args) override;

    void failNextSet(SetFault f, fencelock::ErrorCode c = fencelock::ErrorCode::StoreUnavailable);
    void failNextGet(fencelock::ErrorCode c = fencelock::ErrorCode::StoreUnavailable);
    void failNextEval(fencelock::ErrorCode c = fencelock::ErrorCode::StoreUnavailable);
    // Every command fails with StoreUnavailable until connect().
    void disconnect();
    void connect();
    // Sleeps before each command.
    void setLatency(std::chrono::milliseconds l);

    int setCalls() const;
    int getCalls() const;
    int evalCalls() const;

    const std::shared_ptr<fencelock::InMemoryStore> inner;
private:
    std::optional<fencelock::Error> disconnected(const std::string& key) const;
    void delay() const;
    mutable std::mutex m;
    std::optional<std::pair<SetFault, fencelock::ErrorCode>> setFault;
    std::optional<fencelock::ErrorCode> getFault;
    std::optional<fencelock::ErrorCode> evalFault;
    std::chrono::milliseconds latency {0};
    std::atomic<bool> connected {true};
    std::atomic<int> sets {0};
    std::atomic<int> gets {0};
    std::atomic<int> evals {0};
};

#endif // FAULTY_STORE_H
