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
#ifndef FENCELOCK_OFFLOADED_STORE_H
#define FENCELOCK_OFFLOADED_STORE_H

#include "fencelock/store/AsyncStore.hpp"
#include "fencelock/store/BlockingStore.hpp"
#include "fencelock/common/Error.hpp"
#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/awaitable.hpp>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <chrono>
#include <exception>
#include <expected>
#include <memory>
#include <optional>
#include <string>
#include <type_traits>
#include <utility>
#include <vector>

namespace fencelock {

// Runs a BlockingStore on a dedicated executor (typically a
// boost::asio::thread_pool) and resumes the awaiting coroutine on its own
// executor, so callers never block their worker on store I/O.
//
// The blocking executor must outlive this store and every lock acquired
// through it; scope-end releases are spawned onto it. The awaiting
// coroutine's executor must outlive each call it awaits: the reply is
// dispatched to it from the blocking executor.
class OffloadedStore : public AsyncStore {
public:
    OffloadedStore(std::shared_ptr<BlockingStore> s, boost::asio::any_io_executor blockingExecutor);
    OffloadedStore(const OffloadedStore&) = delete;
    OffloadedStore& operator=(const OffloadedStore&) = delete;

    boost::asio::awaitable<std::expected<bool, Error>> setNxPx(std::string key, std::string value, std::chrono::milliseconds ttl) override;
    boost::asio::awaitable<std::expected<std::optional<std::string>, Error>> get(std::string key) override;
    boost::asio::awaitable<std::expected<long long, Error>> eval(std::string script, std::vector<std::string> keys, std::vector<std::string> args) override;
    boost::asio::any_io_executor executor() override;
private:
    // Takes the call by value so it lives in the coroutine frame, never in
    // a lambda closure the frame outlives.
    template<typename F, typename R>
    static boost::asio::awaitable<R> invokeOn(F f) {
        try {
            co_return f();
        } catch (const std::exception& e) {
            co_return std::unexpected {Error{ErrorCode::Unknown, e.what()}};
        }
    }

    template<typename F, typename R = std::invoke_result_t<F&>>
    boost::asio::awaitable<R> offload(F f) {
        co_return co_await boost::asio::co_spawn(ex, invokeOn<F, R>(std::move(f)), boost::asio::use_awaitable);
    }
    std::shared_ptr<BlockingStore> store;
    boost::asio::any_io_executor ex;
};

} // namespace fencelock

#endif // FENCELOCK_OFFLOADED_STORE_H
