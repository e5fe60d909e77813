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
#include <gtest/gtest.h>
#include <boost/asio/awaitable.hpp>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/thread_pool.hpp>
#include <boost/asio/use_future.hpp>
#include <chrono>
#include <expected>
#include <optional>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>
#include <future>
#include "fencelock/store/OffloadedStore.hpp"
#include "fencelock/store/InMemoryStore.hpp"
#include "fencelock/lock/Protocol.hpp"
#include "fencelock/common/Error.hpp"
#include "StoreTestFramework/FaultyStore.hpp"

using fencelock::ErrorCode;
using fencelock::InMemoryStore;
using fencelock::OffloadedStore;
using namespace std::chrono_literals;

namespace {

class ThrowingStore : public fencelock::BlockingStore {
public:
    std::expected<bool, fencelock::Error> setNxPx(const std::string&, const std::string&, std::chrono::milliseconds) override {
        throw std::runtime_error("driver exploded");
    }
    std::expected<std::optional<std::string>, fencelock::Error> get(const std::string&) override {
        throw std::runtime_error("driver exploded");
    }
    std::expected<long long, fencelock::Error> eval(const std::string&, const std::vector<std::string>&, const std::vector<std::string>&) override {
        throw std::runtime_error("driver exploded");
    }
};

} // namespace

class OffloadedStoreTest : public ::testing::Test {
protected:
    template<typename T>
    T run(boost::asio::awaitable<T> a) {
        auto f = boost::asio::co_spawn(io, std::move(a), boost::asio::use_future);
        io.run();
        io.restart();
        return f.get();
    }
    boost::asio::io_context io;
    boost::asio::thread_pool pool {2};
    std::shared_ptr<InMemoryStore> memory = std::make_shared<InMemoryStore>();
    std::shared_ptr<FaultyStore> faulty = std::make_shared<FaultyStore>(memory);
    OffloadedStore store {faulty, pool.get_executor()};

    void TearDown() override {
        pool.join();
    }
};

TEST_F(OffloadedStoreTest, NullStoreThrows) {
    EXPECT_THROW(OffloadedStore(nullptr, pool.get_executor()), std::invalid_argument);
}

TEST_F(OffloadedStoreTest, ForwardsCommands) {
    auto set = run(store.setNxPx("k", "a", 1000ms));
    ASSERT_TRUE(set.has_value());
    EXPECT_TRUE(set.value());
    auto again = run(store.setNxPx("k", "b", 1000ms));
    ASSERT_TRUE(again.has_value());
    EXPECT_FALSE(again.value());
    auto got = run(store.get("k"));
    ASSERT_TRUE(got.has_value());
    EXPECT_EQ(got.value(), "a");
    auto deleted = run(store.eval(std::string{fencelock::releaseScript}, {"k"}, {"a"}));
    ASSERT_TRUE(deleted.has_value());
    EXPECT_EQ(deleted.value(), 1);
    EXPECT_EQ(faulty->setCalls(), 2);
    EXPECT_EQ(faulty->getCalls(), 1);
    EXPECT_EQ(faulty->evalCalls(), 1);
}

TEST_F(OffloadedStoreTest, ForwardsErrors) {
    faulty->disconnect();
    auto got = run(store.get("k"));
    ASSERT_FALSE(got.has_value());
    EXPECT_EQ(got.error().code, ErrorCode::StoreUnavailable);
}

TEST_F(OffloadedStoreTest, ExecutorIsTheBlockingExecutor) {
    EXPECT_TRUE(store.executor() == boost::asio::any_io_executor{pool.get_executor()});
}

TEST_F(OffloadedStoreTest, ThrowingStoreBecomesUnknownError) {
    OffloadedStore throwing {std::make_shared<ThrowingStore>(), pool.get_executor()};
    auto set = run(throwing.setNxPx("k", "a", 1000ms));
    ASSERT_FALSE(set.has_value());
    EXPECT_EQ(set.error().code, ErrorCode::Unknown);
    EXPECT_EQ(set.error().what, "driver exploded");
    auto got = run(throwing.get("k"));
    ASSERT_FALSE(got.has_value());
    EXPECT_EQ(got.error().code, ErrorCode::Unknown);
}

TEST_F(OffloadedStoreTest, ManyCallsInFlight) {
    constexpr int n = 64;
    std::vector<std::future<std::expected<bool, fencelock::Error>>> results;
    for (int i = 0; i < n; ++i) {
        results.push_back(boost::asio::co_spawn(io, store.setNxPx("k" + std::to_string(i), std::string(64, 'v'), 5000ms), boost::asio::use_future));
    }
    io.run();
    for (auto& f : results) {
        auto r = f.get();
        ASSERT_TRUE(r.has_value());
        EXPECT_TRUE(r.value());
    }
    EXPECT_EQ(memory->size(), static_cast<size_t>(n));
    EXPECT_EQ(faulty->setCalls(), n);
}
