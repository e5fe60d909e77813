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
#include <chrono>
#include <cstdlib>
#include <memory>
#include <optional>
#include <string>
#include "fencelock/store/RedisStore.hpp"
#include "fencelock/store/StoreConfig.hpp"
#include "fencelock/store/BlockingStore.hpp"
#include "fencelock/lock/Lock.hpp"
#include "fencelock/lock/Protocol.hpp"
#include "fencelock/common/Error.hpp"
#include "fencelock/common/Util.hpp"

using fencelock::BlockingStore;
using fencelock::ErrorCode;
using fencelock::Lock;
using fencelock::StoreConfig;
using namespace std::chrono_literals;

TEST(RedisStoreTest, ConnectionOptionsFromEndpoint) {
    auto endpoint = fencelock::parseEndpoint("redis://app:pw@cache:6390/2");
    fencelock::Timeouts timeouts;
    timeouts.socket = 250ms;
    auto options = fencelock::toConnectionOptions(endpoint, timeouts);
    EXPECT_EQ(options.host, "cache");
    EXPECT_EQ(options.port, 6390);
    EXPECT_EQ(options.user, "app");
    EXPECT_EQ(options.password, "pw");
    EXPECT_EQ(options.db, 2);
    EXPECT_EQ(options.connect_timeout, 10000ms);
    EXPECT_EQ(options.socket_timeout, 250ms);
}

TEST(RedisStoreTest, PoolOptionsFromConfig) {
    fencelock::PoolOptions pool;
    pool.size = 8;
    pool.waitTimeout = 50ms;
    auto options = fencelock::toPoolOptions(pool);
    EXPECT_EQ(options.size, 8u);
    EXPECT_EQ(options.wait_timeout, 50ms);
}

TEST(RedisStoreTest, UnreachableServerIsStoreUnavailable) {
    fencelock::Timeouts timeouts;
    timeouts.connect = 200ms;
    const StoreConfig config {{"redis://127.0.0.1:1"}, StoreConfig::Mode::Single, fencelock::PoolOptions{}, timeouts};
    auto store = fencelock::openBlockingStore(config);
    ASSERT_FALSE(store.has_value());
    EXPECT_EQ(store.error().code, ErrorCode::StoreUnavailable);
}

// Runs against a live server only when FENCELOCK_REDIS_DSN names one.
class RedisStoreLiveTest : public ::testing::Test {
protected:
    void SetUp() override {
        const char* dsn = std::getenv("FENCELOCK_REDIS_DSN");
        if (dsn == nullptr || *dsn == '\0') {
            GTEST_SKIP() << "FENCELOCK_REDIS_DSN not set";
        }
        auto opened = fencelock::openBlockingStore(StoreConfig{{dsn}});
        ASSERT_TRUE(opened.has_value()) << opened.error();
        store = opened.value();
        key = "fencelock:test:" + fencelock::generate_token();
    }
    std::shared_ptr<BlockingStore> store;
    std::string key;
};

TEST_F(RedisStoreLiveTest, SetNxGetAndRelease) {
    auto set = store->setNxPx(key, "a", 5000ms);
    ASSERT_TRUE(set.has_value()) << set.error();
    EXPECT_TRUE(set.value());
    auto again = store->setNxPx(key, "b", 5000ms);
    ASSERT_TRUE(again.has_value());
    EXPECT_FALSE(again.value());
    auto got = store->get(key);
    ASSERT_TRUE(got.has_value());
    EXPECT_EQ(got.value(), std::optional<std::string>{"a"});
    auto kept = store->eval(std::string{fencelock::releaseScript}, {key}, {"b"});
    ASSERT_TRUE(kept.has_value()) << kept.error();
    EXPECT_EQ(kept.value(), 0);
    auto deleted = store->eval(std::string{fencelock::releaseScript}, {key}, {"a"});
    ASSERT_TRUE(deleted.has_value());
    EXPECT_EQ(deleted.value(), 1);
    EXPECT_FALSE(store->get(key).value().has_value());
}

TEST_F(RedisStoreLiveTest, LockRoundTrip) {
    auto first = Lock::tryAcquire(store, key, 5000ms);
    ASSERT_TRUE(first.has_value()) << first.error();
    ASSERT_TRUE(first.value().has_value());
    auto second = Lock::tryAcquire(store, key, 5000ms);
    ASSERT_TRUE(second.has_value());
    EXPECT_FALSE(second.value().has_value());
    ASSERT_TRUE(first.value()->release().has_value());
    EXPECT_FALSE(store->get(key).value().has_value());
}

TEST_F(RedisStoreLiveTest, BadScriptIsScriptFailure) {
    auto r = store->eval("return redis.call('NOPE')", {key}, {"a"});
    ASSERT_FALSE(r.has_value());
    EXPECT_EQ(r.error().code, ErrorCode::ScriptExecutionFailed);
}
