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
#include <expected>
#include <optional>
#include <string>
#include "fencelock/lock/Protocol.hpp"
#include "fencelock/common/Error.hpp"

using fencelock::Error;
using fencelock::ErrorCode;
using fencelock::settleUncertainClaim;
using fencelock::validateLockArgs;
using namespace std::chrono_literals;

using Probe = std::expected<std::optional<std::string>, Error>;

TEST(ProtocolTest, ValidatesArguments) {
    EXPECT_TRUE(validateLockArgs("k", 1ms).has_value());
    auto emptyKey = validateLockArgs("", 1000ms);
    ASSERT_FALSE(emptyKey.has_value());
    EXPECT_EQ(emptyKey.error().code, ErrorCode::InvalidArg);
    auto zeroTtl = validateLockArgs("k", 0ms);
    ASSERT_FALSE(zeroTtl.has_value());
    EXPECT_EQ(zeroTtl.error().code, ErrorCode::InvalidArg);
    EXPECT_EQ(zeroTtl.error().key, "k");
    EXPECT_FALSE(validateLockArgs("k", -5ms).has_value());
}

TEST(ProtocolTest, ReleaseScriptIsCompareAndDelete) {
    const std::string script {fencelock::releaseScript};
    EXPECT_NE(script.find("redis.call(\"GET\", KEYS[1]) == ARGV[1]"), std::string::npos);
    EXPECT_NE(script.find("redis.call(\"DEL\", KEYS[1])"), std::string::npos);
    EXPECT_NE(script.find("return 0"), std::string::npos);
}

TEST(ProtocolTest, ProbeShowingOurTokenMeansHeld) {
    const Error setError {ErrorCode::StoreUnavailable, "timeout", "k"};
    EXPECT_TRUE(settleUncertainClaim("k", "t1", setError, Probe{std::optional<std::string>{"t1"}}).has_value());
}

TEST(ProtocolTest, ProbeShowingOtherTokenIsAmbiguous) {
    const Error setError {ErrorCode::StoreUnavailable, "timeout", "k"};
    auto r = settleUncertainClaim("k", "t1", setError, Probe{std::optional<std::string>{"t2"}});
    ASSERT_FALSE(r.has_value());
    EXPECT_EQ(r.error().code, ErrorCode::AmbiguousWriteOutcome);
    EXPECT_EQ(r.error().what, "timeout");
    EXPECT_EQ(r.error().key, "k");
}

TEST(ProtocolTest, ProbeShowingNothingIsAmbiguous) {
    const Error setError {ErrorCode::Unknown, "ERR busy", "k"};
    auto r = settleUncertainClaim("k", "t1", setError, Probe{std::nullopt});
    ASSERT_FALSE(r.has_value());
    EXPECT_EQ(r.error().code, ErrorCode::AmbiguousWriteOutcome);
}

TEST(ProtocolTest, FailedProbeIsReturnedAsIs) {
    const Error setError {ErrorCode::StoreUnavailable, "timeout", "k"};
    auto r = settleUncertainClaim("k", "t1", setError, Probe{std::unexpected {Error{ErrorCode::StoreUnavailable, "refused", "k"}}});
    ASSERT_FALSE(r.has_value());
    EXPECT_EQ(r.error().code, ErrorCode::StoreUnavailable);
    EXPECT_EQ(r.error().what, "refused");
}
