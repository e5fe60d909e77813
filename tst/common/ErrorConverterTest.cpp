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
#include <sw/redis++/errors.h>
#include "fencelock/common/Error.hpp"
#include "fencelock/common/ErrorConverter.hpp"

using fencelock::ErrorCode;
using fencelock::toError;
using fencelock::toErrorCode;
using fencelock::toScriptError;

TEST(ErrorConverterTest, TransportErrorsMeanStoreUnavailable) {
    EXPECT_EQ(toErrorCode(sw::redis::IoError("Failed to read")), ErrorCode::StoreUnavailable);
    EXPECT_EQ(toErrorCode(sw::redis::TimeoutError("Resource temporarily unavailable")), ErrorCode::StoreUnavailable);
    EXPECT_EQ(toErrorCode(sw::redis::ClosedError("Connection closed")), ErrorCode::StoreUnavailable);
}

TEST(ErrorConverterTest, PoolExhaustionMeansStoreUnavailable) {
    EXPECT_EQ(toErrorCode(sw::redis::Error("Failed to fetch a connection in 100 milliseconds")), ErrorCode::StoreUnavailable);
}

TEST(ErrorConverterTest, ServerSideErrorsAreUnknown) {
    EXPECT_EQ(toErrorCode(sw::redis::ReplyError("WRONGTYPE Operation against a key")), ErrorCode::Unknown);
    EXPECT_EQ(toErrorCode(sw::redis::ProtoError("Expect STRING reply")), ErrorCode::Unknown);
    EXPECT_EQ(toErrorCode(sw::redis::OomError("Out of memory")), ErrorCode::Unknown);
}

TEST(ErrorConverterTest, ToErrorKeepsMessageAndKey) {
    auto e = toError(sw::redis::IoError("Connection reset by peer"), "jobs:7");
    EXPECT_EQ(e.code, ErrorCode::StoreUnavailable);
    EXPECT_EQ(e.what, "Connection reset by peer");
    EXPECT_EQ(e.key, "jobs:7");
}

TEST(ErrorConverterTest, ScriptReplyErrorIsScriptFailure) {
    auto e = toScriptError(sw::redis::ReplyError("NOSCRIPT No matching script"), "jobs:7");
    EXPECT_EQ(e.code, ErrorCode::ScriptExecutionFailed);
    EXPECT_EQ(e.key, "jobs:7");
}

TEST(ErrorConverterTest, ScriptTransportErrorStaysUnavailable) {
    auto e = toScriptError(sw::redis::TimeoutError("timed out"), "jobs:7");
    EXPECT_EQ(e.code, ErrorCode::StoreUnavailable);
}
