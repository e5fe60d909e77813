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
#include "fencelock/common/RetryPolicy.hpp"
#include "fencelock/common/RetrySchedule.hpp"

using fencelock::RetryPolicy;
using fencelock::RetrySchedule;

TEST(RetryScheduleTest, YieldsOneDelayFewerThanAttempts) {
    RetrySchedule schedule {RetryPolicy{4, std::chrono::milliseconds{30}}};
    int delays = 0;
    while (auto d = schedule.nextDelay()) {
        EXPECT_EQ(d.value(), std::chrono::milliseconds{30});
        ++delays;
    }
    EXPECT_EQ(delays, 3);
}

TEST(RetryScheduleTest, SingleAttemptHasNoDelay) {
    RetrySchedule schedule {RetryPolicy::once()};
    EXPECT_FALSE(schedule.nextDelay().has_value());
    EXPECT_EQ(schedule.attempt(), 1);
}

TEST(RetryScheduleTest, AttemptCountsUp) {
    RetrySchedule schedule {RetryPolicy{3, std::chrono::milliseconds{1}}};
    EXPECT_EQ(schedule.attempt(), 1);
    ASSERT_TRUE(schedule.nextDelay().has_value());
    EXPECT_EQ(schedule.attempt(), 2);
    ASSERT_TRUE(schedule.nextDelay().has_value());
    EXPECT_EQ(schedule.attempt(), 3);
    EXPECT_FALSE(schedule.nextDelay().has_value());
    EXPECT_EQ(schedule.attempt(), 3);
}

TEST(RetryScheduleTest, ResetStartsOver) {
    RetrySchedule schedule {RetryPolicy{2, std::chrono::milliseconds{5}}};
    ASSERT_TRUE(schedule.nextDelay().has_value());
    EXPECT_FALSE(schedule.nextDelay().has_value());
    schedule.reset();
    EXPECT_EQ(schedule.attempt(), 1);
    EXPECT_TRUE(schedule.nextDelay().has_value());
}
