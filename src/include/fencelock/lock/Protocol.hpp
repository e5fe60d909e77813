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
#ifndef FENCELOCK_LOCK_PROTOCOL_HPP
#define FENCELOCK_LOCK_PROTOCOL_HPP

#include "fencelock/common/Error.hpp"
#include <chrono>
#include <expected>
#include <optional>
#include <string>
#include <string_view>
#include <variant>

namespace fencelock {

// Compare-and-delete. KEYS[1] is the lock key, ARGV[1] the fencing token.
// Returns 1 if the key held the token and was deleted, 0 otherwise.
inline constexpr std::string_view releaseScript = R"lua(
if redis.call("GET", KEYS[1]) == ARGV[1] then
    return redis.call("DEL", KEYS[1])
else
    return 0
end
)lua";

std::expected<std::monostate, Error> validateLockArgs(const std::string& key, std::chrono::milliseconds ttl);

// Decides a SET NX whose reply was an error, given the reply of the
// corrective GET. OK means our write landed and the token is held.
std::expected<std::monostate, Error> settleUncertainClaim(
    const std::string& key,
    const std::string& token,
    const Error& setError,
    const std::expected<std::optional<std::string>, Error>& probe);

void logReleaseOutcome(const std::string& key, long long deleted);

} // namespace fencelock

#endif // FENCELOCK_LOCK_PROTOCOL_HPP
