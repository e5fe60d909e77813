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
#include "fencelock/lock/Protocol.hpp"
#include "fencelock/common/Error.hpp"
#include <spdlog/spdlog.h>
#include <chrono>
#include <expected>
#include <optional>
#include <string>
#include <variant>

namespace fencelock {

std::expected<std::monostate, Error> validateLockArgs(const std::string& key, std::chrono::milliseconds ttl) {
    if (key.empty()) {
        return std::unexpected {Error{ErrorCode::InvalidArg, "Lock key must not be empty"}};
    }
    if (ttl <= std::chrono::milliseconds::zero()) {
        return std::unexpected {Error{ErrorCode::InvalidArg, "Lock TTL must be > 0, got " + std::to_string(ttl.count()) + "ms", key}};
    }
    return {};
}

std::expected<std::monostate, Error> settleUncertainClaim(
    const std::string& key,
    const std::string& token,
    const Error& setError,
    const std::expected<std::optional<std::string>, Error>& probe) {
    if (!probe.has_value()) {
        // No second disambiguation round: the probe failing is reported as is.
        spdlog::error("Protocol: probe of {} after failed SET NX also failed: {}", key, probe.error().what);
        return std::unexpected {probe.error()};
    }
    if (probe.value().has_value() && probe.value().value() == token) {
        spdlog::info("Protocol: SET NX on {} reported '{}' but the write landed", key, setError.what);
        return {};
    }
    return std::unexpected {Error{ErrorCode::AmbiguousWriteOutcome, setError.what, key}};
}

void logReleaseOutcome(const std::string& key, long long deleted) {
    if (deleted == 1) {
        spdlog::debug("Protocol: released {}", key);
    } else {
        spdlog::warn("Protocol: lease on {} was already lost, nothing deleted", key);
    }
}

} // namespace fencelock
