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
#include "fencelock/lock/LockState.hpp"
#include <chrono>
#include <optional>
#include <string>
#include <utility>

namespace fencelock {

LockState::LockState(std::string k, std::chrono::milliseconds t)
    : lockKey {std::move(k)},
      lockTtl {t},
      lockToken {std::nullopt} {}

LockState::LockState(LockState&& other) noexcept
    : lockKey {std::move(other.lockKey)},
      lockTtl {other.lockTtl},
      lockToken {std::exchange(other.lockToken, std::nullopt)},
      suppressed {other.suppressed} {}

LockState& LockState::operator=(LockState&& other) noexcept {
    if (this != &other) {
        lockKey = std::move(other.lockKey);
        lockTtl = other.lockTtl;
        lockToken = std::exchange(other.lockToken, std::nullopt);
        suppressed = other.suppressed;
    }
    return *this;
}

bool LockState::held() const {
    return lockToken.has_value();
}

const std::string& LockState::key() const {
    return lockKey;
}

std::chrono::milliseconds LockState::ttl() const {
    return lockTtl;
}

const std::optional<std::string>& LockState::token() const {
    return lockToken;
}

void LockState::suppressAutoRelease() {
    suppressed = true;
}

bool LockState::autoReleaseSuppressed() const {
    return suppressed;
}

} // namespace fencelock
