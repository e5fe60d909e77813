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
#include "fencelock/common/ErrorConverter.hpp"
#include "fencelock/common/Error.hpp"
#include <sw/redis++/errors.h>
#include <string>

namespace fencelock {

ErrorCode toErrorCode(const sw::redis::Error& error) {
    // TimeoutError derives from IoError; both mean the outcome is unknown.
    if (dynamic_cast<const sw::redis::IoError*>(&error) != nullptr ||
        dynamic_cast<const sw::redis::ClosedError*>(&error) != nullptr) {
        return ErrorCode::StoreUnavailable;
    }
    if (dynamic_cast<const sw::redis::ReplyError*>(&error) != nullptr ||
        dynamic_cast<const sw::redis::ProtoError*>(&error) != nullptr ||
        dynamic_cast<const sw::redis::OomError*>(&error) != nullptr) {
        return ErrorCode::Unknown;
    }
    // Plain sw::redis::Error is what the pool throws when no connection
    // becomes free within the wait timeout.
    return ErrorCode::StoreUnavailable;
}

Error toError(const sw::redis::Error& error, const std::string& key) {
    return Error(toErrorCode(error), error.what(), key);
}

Error toScriptError(const sw::redis::Error& error, const std::string& key) {
    if (dynamic_cast<const sw::redis::ReplyError*>(&error) != nullptr) {
        return Error(ErrorCode::ScriptExecutionFailed, error.what(), key);
    }
    return toError(error, key);
}

} // namespace fencelock
