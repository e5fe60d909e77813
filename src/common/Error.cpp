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
#include "fencelock/common/Error.hpp"
#include <utility>
#include <string>
#include <ostream>

namespace fencelock {

std::ostream& operator<<(std::ostream& os, const ErrorCode& code) {
    os << toString(code);
    return os;
}

std::string toString(const ErrorCode& code) {
    switch (code)
    {
        case ErrorCode::OK: return "OK";
        case ErrorCode::InvalidArg: return "InvalidArgument";
        case ErrorCode::StoreUnavailable: return "StoreUnavailable";
        case ErrorCode::AmbiguousWriteOutcome: return "AmbiguousWriteOutcome";
        case ErrorCode::ScriptExecutionFailed: return "ScriptExecutionFailed";
        case ErrorCode::Cancelled: return "Cancelled";
        case ErrorCode::Unknown: return "Unknown";
    }
    std::unreachable();
}

std::ostream& operator<<(std::ostream& os, const Error& error) {
    os << toString(error.code) << ": " << error.what;
    if (!error.key.empty()) {
        os << " (key=" << error.key << ")";
    }
    return os;
}

Error::Error(const ErrorCode& c, std::string w, std::string k) : code {c}, what {std::move(w)}, key {std::move(k)} {}
Error::Error(const ErrorCode& c, std::string w) : code {c}, what {std::move(w)}, key{} {}
Error::Error(const ErrorCode& c) : code {c}, what {toString(c)}, key{} {}

} // namespace fencelock
