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
#ifndef FENCELOCK_ERROR_CONVERTER_H
#define FENCELOCK_ERROR_CONVERTER_H

#include "fencelock/common/Error.hpp"
#include <sw/redis++/errors.h>
#include <string>

namespace fencelock {

ErrorCode toErrorCode(const sw::redis::Error& error);

Error toError(const sw::redis::Error& error, const std::string& key);

// Same as toError, except that reply errors mean the script itself could
// not run (syntax error, NOSCRIPT, wrong number of keys).
Error toScriptError(const sw::redis::Error& error, const std::string& key);

} // namespace fencelock

#endif // FENCELOCK_ERROR_CONVERTER_H
