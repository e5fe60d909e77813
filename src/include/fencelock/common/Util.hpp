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
#ifndef FENCELOCK_UTIL_H_KQWPZ
#define FENCELOCK_UTIL_H_KQWPZ

#include <array>
#include <string>
#include <cstdint>

namespace fencelock {

using UUIDV4 = std::array<uint8_t, 16>;

// Generate UUID version 4 (RFC 9562) from the OS entropy source
UUIDV4 generate_uuid_v4();

// Canonical 8-4-4-4-12 lowercase hex form
std::string uuid_to_string(const UUIDV4& uuid);

// Fresh, unguessable fencing token for one acquisition attempt
std::string generate_token();

} // namespace fencelock

#endif // FENCELOCK_UTIL_H_KQWPZ
