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
#include "fencelock/common/Util.hpp"
#include <random>
#include <string>
#include <cstdint>
#include <cstddef>

namespace fencelock {

UUIDV4 generate_uuid_v4() {
    // Draws straight from the kernel CSPRNG on Linux, never from a seeded engine.
    thread_local std::random_device dev;
    std::uniform_int_distribution<uint32_t> dist{0, 0xFFFFFFFFu};

    UUIDV4 uuid{};
    for (size_t i = 0; i < uuid.size(); i += 4) {
        auto r = dist(dev);
        uuid[i] = static_cast<uint8_t>((r >> 24) & 0xFF);
        uuid[i + 1] = static_cast<uint8_t>((r >> 16) & 0xFF);
        uuid[i + 2] = static_cast<uint8_t>((r >> 8) & 0xFF);
        uuid[i + 3] = static_cast<uint8_t>(r & 0xFF);
    }

    // Set version 4 (bits 12-15 of time_hi_and_version)
    uuid[6] = (uuid[6] & 0x0F) | 0x40;

    // Set variant bits (bits 6-7 of clock_seq_hi_and_reserved)
    uuid[8] = (uuid[8] & 0x3F) | 0x80;

    return uuid;
}

std::string uuid_to_string(const UUIDV4& uuid) {
    static constexpr auto hex = "0123456789abcdef";
    std::string result;
    result.reserve(36);
    for (size_t i = 0; i < uuid.size(); ++i) {
        if (i == 4 || i == 6 || i == 8 || i == 10) {
            result.push_back('-');
        }
        result.push_back(hex[uuid[i] >> 4]);
        result.push_back(hex[uuid[i] & 0x0F]);
    }
    return result;
}

std::string generate_token() {
    return uuid_to_string(generate_uuid_v4());
}

} // namespace fencelock
