/*
 * SPDX-License-Identifier: AGPL-3.0-or-later
 *
 * The Lucenia project is free software: you can redistribute it
 * and/or modify it under the terms of the GNU Affero General
 * Public License as published by the Free Software Foundation,
 * either version 3 of the License, or (at your option) any later
 * version.
 *
 * This program is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE. See the
 * GNU Affero General Public License for more details.
 *
 * You should have received a copy of the GNU Affero General Public
 * License along with this program. If not, see:
 * https://www.gnu.org/licenses/agpl-3.0.html
 */
#pragma once
#include <cstdint>
#include <cstddef>
#include <cstdlib>
#include <cerrno>

namespace indexlist {
namespace config {

// Index list configuration
namespace index_list {
    constexpr size_t kDefaultReserveHint = 0;          // no up-front allocation
    constexpr size_t kMaxReserveHint = 1 << 20;        // 1M slots

    // Reserve applied by default-constructed lists, overridable at startup
    constexpr const char* kReserveHintEnvVar = "INDEXLIST_RESERVE_HINT";

    /**
     * Reserve hint for default-constructed lists.
     * Reads INDEXLIST_RESERVE_HINT once; values that do not parse or fall
     * outside [0, kMaxReserveHint] are ignored.
     */
    inline size_t default_reserve_hint() {
        static const size_t hint = []() -> size_t {
            const char* env = std::getenv(kReserveHintEnvVar);
            if (!env || !*env) {
                return kDefaultReserveHint;
            }
            char* end = nullptr;
            errno = 0;
            unsigned long long v = std::strtoull(env, &end, 10);
            if (errno != 0 || end == env || *end != '\0' || v > kMaxReserveHint) {
                return kDefaultReserveHint;
            }
            return static_cast<size_t>(v);
        }();
        return hint;
    }
}

// Logging configuration
namespace logging {
    constexpr const char* kLevelEnvVar = "INDEXLIST_LOG_LEVEL";
    constexpr const char* kEnableFileEnvVar = "INDEXLIST_LOG_ENABLE_FILE";
    constexpr const char* kDirEnvVar = "INDEXLIST_LOG_DIR";
    constexpr const char* kLogFileName = "indexlist.log";
    constexpr const char* kThreadName = "INDEXLIST";
}

// Debug configuration
namespace debug_config {
    #ifdef NDEBUG
        constexpr bool kTraceStaleHandles = false;
    #else
        constexpr bool kTraceStaleHandles = true;
    #endif
}

} // namespace config
} // namespace indexlist
