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
#include <limits>
#include <string>
#include "../config.h"

namespace pollcache {
namespace state {

// Slab registry configuration
namespace slab {
    typedef POLLCACHE_SLAB_INDEX_TYPE IndexRep;

    // The all-ones value is never handed out, so the width caps live slots
    // at max() (255 for uint8_t).
    constexpr size_t kMaxSlots = std::numeric_limits<IndexRep>::max();
}

// Sequence source configuration
namespace sequence {
    constexpr uint64_t kRollbackAllowanceMs = POLLCACHE_CLOCK_ROLLBACK_ALLOWANCE_MS;
    constexpr uint64_t kMaxTimestampMs = (1ULL << 48) - 1;   // 48-bit UUIDv7 field
    constexpr uint32_t kCounterBits = 42;                    // 12 in rand_a + 30 in rand_b
    constexpr uint64_t kMaxCounter = (1ULL << kCounterBits) - 1;
}

/**
 * Runtime configuration for one tracked state category.
 */
struct StateConfig {
    size_t   registry_max_slots          = slab::kMaxSlots;
    uint64_t clock_rollback_allowance_ms = sequence::kRollbackAllowanceMs;

    /**
     * Compiled-in defaults. The embedding service builds its own StateConfig
     * when it needs other values; nothing here reads the environment.
     */
    static StateConfig defaults() {
        return StateConfig();
    }

    /**
     * Tiny registries, handy for exercising capacity exhaustion
     */
    static StateConfig small() {
        StateConfig cfg;
        cfg.registry_max_slots = 4;
        return cfg;
    }

    bool validate() const {
        if (registry_max_slots == 0 || registry_max_slots > slab::kMaxSlots) {
            return false;
        }
        if (clock_rollback_allowance_ms > sequence::kMaxTimestampMs) {
            return false;
        }
        return true;
    }
};

} // namespace state
} // namespace pollcache
