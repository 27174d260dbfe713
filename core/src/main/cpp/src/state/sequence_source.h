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
#include <functional>
#include <memory>
#include <mutex>
#include <random>
#include <boost/uuid/uuid.hpp>
#include "state_config.h"

namespace pollcache {
namespace state {

/**
 * Generator of 128-bit time-ordered identifiers.
 *
 * A VersionStamp draws its sequence ids from one of these. Implementations
 * normally return strictly increasing values; when they do not (the clock
 * went backward) the stamp starts a new instance.
 */
class SequenceSource {
public:
    virtual ~SequenceSource() = default;
    virtual boost::uuids::uuid next() = 0;
};

/**
 * UUIDv7 generator (RFC 9562) driven by a millisecond clock.
 *
 * Layout: 48-bit Unix ms timestamp | ver 7 | 42-bit counter spread over
 * rand_a and the top of rand_b | 32 random bits.
 *
 * Within one millisecond the counter is incremented so values stay strictly
 * increasing; on counter overflow the embedded timestamp moves one ms ahead.
 * A clock step backward within the rollback allowance is absorbed by
 * continuing from the last timestamp. A larger step backward restarts from
 * the clock, which yields a lower value.
 *
 * Thread-safe.
 */
class SystemSequenceSource : public SequenceSource {
public:
    typedef std::function<uint64_t()> Clock;   // Unix time in milliseconds

    SystemSequenceSource();
    explicit SystemSequenceSource(Clock clock,
                                  uint64_t rollback_allowance_ms = sequence::kRollbackAllowanceMs);

    /**
     * Source on an arbitrary millisecond clock, for deterministic tests.
     */
    static std::shared_ptr<SystemSequenceSource> with_clock(
        Clock clock, uint64_t rollback_allowance_ms = sequence::kRollbackAllowanceMs);

    boost::uuids::uuid next() override;

    uint64_t rollback_allowance_ms() const { return rollback_allowance_ms_; }

    static uint64_t system_clock_ms();

private:
    void reseed_counter();

    std::mutex mutex_;
    Clock clock_;
    uint64_t rollback_allowance_ms_;
    bool started_;
    uint64_t last_ms_;
    uint64_t counter_;
    std::mt19937_64 rng_;
};

/**
 * Process-wide source on the system clock, shared by stamps that do not
 * get one injected.
 */
std::shared_ptr<SequenceSource> system_sequence_source();

/**
 * Milliseconds embedded in a UUIDv7 value.
 */
uint64_t uuid_v7_timestamp_ms(const boost::uuids::uuid& id);

} // namespace state
} // namespace pollcache
