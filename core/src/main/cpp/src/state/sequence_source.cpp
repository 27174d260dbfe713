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

#include "sequence_source.h"
#include <chrono>
#include "../util/log.h"

namespace pollcache {
namespace state {

SystemSequenceSource::SystemSequenceSource()
    : SystemSequenceSource(&SystemSequenceSource::system_clock_ms) {}

SystemSequenceSource::SystemSequenceSource(Clock clock, uint64_t rollback_allowance_ms)
    : clock_(std::move(clock)),
      rollback_allowance_ms_(rollback_allowance_ms),
      started_(false),
      last_ms_(0),
      counter_(0),
      rng_(std::random_device{}()) {
    if (!clock_) {
        throw std::invalid_argument("SystemSequenceSource: clock must be callable");
    }
}

std::shared_ptr<SystemSequenceSource> SystemSequenceSource::with_clock(
    Clock clock, uint64_t rollback_allowance_ms) {
    return std::make_shared<SystemSequenceSource>(std::move(clock), rollback_allowance_ms);
}

uint64_t SystemSequenceSource::system_clock_ms() {
    return static_cast<uint64_t>(std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count());
}

// Top bit stays clear so a run has at least 2^41 increments of headroom
void SystemSequenceSource::reseed_counter() {
    counter_ = rng_() & (sequence::kMaxCounter >> 1);
}

boost::uuids::uuid SystemSequenceSource::next() {
    std::lock_guard<std::mutex> lock(mutex_);

    const uint64_t now = clock_() & sequence::kMaxTimestampMs;

    if (!started_ || now > last_ms_) {
        last_ms_ = now;
        reseed_counter();
        started_ = true;
    } else if (now + rollback_allowance_ms_ >= last_ms_) {
        if (counter_ >= sequence::kMaxCounter) {
            ++last_ms_;
            reseed_counter();
        } else {
            ++counter_;
        }
    } else {
        warning() << "SystemSequenceSource: clock stepped back " << (last_ms_ - now)
                  << " ms, restarting sequence from the clock";
        last_ms_ = now;
        reseed_counter();
    }

    const uint64_t tail = rng_();

    boost::uuids::uuid id;
    id.data[0]  = static_cast<uint8_t>(last_ms_ >> 40);
    id.data[1]  = static_cast<uint8_t>(last_ms_ >> 32);
    id.data[2]  = static_cast<uint8_t>(last_ms_ >> 24);
    id.data[3]  = static_cast<uint8_t>(last_ms_ >> 16);
    id.data[4]  = static_cast<uint8_t>(last_ms_ >> 8);
    id.data[5]  = static_cast<uint8_t>(last_ms_);
    id.data[6]  = static_cast<uint8_t>(0x70 | ((counter_ >> 38) & 0x0F));  // version 7
    id.data[7]  = static_cast<uint8_t>(counter_ >> 30);
    id.data[8]  = static_cast<uint8_t>(0x80 | ((counter_ >> 24) & 0x3F));  // RFC variant
    id.data[9]  = static_cast<uint8_t>(counter_ >> 16);
    id.data[10] = static_cast<uint8_t>(counter_ >> 8);
    id.data[11] = static_cast<uint8_t>(counter_);
    id.data[12] = static_cast<uint8_t>(tail >> 24);
    id.data[13] = static_cast<uint8_t>(tail >> 16);
    id.data[14] = static_cast<uint8_t>(tail >> 8);
    id.data[15] = static_cast<uint8_t>(tail);
    return id;
}

std::shared_ptr<SequenceSource> system_sequence_source() {
    static std::shared_ptr<SequenceSource> source = std::make_shared<SystemSequenceSource>();
    return source;
}

uint64_t uuid_v7_timestamp_ms(const boost::uuids::uuid& id) {
    uint64_t ms = 0;
    for (int i = 0; i < 6; i++) {
        ms = (ms << 8) | id.data[i];
    }
    return ms;
}

} // namespace state
} // namespace pollcache
