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
#include <memory>
#include <ostream>
#include <string>
#include <utility>
#include <boost/uuid/uuid.hpp>
#include "sequence_source.h"

namespace pollcache {
namespace state {

/**
 * Poller-facing form of a VersionStamp. Both fields are opaque 26 character
 * base32hex strings; callers compare them, never parse them.
 */
struct VersionToken {
    std::string method_uuid;   // encoded instance id
    std::string data_uuid;     // encoded sequence id

    bool operator==(const VersionToken& o) const {
        return method_uuid == o.method_uuid && data_uuid == o.data_uuid;
    }
    bool operator!=(const VersionToken& o) const { return !(*this == o); }
};

std::ostream& operator<<(std::ostream& os, const VersionToken& token);

/**
 * State of the comparability epoch after the last increment().
 *   MonotonicRun: the new sequence id was greater than the previous one
 *   Resynced:     it was not, so a new instance id was minted
 */
enum class EpochState : uint8_t {
    MonotonicRun = 0,
    Resynced = 1
};

const char* epochStateToString(EpochState s);

/**
 * VersionStamp - (instance id, sequence id) pair versioning one piece of
 * polled state.
 *
 * The instance id is a random UUIDv4 that names one unbroken monotonic run.
 * The sequence id is a time-ordered value (UUIDv7) drawn from a
 * SequenceSource; within one instance id successive increments are strictly
 * increasing. Sequence ids from different instance ids are not comparable.
 *
 * Not thread-safe; the caller serializes access (see MTVersionStamp).
 */
class VersionStamp {
public:
    typedef boost::uuids::uuid Id;

    VersionStamp();
    explicit VersionStamp(std::shared_ptr<SequenceSource> source);

    std::pair<Id, Id> get() const { return std::make_pair(instance_id_, sequence_id_); }
    const Id& instance_id() const { return instance_id_; }
    const Id& sequence_id() const { return sequence_id_; }

    /**
     * Adopt another stamp's identifiers. The sequence source and the epoch
     * bookkeeping of this stamp are kept.
     */
    void set(const VersionStamp& other);

    /**
     * Advance the sequence id. A value not strictly greater than the previous
     * one starts a new instance id before being stored.
     */
    EpochState increment();

    EpochState epoch_state() const { return epoch_state_; }
    uint64_t resync_count() const { return resync_count_; }

    std::string instance_token() const;
    std::string sequence_token() const;
    VersionToken token() const;

    bool operator==(const VersionStamp& o) const {
        return instance_id_ == o.instance_id_ && sequence_id_ == o.sequence_id_;
    }
    bool operator!=(const VersionStamp& o) const { return !(*this == o); }
    bool operator<(const VersionStamp& o) const {
        return instance_id_ == o.instance_id_ ? sequence_id_ < o.sequence_id_
                                              : instance_id_ < o.instance_id_;
    }
    bool operator>(const VersionStamp& o) const { return o < *this; }
    bool operator<=(const VersionStamp& o) const { return !(o < *this); }
    bool operator>=(const VersionStamp& o) const { return !(*this < o); }

    static std::string encode(const Id& id);

private:
    static Id new_instance_id();

    std::shared_ptr<SequenceSource> source_;
    Id instance_id_;
    Id sequence_id_;
    EpochState epoch_state_;
    uint64_t resync_count_;
};

std::ostream& operator<<(std::ostream& os, const VersionStamp& stamp);

} // namespace state
} // namespace pollcache
