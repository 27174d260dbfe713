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

#include "version_stamp.h"
#include <stdexcept>
#include <boost/uuid/random_generator.hpp>
#include "../util/base32hex.h"
#include "../util/log.h"

namespace pollcache {
namespace state {

const char* epochStateToString(EpochState s) {
    switch (s) {
    case EpochState::MonotonicRun:
        return "MonotonicRun";
    case EpochState::Resynced:
        return "Resynced";
    default:
        return "UNKNOWN";
    }
}

std::ostream& operator<<(std::ostream& os, const VersionToken& token) {
    return os << token.method_uuid << '/' << token.data_uuid;
}

VersionStamp::VersionStamp()
    : VersionStamp(system_sequence_source()) {}

VersionStamp::VersionStamp(std::shared_ptr<SequenceSource> source)
    : source_(std::move(source)),
      epoch_state_(EpochState::MonotonicRun),
      resync_count_(0) {
    if (!source_) {
        throw std::invalid_argument("VersionStamp: sequence source is null");
    }
    instance_id_ = new_instance_id();
    sequence_id_ = source_->next();
}

VersionStamp::Id VersionStamp::new_instance_id() {
    boost::uuids::random_generator gen;
    return gen();
}

void VersionStamp::set(const VersionStamp& other) {
    instance_id_ = other.instance_id_;
    sequence_id_ = other.sequence_id_;
}

EpochState VersionStamp::increment() {
    const Id next = source_->next();

    if (!(sequence_id_ < next)) {
        instance_id_ = new_instance_id();
        epoch_state_ = EpochState::Resynced;
        ++resync_count_;
        info() << "VersionStamp: sequence id went backward, new instance "
               << instance_token();
    } else {
        epoch_state_ = EpochState::MonotonicRun;
    }
    sequence_id_ = next;
    return epoch_state_;
}

std::string VersionStamp::encode(const Id& id) {
    return base32hex_encode(id.data, id.static_size());
}

std::string VersionStamp::instance_token() const {
    return encode(instance_id_);
}

std::string VersionStamp::sequence_token() const {
    return encode(sequence_id_);
}

VersionToken VersionStamp::token() const {
    VersionToken t;
    t.method_uuid = instance_token();
    t.data_uuid = sequence_token();
    return t;
}

std::ostream& operator<<(std::ostream& os, const VersionStamp& stamp) {
    return os << stamp.token();
}

} // namespace state
} // namespace pollcache
