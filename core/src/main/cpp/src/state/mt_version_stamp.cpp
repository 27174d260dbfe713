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

#include "mt_version_stamp.h"

namespace pollcache {
namespace state {

MTVersionStamp::MTVersionStamp(std::shared_ptr<SequenceSource> source)
    : stamp_(std::move(source)) {}

std::pair<VersionStamp::Id, VersionStamp::Id> MTVersionStamp::get() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return stamp_.get();
}

void MTVersionStamp::set(const VersionStamp& other) {
    std::lock_guard<std::mutex> lock(mutex_);
    stamp_.set(other);
}

EpochState MTVersionStamp::increment() {
    std::lock_guard<std::mutex> lock(mutex_);
    return stamp_.increment();
}

VersionStamp MTVersionStamp::snapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return stamp_;
}

VersionToken MTVersionStamp::token() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return stamp_.token();
}

EpochState MTVersionStamp::epoch_state() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return stamp_.epoch_state();
}

} // namespace state
} // namespace pollcache
