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

#include <mutex>
#include "version_stamp.h"

namespace pollcache {
namespace state {

/**
 * MTVersionStamp - VersionStamp behind a single mutex.
 *
 * Every call, reads included, takes the same lock for O(1) work. Writes are
 * rare compared to polls, so there is no separate reader path.
 */
class MTVersionStamp {
public:
    MTVersionStamp() = default;
    explicit MTVersionStamp(std::shared_ptr<SequenceSource> source);

    MTVersionStamp(const MTVersionStamp&) = delete;
    MTVersionStamp& operator=(const MTVersionStamp&) = delete;

    std::pair<VersionStamp::Id, VersionStamp::Id> get() const;
    void set(const VersionStamp& other);
    EpochState increment();

    VersionStamp snapshot() const;
    VersionToken token() const;
    EpochState epoch_state() const;

private:
    mutable std::mutex mutex_;
    VersionStamp stamp_;
};

} // namespace state
} // namespace pollcache
