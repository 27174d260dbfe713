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
#include <optional>
#include <string>
#include "version_stamp.h"

namespace pollcache {
namespace state {

/**
 * Version fields a poller may echo back from a previous response.
 * Either may be missing (first poll, or a client that does not cache).
 */
struct PollRequest {
    std::optional<std::string> method_uuid;
    std::optional<std::string> data_uuid;

    // A request with no prior knowledge
    static PollRequest fresh() { return PollRequest(); }

    // A request echoing a previously received header
    static PollRequest since(const VersionToken& seen) {
        PollRequest r;
        r.method_uuid = seen.method_uuid;
        r.data_uuid = seen.data_uuid;
        return r;
    }
};

enum class ReadOutcome : uint8_t {
    Full = 0,       // send payload and current header
    Unchanged = 1   // send header only, caller's copy is current
};

const char* readOutcomeToString(ReadOutcome o);

/**
 * Decide whether a poll needs the full payload.
 *
 * Unchanged only when both prior fields are present, the instance id
 * matches and the sequence id equals the current one. A different instance
 * id always forces a full refresh (restart or clock regression).
 */
ReadOutcome evaluate_poll(const VersionToken& current, const PollRequest& request);

/**
 * Response of a conditional read. payload is set only for ReadOutcome::Full.
 */
template<class Payload>
struct PollResult {
    ReadOutcome outcome;
    VersionToken header;
    std::optional<Payload> payload;

    bool unchanged() const { return outcome == ReadOutcome::Unchanged; }
};

} // namespace state
} // namespace pollcache
