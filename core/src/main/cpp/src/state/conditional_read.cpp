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

#include "conditional_read.h"

namespace pollcache {
namespace state {

const char* readOutcomeToString(ReadOutcome o) {
    switch (o) {
    case ReadOutcome::Full:
        return "Full";
    case ReadOutcome::Unchanged:
        return "Unchanged";
    default:
        return "UNKNOWN";
    }
}

ReadOutcome evaluate_poll(const VersionToken& current, const PollRequest& request) {
    if (!request.method_uuid || !request.data_uuid) {
        return ReadOutcome::Full;
    }
    if (*request.method_uuid != current.method_uuid) {
        return ReadOutcome::Full;
    }
    if (*request.data_uuid != current.data_uuid) {
        return ReadOutcome::Full;
    }
    return ReadOutcome::Unchanged;
}

} // namespace state
} // namespace pollcache
