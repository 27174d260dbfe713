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

namespace pollcache {

// Width of a slab registry index. uint8_t caps a registry at 255 live slots.
#ifndef POLLCACHE_SLAB_INDEX_TYPE
#define POLLCACHE_SLAB_INDEX_TYPE uint8_t
#endif

// How far the wall clock may step backward before the sequence source
// stops absorbing it and restarts from the new (lower) time.
#ifndef POLLCACHE_CLOCK_ROLLBACK_ALLOWANCE_MS
#define POLLCACHE_CLOCK_ROLLBACK_ALLOWANCE_MS 10000
#endif

#ifndef POLLCACHE_DEFAULT_LOG_LEVEL
#define POLLCACHE_DEFAULT_LOG_LEVEL LOG_WARNING
#endif

}
