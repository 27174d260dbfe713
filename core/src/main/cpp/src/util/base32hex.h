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

#include <cstddef>
#include <cstdint>
#include <string>

namespace pollcache {

    /**
     * RFC 4648 "base32hex" encoding without padding.
     *
     * The alphabet (0-9, A-V) is in ascending ASCII order and bits are packed
     * most-significant first, so for inputs of equal length the encoded
     * strings compare lexicographically exactly as the raw bytes compare.
     * 16 bytes always encode to 26 characters.
     */
    std::string base32hex_encode(const uint8_t* data, size_t len);

    constexpr size_t base32hex_encoded_size(size_t len) {
        return (len * 8 + 4) / 5;
    }

}
