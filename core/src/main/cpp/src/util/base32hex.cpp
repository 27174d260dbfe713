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

#include "base32hex.h"

namespace pollcache {

    static const char kAlphabet[] = "0123456789ABCDEFGHIJKLMNOPQRSTUV";

    std::string base32hex_encode(const uint8_t* data, size_t len) {
        std::string out;
        out.reserve(base32hex_encoded_size(len));

        uint32_t buffer = 0;
        int bits = 0;
        for (size_t i = 0; i < len; i++) {
            buffer = (buffer << 8) | data[i];
            bits += 8;
            while (bits >= 5) {
                bits -= 5;
                out.push_back(kAlphabet[(buffer >> bits) & 0x1F]);
            }
        }
        // Remaining bits are left-aligned into a final symbol
        if (bits > 0) {
            out.push_back(kAlphabet[(buffer << (5 - bits)) & 0x1F]);
        }
        return out;
    }

}
