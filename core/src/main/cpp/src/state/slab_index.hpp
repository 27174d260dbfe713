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
#include <functional>
#include <limits>
#include <optional>
#include <ostream>
#include <type_traits>
#include "state_config.h"

namespace pollcache {
    namespace state {

        /**
         * SlabIndex is the stable handle of an element stored in a SlabRegistry.
         *
         * It is only minted by the registry. Other structures may copy it and
         * keep it as a cheap "pointer" to the element; a lookup with a handle
         * whose element was removed simply misses.
         *
         * There is no default value; hold a std::optional<SlabIndex> where a
         * handle may be absent.
         *
         * Rep is the unsigned integer holding the slot position. Its all-ones
         * value is reserved, so a registry over Rep holds at most
         * numeric_limits<Rep>::max() slots.
         */
        template<typename Rep>
        class SlabIndex {
            static_assert(std::is_integral<Rep>::value && std::is_unsigned<Rep>::value,
                          "SlabIndex representation must be an unsigned integer");
        public:
            typedef Rep rep_type;

            static constexpr size_t kRepresentableSlots = std::numeric_limits<Rep>::max();

            // Factory from a raw slot position; only the registry should need this
            static constexpr SlabIndex from_raw(Rep v) {
                return SlabIndex(v);
            }

            constexpr Rep raw() const {
                return v_;
            }

            constexpr size_t position() const {
                return static_cast<size_t>(v_);
            }

            constexpr bool operator==(const SlabIndex& o) const { return v_ == o.v_; }
            constexpr bool operator!=(const SlabIndex& o) const { return v_ != o.v_; }
            constexpr bool operator< (const SlabIndex& o) const { return v_ <  o.v_; }
            constexpr bool operator<=(const SlabIndex& o) const { return v_ <= o.v_; }
            constexpr bool operator> (const SlabIndex& o) const { return v_ >  o.v_; }
            constexpr bool operator>=(const SlabIndex& o) const { return v_ >= o.v_; }

        private:
            explicit constexpr SlabIndex(Rep v) : v_(v) {}

            Rep v_;
        };

        template<typename Rep>
        std::ostream& operator<<(std::ostream& os, const SlabIndex<Rep>& idx) {
            return os << static_cast<unsigned long long>(idx.raw());
        }

        typedef SlabIndex<slab::IndexRep> DefaultSlabIndex;

        static_assert(sizeof(DefaultSlabIndex) == sizeof(slab::IndexRep),
                      "SlabIndex must not add storage over its representation");

        /**
         * Capability of an element that can live in a SlabRegistry: it caches
         * the index it is stored at. The registry is the only writer.
         *
         * The default forwards to member functions
         *   std::optional<SlabIndex<Rep>> slab_index() const;
         *   void set_slab_index(std::optional<SlabIndex<Rep>>);
         * Specialize for types that keep the index elsewhere.
         */
        template<typename T, typename Rep = slab::IndexRep>
        struct SlabElementTraits {
            typedef SlabIndex<Rep> index_type;

            static std::optional<index_type> index(const T& elem) {
                return elem.slab_index();
            }

            static void set_index(T& elem, std::optional<index_type> idx) {
                elem.set_slab_index(idx);
            }
        };

    } // namespace state
} // namespace pollcache

namespace std {
    template<typename Rep>
    struct hash<pollcache::state::SlabIndex<Rep>> {
        size_t operator()(const pollcache::state::SlabIndex<Rep>& idx) const noexcept {
            return std::hash<Rep>()(idx.raw());
        }
    };
}
