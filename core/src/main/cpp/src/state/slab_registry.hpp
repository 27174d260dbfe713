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
#include <iterator>
#include <optional>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <utility>
#include <vector>
#include "slab_index.hpp"
#include "../util/log.h"

namespace pollcache {
    namespace state {

        /**
         * Thrown when a push would need a slot beyond the registry limit.
         */
        class SlabCapacityError : public std::length_error {
        public:
            explicit SlabCapacityError(size_t max_slots)
                : std::length_error("SlabRegistry: all " + std::to_string(max_slots)
                                    + " slots are in use"),
                  max_slots_(max_slots) {}

            size_t max_slots() const { return max_slots_; }

        private:
            size_t max_slots_;
        };

        /**
         * SlabRegistry - small fixed-capacity array with recycling of empty cells.
         *
         * Optimized for collections that rarely change, are read very often
         * (typically under a reader-writer lock) and own their elements. The
         * index handed out by push() stays valid until that element is
         * removed, so other structures can cache it for O(1) access instead of
         * doing a keyed lookup.
         *
         * Invariants:
         *   - no empty slot is ever left at the tail of the backing array
         *   - every live element reports the index of the slot holding it
         *   - an index is reused only after its element has been removed
         *
         * Not thread-safe; see PolledRegistry for the locked variant.
         */
        template<typename T,
                 typename Rep = slab::IndexRep,
                 typename Traits = SlabElementTraits<T, Rep>>
        class SlabRegistry {
        public:
            typedef SlabIndex<Rep> index_type;
            typedef T value_type;

        private:
            typedef std::vector<std::optional<T>> slot_vector;

            template<bool Const>
            class basic_iterator {
                typedef typename std::conditional<Const, const slot_vector, slot_vector>::type slots_type;
                typedef typename std::conditional<Const, const T&, T&>::type element_ref;
            public:
                typedef std::forward_iterator_tag iterator_category;
                typedef std::pair<index_type, element_ref> value_type;
                typedef std::ptrdiff_t difference_type;
                typedef value_type reference;
                typedef void pointer;

                basic_iterator() : slots_(nullptr), pos_(0) {}
                basic_iterator(slots_type* slots, size_t pos) : slots_(slots), pos_(pos) {
                    skip_empty();
                }

                reference operator*() const {
                    return value_type(index_type::from_raw(static_cast<Rep>(pos_)), *(*slots_)[pos_]);
                }

                basic_iterator& operator++() {
                    ++pos_;
                    skip_empty();
                    return *this;
                }

                basic_iterator operator++(int) {
                    basic_iterator tmp = *this;
                    ++(*this);
                    return tmp;
                }

                bool operator==(const basic_iterator& o) const { return pos_ == o.pos_; }
                bool operator!=(const basic_iterator& o) const { return pos_ != o.pos_; }

            private:
                void skip_empty() {
                    while (pos_ < slots_->size() && !(*slots_)[pos_]) {
                        ++pos_;
                    }
                }

                slots_type* slots_;
                size_t pos_;
            };

        public:
            typedef basic_iterator<false> iterator;
            typedef basic_iterator<true>  const_iterator;

            explicit SlabRegistry(size_t max_slots = index_type::kRepresentableSlots)
                : max_slots_(max_slots), live_(0) {
                if (max_slots == 0 || max_slots > index_type::kRepresentableSlots) {
                    throw std::invalid_argument("SlabRegistry: max_slots must be in [1, "
                        + std::to_string(index_type::kRepresentableSlots) + "], got "
                        + std::to_string(max_slots));
                }
            }

            /**
             * Store an element in the lowest free slot, appending a slot only
             * when none is free. This is the only place an index is assigned.
             *
             * @return the element's stable index
             * @throws SlabCapacityError when all max_slots() slots are in use;
             *         the registry is left unchanged
             */
            index_type push(T value) {
                const size_t pos = first_free_slot();
                if (pos >= max_slots_) {
                    warning() << "SlabRegistry: capacity of " << max_slots_
                              << " slots exhausted, push rejected";
                    throw SlabCapacityError(max_slots_);
                }
                return place(pos, std::move(value));
            }

            /**
             * Same as push() but reports capacity exhaustion as nullopt.
             */
            std::optional<index_type> try_push(T value) {
                const size_t pos = first_free_slot();
                if (pos >= max_slots_) {
                    warning() << "SlabRegistry: capacity of " << max_slots_
                              << " slots exhausted, push rejected";
                    return std::nullopt;
                }
                return place(pos, std::move(value));
            }

            /**
             * @return the element at idx, or nullptr if the slot is empty or
             *         out of range
             */
            const T* get(index_type idx) const {
                const size_t pos = idx.position();
                if (pos >= slots_.size() || !slots_[pos]) {
                    return nullptr;
                }
                return &*slots_[pos];
            }

            T* get_mut(index_type idx) {
                return const_cast<T*>(static_cast<const SlabRegistry*>(this)->get(idx));
            }

            bool contains(index_type idx) const {
                return get(idx) != nullptr;
            }

            /**
             * Free the slot at idx for re-use. The removed element no longer
             * reports an index. Trailing empty slots are dropped.
             *
             * Removing an empty or out-of-range index has no effect.
             */
            std::optional<T> remove(index_type idx) {
                const size_t pos = idx.position();
                if (pos >= slots_.size() || !slots_[pos]) {
                    return std::nullopt;
                }

                std::optional<T> removed(std::move(*slots_[pos]));
                slots_[pos].reset();
                --live_;
                Traits::set_index(*removed, std::nullopt);

                while (!slots_.empty() && !slots_.back()) {
                    slots_.pop_back();
                }

                trace() << "SlabRegistry: removed index " << idx << ", live=" << live_
                        << " slots=" << slots_.size();
                return removed;
            }

            /**
             * Remove every element, clearing their cached indexes.
             */
            void clear() {
                for (auto& slot : slots_) {
                    if (slot) {
                        Traits::set_index(*slot, std::nullopt);
                    }
                }
                slots_.clear();
                live_ = 0;
            }

            /**
             * Move all live elements out in ascending index order. The
             * registry is empty afterwards and the returned elements no
             * longer report an index.
             */
            std::vector<std::pair<index_type, T>> take_all() {
                std::vector<std::pair<index_type, T>> out;
                out.reserve(live_);
                for (size_t pos = 0; pos < slots_.size(); pos++) {
                    if (slots_[pos]) {
                        T& elem = *slots_[pos];
                        Traits::set_index(elem, std::nullopt);
                        out.emplace_back(index_type::from_raw(static_cast<Rep>(pos)), std::move(elem));
                    }
                }
                slots_.clear();
                live_ = 0;
                return out;
            }

            // Number of live elements (free slots excluded)
            size_t len() const { return live_; }
            bool is_empty() const { return live_ == 0; }

            // Length of the backing array, live and free slots
            size_t slot_count() const { return slots_.size(); }
            size_t max_slots() const { return max_slots_; }

            iterator begin() { return iterator(&slots_, 0); }
            iterator end() { return iterator(&slots_, slots_.size()); }
            const_iterator begin() const { return const_iterator(&slots_, 0); }
            const_iterator end() const { return const_iterator(&slots_, slots_.size()); }
            const_iterator cbegin() const { return begin(); }
            const_iterator cend() const { return end(); }

        private:
            size_t first_free_slot() const {
                for (size_t pos = 0; pos < slots_.size(); pos++) {
                    if (!slots_[pos]) {
                        return pos;
                    }
                }
                return slots_.size();
            }

            index_type place(size_t pos, T&& value) {
                const index_type idx = index_type::from_raw(static_cast<Rep>(pos));
                Traits::set_index(value, idx);
                if (pos == slots_.size()) {
                    slots_.emplace_back(std::move(value));
                } else {
                    slots_[pos].emplace(std::move(value));
                }
                ++live_;

                trace() << "SlabRegistry: pushed index " << idx << ", live=" << live_
                        << " slots=" << slots_.size();
                return idx;
            }

            slot_vector slots_;
            size_t max_slots_;
            size_t live_;
        };

    } // namespace state
} // namespace pollcache
