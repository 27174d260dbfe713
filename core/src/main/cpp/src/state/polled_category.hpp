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

#include <atomic>
#include <memory>
#include <optional>
#include <shared_mutex>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <utility>
#include "conditional_read.h"
#include "mt_version_stamp.h"
#include "slab_registry.hpp"
#include "state_config.h"
#include "../util/log.h"

namespace pollcache {
namespace state {

/**
 * PolledCategory - one category of polled state (link health, status, ...)
 * together with the stamp versioning it.
 *
 * Readers take the shared lock; the single writer takes the exclusive lock,
 * applies its change and advances the stamp before releasing it. A reader
 * therefore always renders data that matches the header it returns.
 *
 * Each category owns its lock, stamp and sequence source; nothing here is
 * process-global.
 */
template<class Data>
class PolledCategory {
public:
    struct Stats {
        uint64_t polls;
        uint64_t unchanged_polls;
        uint64_t mutations;
    };

    explicit PolledCategory(std::string name,
                            const StateConfig& config = StateConfig::defaults(),
                            Data data = Data())
        : PolledCategory(std::move(name),
                         std::make_shared<SystemSequenceSource>(&SystemSequenceSource::system_clock_ms,
                                                                checked(config).clock_rollback_allowance_ms),
                         std::move(data)) {}

    PolledCategory(std::string name, std::shared_ptr<SequenceSource> source, Data data = Data())
        : name_(std::move(name)), data_(std::move(data)), stamp_(std::move(source)) {}

    PolledCategory(const PolledCategory&) = delete;
    PolledCategory& operator=(const PolledCategory&) = delete;

    /**
     * Apply a change under the exclusive lock and advance the stamp.
     *
     * Once fn has been entered the stamp advances, also when fn throws.
     * The result is returned by value.
     */
    template<class Fn>
    auto mutate(Fn&& fn) -> typename std::decay<decltype(fn(std::declval<Data&>()))>::type {
        typedef typename std::decay<decltype(fn(std::declval<Data&>()))>::type Result;

        std::unique_lock<std::shared_mutex> lock(mutex_);
        if constexpr (std::is_void<Result>::value) {
            try {
                fn(data_);
            } catch (...) {
                advance_after_failure();
                throw;
            }
            advance();
        } else {
            std::optional<Result> result;
            try {
                result.emplace(fn(data_));
            } catch (...) {
                advance_after_failure();
                throw;
            }
            advance();
            return std::move(*result);
        }
    }

    /**
     * Like mutate(), but fn reports whether it changed anything; the stamp
     * only advances when it did, or when fn throws.
     */
    template<class Fn>
    bool mutate_if(Fn&& fn) {
        std::unique_lock<std::shared_mutex> lock(mutex_);
        bool changed = false;
        try {
            changed = fn(data_);
        } catch (...) {
            advance_after_failure();
            throw;
        }
        if (changed) {
            advance();
        }
        return changed;
    }

    /**
     * Direct access for consumers holding the shared lock.
     */
    template<class Fn>
    auto read(Fn&& fn) const -> decltype(fn(std::declval<const Data&>())) {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        return fn(static_cast<const Data&>(data_));
    }

    /**
     * Conditional read. render(const Data&) builds the payload and is only
     * called when the caller's copy is stale.
     */
    template<class Render>
    auto poll(const PollRequest& request, Render&& render) const
        -> PollResult<typename std::decay<decltype(render(std::declval<const Data&>()))>::type> {
        typedef typename std::decay<decltype(render(std::declval<const Data&>()))>::type Payload;

        std::shared_lock<std::shared_mutex> lock(mutex_);
        PollResult<Payload> result;
        result.header = stamp_.token();
        result.outcome = evaluate_poll(result.header, request);
        if (result.outcome == ReadOutcome::Full) {
            result.payload = render(static_cast<const Data&>(data_));
        }
        lock.unlock();

        polls_.fetch_add(1, std::memory_order_relaxed);
        if (result.unchanged()) {
            unchanged_polls_.fetch_add(1, std::memory_order_relaxed);
        }
        return result;
    }

    VersionToken token() const {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        return stamp_.token();
    }

    VersionStamp stamp() const {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        return stamp_.snapshot();
    }

    const std::string& name() const { return name_; }

    Stats stats() const {
        Stats s;
        s.polls = polls_.load(std::memory_order_relaxed);
        s.unchanged_polls = unchanged_polls_.load(std::memory_order_relaxed);
        s.mutations = mutations_.load(std::memory_order_relaxed);
        return s;
    }

private:
    static const StateConfig& checked(const StateConfig& config) {
        if (!config.validate()) {
            warning() << "PolledCategory: rejecting invalid state configuration (max_slots="
                      << config.registry_max_slots << ", rollback_ms="
                      << config.clock_rollback_allowance_ms << ")";
            throw std::invalid_argument("PolledCategory: invalid StateConfig");
        }
        return config;
    }

    // Caller holds the exclusive lock
    void advance_after_failure() {
        warning() << "PolledCategory[" << name_ << "]: mutation threw, advancing stamp anyway";
        advance();
    }

    // Caller holds the exclusive lock
    void advance() {
        if (stamp_.increment() == EpochState::Resynced) {
            info() << "PolledCategory[" << name_ << "]: stamp resynced, pollers will refetch";
        }
        mutations_.fetch_add(1, std::memory_order_relaxed);
    }

    std::string name_;
    mutable std::shared_mutex mutex_;
    Data data_;
    MTVersionStamp stamp_;

    mutable std::atomic<uint64_t> polls_{0};
    mutable std::atomic<uint64_t> unchanged_polls_{0};
    std::atomic<uint64_t> mutations_{0};
};

/**
 * PolledRegistry - PolledCategory whose data is a SlabRegistry.
 *
 * Consumers keep the index returned by insert() and use lookup()/update()
 * for O(1) access. A miss means the element is gone; it is not an error.
 */
template<typename T, typename Rep = slab::IndexRep>
class PolledRegistry {
public:
    typedef SlabRegistry<T, Rep> registry_type;
    typedef typename registry_type::index_type index_type;

    explicit PolledRegistry(std::string name, const StateConfig& config = StateConfig::defaults())
        : category_(std::move(name), config, registry_type(config.registry_max_slots)) {}

    PolledRegistry(std::string name, std::shared_ptr<SequenceSource> source,
                   size_t max_slots = index_type::kRepresentableSlots)
        : category_(std::move(name), std::move(source), registry_type(max_slots)) {}

    /**
     * @throws SlabCapacityError when the registry is full; the stamp is not
     *         advanced in that case
     */
    index_type insert(T value) {
        std::optional<index_type> idx;
        size_t max_slots = 0;
        category_.mutate_if([&](registry_type& reg) {
            idx = reg.try_push(std::move(value));
            max_slots = reg.max_slots();
            return idx.has_value();
        });
        if (!idx) {
            throw SlabCapacityError(max_slots);
        }
        return *idx;
    }

    std::optional<T> erase(index_type idx) {
        std::optional<T> removed;
        category_.mutate_if([&](registry_type& reg) {
            removed = reg.remove(idx);
            return removed.has_value();
        });
        return removed;
    }

    /**
     * Modify the element at idx in place. Returns false on a miss, in which
     * case the stamp does not move.
     */
    template<class Fn>
    bool update(index_type idx, Fn&& fn) {
        return category_.mutate_if([&](registry_type& reg) {
            T* elem = reg.get_mut(idx);
            if (!elem) {
                return false;
            }
            fn(*elem);
            return true;
        });
    }

    template<class Fn>
    bool lookup(index_type idx, Fn&& fn) const {
        return category_.read([&](const registry_type& reg) {
            const T* elem = reg.get(idx);
            if (!elem) {
                return false;
            }
            fn(*elem);
            return true;
        });
    }

    /**
     * Change several elements as one step; pollers see either none or all
     * of it under a single new stamp.
     */
    template<class Fn>
    auto mutate(Fn&& fn) {
        return category_.mutate(std::forward<Fn>(fn));
    }

    template<class Render>
    auto poll(const PollRequest& request, Render&& render) const {
        return category_.poll(request, std::forward<Render>(render));
    }

    template<class Fn>
    auto read(Fn&& fn) const {
        return category_.read(std::forward<Fn>(fn));
    }

    size_t size() const {
        return category_.read([](const registry_type& reg) { return reg.len(); });
    }

    VersionToken token() const { return category_.token(); }
    const std::string& name() const { return category_.name(); }
    typename PolledCategory<registry_type>::Stats stats() const { return category_.stats(); }

private:
    PolledCategory<registry_type> category_;
};

} // namespace state
} // namespace pollcache
