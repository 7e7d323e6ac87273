// SPDX-License-Identifier: GPL-3.0-or-later
/*
 * Curator - A music library recommendation core
 * Copyright (C) 2024 Max Qian
 *
 * This program is free software: you can redistribute it and/or modify
 * it under the terms of the GNU General Public License as published by
 * the Free Software Foundation, either version 3 of the License, or
 * (at your option) any later version.
 *
 * This program is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
 * GNU General Public License for more details.
 *
 * You should have received a copy of the GNU General Public License
 * along with this program.  If not, see <https://www.gnu.org/licenses/>.
 */

#ifndef CURATOR_CACHE_BOUNDED_CACHE_HPP
#define CURATOR_CACHE_BOUNDED_CACHE_HPP

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <exception>
#include <future>
#include <list>
#include <map>
#include <memory>
#include <mutex>
#include <thread>
#include <unordered_map>

#include <spdlog/spdlog.h>

#include "cache.hpp"
#include "exception/exception.hpp"

namespace curator::cache {

/**
 * @brief Tuning knobs of a BoundedCache
 */
struct BoundedCacheOptions {
    size_t maxSize = 1000;
    Ttl defaultTtl = std::chrono::minutes(30);

    /// Background sweep period; zero disables the sweeper thread
    std::chrono::milliseconds sweepInterval{std::chrono::minutes(1)};

    /// Upper bound of expired entries removed per lock acquisition
    size_t sweepBatchSize = 256;

    /// How often a coalesced waiter re-checks its own stop token
    std::chrono::milliseconds waitPollInterval{20};

    /// Per-entry estimate used by CacheStatistics::approximateMemory
    size_t approximateEntryBytes = 32 + 1024 + 48;
};

/**
 * @brief Thread-safe LRU cache with TTL and stampede prevention
 *
 * Entries live in a recency list (front = most recent) indexed by key, and
 * entries with an expiry are also indexed by expiry time so that sweeps
 * touch only expired entries. Both set() and getOrCompute() insert through
 * insertLocked(), which is the only place capacity is enforced.
 *
 * Concurrent getOrCompute() calls for one absent key share an in-flight
 * std::shared_future. Waiters poll their own stop token while waiting; a
 * waiter whose token fires gets OperationCancelledException, while a waiter
 * that sees the computing caller's cancellation retries the computation.
 * Factory failures propagate to every waiter and are never cached.
 *
 * @tparam Key   Hashable key type
 * @tparam Value Copyable value type
 */
template <typename Key, typename Value, typename Hash = std::hash<Key>>
class BoundedCache final : public ICache<Key, Value> {
public:
    using Factory = typename ICache<Key, Value>::Factory;
    using SteadyClock = std::chrono::steady_clock;

    explicit BoundedCache(BoundedCacheOptions options = {})
        : options_(options) {
        if (options_.maxSize == 0) {
            THROW_CURATOR_EXCEPTION("BoundedCache maxSize must be at least 1");
        }
        if (options_.sweepBatchSize == 0) {
            options_.sweepBatchSize = 1;
        }
        if (options_.sweepInterval.count() > 0) {
            sweeper_ = std::thread(&BoundedCache::sweepPeriodically, this);
        }
    }

    ~BoundedCache() override {
        {
            std::lock_guard<std::mutex> lock(stopMutex_);
            stopSweeper_.store(true);
        }
        stopCond_.notify_one();
        if (sweeper_.joinable()) {
            sweeper_.join();
        }
    }

    BoundedCache(const BoundedCache&) = delete;
    BoundedCache& operator=(const BoundedCache&) = delete;

    [[nodiscard]] auto get(const Key& key) -> std::optional<Value> override {
        std::lock_guard<std::mutex> lock(mutex_);
        auto value = lookupLocked(key);
        if (value) {
            ++hits_;
        } else {
            ++misses_;
        }
        return value;
    }

    [[nodiscard]] auto contains(const Key& key) const -> bool {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = index_.find(key);
        return it != index_.end() &&
               !isExpired(*it->second, SteadyClock::now());
    }

    void set(const Key& key, Value value, Ttl ttl = std::nullopt) override {
        std::lock_guard<std::mutex> lock(mutex_);
        insertLocked(key, std::move(value), ttl);
    }

    auto getOrCompute(const Key& key, const Factory& factory,
                      Ttl ttl = std::nullopt, std::stop_token stop = {})
        -> Value override {
        while (true) {
            std::shared_ptr<Flight> flight;
            bool owner = false;
            {
                std::lock_guard<std::mutex> lock(mutex_);
                if (auto cached = lookupLocked(key)) {
                    ++hits_;
                    return *cached;
                }
                if (auto it = inflight_.find(key); it != inflight_.end()) {
                    // Coalesced callers are served without running the
                    // factory, so they count as hits.
                    ++hits_;
                    flight = it->second;
                } else {
                    ++misses_;
                    flight = std::make_shared<Flight>();
                    flight->result = flight->promise.get_future().share();
                    inflight_.emplace(key, flight);
                    owner = true;
                }
            }

            if (owner) {
                return computeAndPublish(key, factory, ttl, stop, flight);
            }

            while (flight->result.wait_for(options_.waitPollInterval) !=
                   std::future_status::ready) {
                if (stop.stop_requested()) {
                    THROW_OPERATION_CANCELLED(
                        "Cancelled while waiting for in-flight computation");
                }
            }

            try {
                return flight->result.get();
            } catch (const OperationCancelledException&) {
                if (stop.stop_requested()) {
                    throw;
                }
                spdlog::debug(
                    "In-flight computation was cancelled by its owner, "
                    "retrying");
            }
        }
    }

    /**
     * @brief Run getOrCompute() on a separate thread
     */
    [[nodiscard]] auto getOrComputeAsync(const Key& key, Factory factory,
                                         Ttl ttl = std::nullopt,
                                         std::stop_token stop = {})
        -> std::future<Value> {
        return std::async(std::launch::async,
                          [this, key, factory = std::move(factory), ttl,
                           stop]() { return getOrCompute(key, factory, ttl, stop); });
    }

    auto remove(const Key& key) -> bool override {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = index_.find(key);
        if (it == index_.end()) {
            return false;
        }
        eraseLocked(it->second);
        return true;
    }

    void clear() override {
        std::lock_guard<std::mutex> lock(mutex_);
        entries_.clear();
        index_.clear();
        expiryIndex_.clear();
    }

    /**
     * @brief Remove every expired entry
     *
     * Work is split into batches of sweepBatchSize, releasing the lock
     * between batches.
     * @return Number of entries removed
     */
    auto purgeExpired() -> size_t override {
        size_t removed = 0;
        while (true) {
            std::lock_guard<std::mutex> lock(mutex_);
            auto now = SteadyClock::now();
            size_t batch = 0;
            while (batch < options_.sweepBatchSize && !expiryIndex_.empty() &&
                   expiryIndex_.begin()->first <= now) {
                auto it = index_.find(expiryIndex_.begin()->second);
                eraseLocked(it->second);
                ++expirations_;
                ++batch;
            }
            removed += batch;
            if (batch < options_.sweepBatchSize) {
                break;
            }
        }
        return removed;
    }

    [[nodiscard]] auto statistics() const -> CacheStatistics override {
        std::lock_guard<std::mutex> lock(mutex_);
        CacheStatistics stats;
        stats.size = index_.size();
        stats.maxSize = options_.maxSize;
        stats.hits = hits_;
        stats.misses = misses_;
        stats.evictions = evictions_;
        stats.expirations = expirations_;
        auto total = hits_ + misses_;
        stats.hitRate = total == 0 ? 0.0
                                   : static_cast<double>(hits_) /
                                         static_cast<double>(total);
        stats.approximateMemory =
            1024 + stats.size * options_.approximateEntryBytes;
        return stats;
    }

    [[nodiscard]] auto size() const -> size_t {
        std::lock_guard<std::mutex> lock(mutex_);
        return index_.size();
    }

private:
    using ExpiryIndex = std::multimap<SteadyClock::time_point, Key>;

    struct Entry {
        Key key;
        Value value;
        SteadyClock::time_point insertedAt;
        SteadyClock::time_point lastAccessedAt;
        std::optional<typename ExpiryIndex::iterator> expiry;
    };

    using EntryList = std::list<Entry>;

    struct Flight {
        std::promise<Value> promise;
        std::shared_future<Value> result;
    };

    auto computeAndPublish(const Key& key, const Factory& factory, Ttl ttl,
                           std::stop_token stop,
                           const std::shared_ptr<Flight>& flight) -> Value {
        try {
            Value value = factory(stop);
            {
                std::lock_guard<std::mutex> lock(mutex_);
                insertLocked(key, value, ttl);
                releaseFlightLocked(key, flight);
            }
            flight->promise.set_value(value);
            return value;
        } catch (...) {
            {
                std::lock_guard<std::mutex> lock(mutex_);
                releaseFlightLocked(key, flight);
            }
            flight->promise.set_exception(std::current_exception());
            throw;
        }
    }

    void releaseFlightLocked(const Key& key,
                             const std::shared_ptr<Flight>& flight) {
        auto it = inflight_.find(key);
        if (it != inflight_.end() && it->second == flight) {
            inflight_.erase(it);
        }
    }

    static auto isExpired(const Entry& entry, SteadyClock::time_point now)
        -> bool {
        return entry.expiry && (*entry.expiry)->first <= now;
    }

    auto lookupLocked(const Key& key) -> std::optional<Value> {
        auto it = index_.find(key);
        if (it == index_.end()) {
            return std::nullopt;
        }
        auto now = SteadyClock::now();
        if (isExpired(*it->second, now)) {
            eraseLocked(it->second);
            ++expirations_;
            return std::nullopt;
        }
        it->second->lastAccessedAt = now;
        entries_.splice(entries_.begin(), entries_, it->second);
        return entries_.front().value;
    }

    void insertLocked(const Key& key, Value value, Ttl ttl) {
        auto now = SteadyClock::now();
        Ttl effective = ttl ? ttl : options_.defaultTtl;

        auto it = index_.find(key);
        if (it != index_.end()) {
            auto entryIt = it->second;
            if (entryIt->expiry) {
                expiryIndex_.erase(*entryIt->expiry);
                entryIt->expiry.reset();
            }
            entryIt->value = std::move(value);
            entryIt->insertedAt = now;
            entryIt->lastAccessedAt = now;
            if (effective) {
                entryIt->expiry = expiryIndex_.emplace(now + *effective, key);
            }
            entries_.splice(entries_.begin(), entries_, entryIt);
            return;
        }

        Entry entry{key, std::move(value), now, now, std::nullopt};
        if (effective) {
            entry.expiry = expiryIndex_.emplace(now + *effective, key);
        }
        entries_.push_front(std::move(entry));
        index_.emplace(key, entries_.begin());
        evictToCapacityLocked();
    }

    void evictToCapacityLocked() {
        while (index_.size() > options_.maxSize) {
            auto victim = std::prev(entries_.end());
            eraseLocked(victim);
            ++evictions_;
        }
    }

    void eraseLocked(typename EntryList::iterator entryIt) {
        if (entryIt->expiry) {
            expiryIndex_.erase(*entryIt->expiry);
        }
        index_.erase(entryIt->key);
        entries_.erase(entryIt);
    }

    void sweepPeriodically() {
        std::unique_lock<std::mutex> lock(stopMutex_);
        while (!stopSweeper_.load()) {
            if (stopCond_.wait_for(lock, options_.sweepInterval,
                                   [this] { return stopSweeper_.load(); })) {
                break;
            }
            lock.unlock();
            try {
                auto removed = purgeExpired();
                if (removed > 0) {
                    spdlog::debug("Cache sweep: removed {} expired entries",
                                  removed);
                }
            } catch (const std::exception& e) {
                spdlog::error("Exception in cache sweep: {}", e.what());
            }
            lock.lock();
        }
    }

    BoundedCacheOptions options_;

    mutable std::mutex mutex_;
    EntryList entries_;
    std::unordered_map<Key, typename EntryList::iterator, Hash> index_;
    ExpiryIndex expiryIndex_;
    std::unordered_map<Key, std::shared_ptr<Flight>, Hash> inflight_;

    std::uint64_t hits_ = 0;
    std::uint64_t misses_ = 0;
    std::uint64_t evictions_ = 0;
    std::uint64_t expirations_ = 0;

    std::thread sweeper_;
    std::mutex stopMutex_;
    std::condition_variable stopCond_;
    std::atomic<bool> stopSweeper_{false};
};

}  // namespace curator::cache

#endif  // CURATOR_CACHE_BOUNDED_CACHE_HPP
