#pragma once

#include <algorithm>
#include <chrono>
#include <cstddef>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>

namespace tribe {

// Score cache with a fixed time-to-live. Entries remember both ids so a
// profile or membership change can drop everything that mentions it.
// Expired entries are swept at most once per TTL on insert; at capacity the
// entry closest to expiry is evicted.
template <typename Value>
class TtlCache
{
public:
    using Clock = std::chrono::steady_clock;

    static constexpr std::size_t kDefaultCapacity = 50000;

    explicit TtlCache(std::chrono::seconds ttl, std::size_t capacity = kDefaultCapacity)
        : ttl_(ttl), capacity_(std::max<std::size_t>(1, capacity)) {}

    std::optional<Value> get(const std::string& userId, const std::string& targetId,
                             const std::string& variant, Clock::time_point now = Clock::now())
    {
        std::lock_guard<std::mutex> lock(mutex_);
        const auto it = entries_.find(Key(userId, targetId, variant));
        if (it == entries_.end())
            return std::nullopt;
        if (now >= it->second.expires)
        {
            entries_.erase(it);
            return std::nullopt;
        }
        return it->second.value;
    }

    void put(const std::string& userId, const std::string& targetId, const std::string& variant,
             Value value, Clock::time_point now = Clock::now())
    {
        if (ttl_.count() <= 0)
            return;
        std::lock_guard<std::mutex> lock(mutex_);
        if (now >= nextSweep_)
        {
            purgeLocked(now);
            nextSweep_ = now + ttl_;
        }

        std::string key = Key(userId, targetId, variant);
        if (entries_.size() >= capacity_ && entries_.find(key) == entries_.end())
        {
            if (purgeLocked(now) == 0)
                evictOneLocked();
        }
        entries_.insert_or_assign(std::move(key), Entry{userId, targetId, now + ttl_, std::move(value)});
    }

    // Drops every expired entry. Returns the count.
    std::size_t purgeExpired(Clock::time_point now = Clock::now())
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return purgeLocked(now);
    }

    // Drops every entry where id is the user or the target. Returns the count.
    std::size_t invalidate(const std::string& id)
    {
        std::lock_guard<std::mutex> lock(mutex_);
        std::size_t dropped = 0;
        for (auto it = entries_.begin(); it != entries_.end();)
        {
            if (it->second.userId == id || it->second.targetId == id)
            {
                it = entries_.erase(it);
                ++dropped;
            }
            else
            {
                ++it;
            }
        }
        return dropped;
    }

    void clear()
    {
        std::lock_guard<std::mutex> lock(mutex_);
        entries_.clear();
    }

    std::size_t size() const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return entries_.size();
    }

    std::size_t capacity() const noexcept { return capacity_; }

private:
    struct Entry
    {
        std::string       userId;
        std::string       targetId;
        Clock::time_point expires;
        Value             value;
    };

    static std::string Key(const std::string& userId, const std::string& targetId, const std::string& variant)
    {
        return userId + '\x1f' + targetId + '\x1f' + variant;
    }

    std::size_t purgeLocked(Clock::time_point now)
    {
        std::size_t dropped = 0;
        for (auto it = entries_.begin(); it != entries_.end();)
        {
            if (now >= it->second.expires)
            {
                it = entries_.erase(it);
                ++dropped;
            }
            else
            {
                ++it;
            }
        }
        return dropped;
    }

    void evictOneLocked()
    {
        if (entries_.empty())
            return;
        auto oldest = entries_.begin();
        for (auto it = entries_.begin(); it != entries_.end(); ++it)
            if (it->second.expires < oldest->second.expires)
                oldest = it;
        entries_.erase(oldest);
    }

    std::chrono::seconds                   ttl_;
    std::size_t                            capacity_;
    Clock::time_point                      nextSweep_{};
    mutable std::mutex                     mutex_;
    std::unordered_map<std::string, Entry> entries_;
};

} // namespace tribe
