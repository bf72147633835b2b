#pragma once
#include <cstddef>
#include <mutex>
#include <optional>
#include <unordered_set>
#include <utility>
#include <vector>

#include "md/tick.hpp"

// Latest tick per token, shared by every shard worker (writers) and the
// sampling loop (reader). Last write wins regardless of which shard delivered
// it. The lock is only ever held for a map operation or a copy.
class TickCache {
public:
    // Returns the number of ticks stored.
    std::size_t put_many(std::vector<Tick>&& ticks) {
        std::lock_guard<std::mutex> lk(m_);
        std::size_t stored = 0;
        for (auto& t : ticks) {
            if (t.token == 0) continue;
            ticks_[t.token] = std::move(t);
            ++stored;
        }
        return stored;
    }

    void put(Tick t) {
        if (t.token == 0) return;
        std::lock_guard<std::mutex> lk(m_);
        ticks_[t.token] = std::move(t);
    }

    // Point-in-time copy.
    TickMap snapshot() const {
        std::lock_guard<std::mutex> lk(m_);
        return ticks_;
    }

    std::optional<Tick> get(InstrumentToken token) const {
        std::lock_guard<std::mutex> lk(m_);
        auto it = ticks_.find(token);
        if (it == ticks_.end()) return std::nullopt;
        return it->second;
    }

    std::size_t size() const {
        std::lock_guard<std::mutex> lk(m_);
        return ticks_.size();
    }

    // Drop entries for tokens no longer subscribed.
    void retain(const std::unordered_set<InstrumentToken>& keep) {
        std::lock_guard<std::mutex> lk(m_);
        for (auto it = ticks_.begin(); it != ticks_.end();) {
            if (keep.count(it->first)) ++it;
            else it = ticks_.erase(it);
        }
    }

    void clear() {
        std::lock_guard<std::mutex> lk(m_);
        ticks_.clear();
    }

private:
    mutable std::mutex m_;
    TickMap ticks_;
};
