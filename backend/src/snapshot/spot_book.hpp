#pragma once
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>

// Underlying -> spot price lookup used while building rows.
using SpotLookup = std::function<std::optional<double>(const std::string& underlying)>;

// Latest known spot price per underlying. Seeded from configuration and
// refreshed from index ticks by the sampling loop.
class SpotBook {
public:
    void set(const std::string& underlying, double spot) {
        std::lock_guard<std::mutex> lk(m_);
        spots_[underlying] = spot;
    }

    std::optional<double> get(const std::string& underlying) const {
        std::lock_guard<std::mutex> lk(m_);
        auto it = spots_.find(underlying);
        if (it == spots_.end()) return std::nullopt;
        return it->second;
    }

    std::unordered_map<std::string, double> all() const {
        std::lock_guard<std::mutex> lk(m_);
        return spots_;
    }

    // Lookup over a copy taken now; no locking while rows are built.
    SpotLookup frozen() const {
        return [spots = all()](const std::string& underlying) -> std::optional<double> {
            auto it = spots.find(underlying);
            if (it == spots.end()) return std::nullopt;
            return it->second;
        };
    }

private:
    mutable std::mutex m_;
    std::unordered_map<std::string, double> spots_;
};
