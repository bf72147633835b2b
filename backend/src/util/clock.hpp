#pragma once
#include <chrono>
#include <cstdint>
#include <mutex>

// Time source for components that need both a wall-clock instant and a
// monotonic clock for interval measurement.
struct IClock {
    virtual ~IClock() = default;
    virtual std::chrono::steady_clock::time_point steady_now() const = 0;
    // Microseconds since the Unix epoch (UTC), truncated.
    virtual std::int64_t utc_micros() const = 0;
};

class SystemClock final : public IClock {
public:
    std::chrono::steady_clock::time_point steady_now() const override {
        return std::chrono::steady_clock::now();
    }
    std::int64_t utc_micros() const override {
        using namespace std::chrono;
        return duration_cast<microseconds>(system_clock::now().time_since_epoch()).count();
    }

    static const SystemClock& instance() {
        static SystemClock clock;
        return clock;
    }
};

// Clock that only moves when told to. Both readings advance together.
class ManualClock final : public IClock {
public:
    explicit ManualClock(std::int64_t utc_micros)
        : utc_us_(utc_micros), steady_(std::chrono::steady_clock::time_point{}) {}

    std::chrono::steady_clock::time_point steady_now() const override {
        std::lock_guard<std::mutex> lk(m_);
        return steady_;
    }
    std::int64_t utc_micros() const override {
        std::lock_guard<std::mutex> lk(m_);
        return utc_us_;
    }

    void advance(std::chrono::microseconds d) {
        std::lock_guard<std::mutex> lk(m_);
        utc_us_ += d.count();
        steady_ += d;
    }

private:
    mutable std::mutex m_;
    std::int64_t utc_us_;
    std::chrono::steady_clock::time_point steady_;
};
