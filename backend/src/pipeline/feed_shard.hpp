#pragma once
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <memory>
#include <mutex>
#include <thread>
#include <vector>

#include "feed/feed_connection.hpp"
#include "tick_cache.hpp"

enum class ShardState : std::uint8_t {
    Disconnected,
    Connecting,
    Connected,
    Reconnecting,
    Exhausted
};

const char* to_string(ShardState s);

struct ShardCounters {
    std::uint64_t ticks_received{0};
    std::uint64_t reconnect_count{0};
    std::uint64_t error_count{0};
};

// One feed connection plus its exclusively assigned tokens.
//
// The worker thread drives
//   Disconnected -> Connecting -> Connected -> (Error|Closed) -> Reconnecting
//     -> Connected | Exhausted
// Every entry into Connected re-subscribes the full token set in full-depth
// mode. Reconnect delays grow exponentially up to reconnect_max_delay; after
// reconnect_max_tries consecutive failed attempts the shard is Exhausted and
// stays down until it is rebuilt.
class FeedShard {
public:
    struct Options {
        int reconnect_max_tries{50};
        std::chrono::milliseconds reconnect_initial_delay{1000};
        std::chrono::milliseconds reconnect_max_delay{30000};
    };

    FeedShard(std::size_t index,
              std::vector<InstrumentToken> tokens,
              std::unique_ptr<IFeedConnection> conn,
              TickCache& cache,
              Options opts);
    ~FeedShard();

    FeedShard(const FeedShard&) = delete;
    FeedShard& operator=(const FeedShard&) = delete;

    void start();
    // Best-effort; safe to call repeatedly and after exhaustion.
    void stop() noexcept;

    ShardState state() const noexcept { return state_.load(std::memory_order_acquire); }
    ShardCounters counters() const noexcept;
    int attempts() const noexcept { return attempt_.load(std::memory_order_relaxed); }

    std::size_t index() const noexcept { return index_; }
    const std::vector<InstrumentToken>& tokens() const noexcept { return tokens_; }

    // Delay before reconnect attempt `attempt` (1-based).
    static std::chrono::milliseconds backoff_delay(int attempt,
                                                   std::chrono::milliseconds initial,
                                                   std::chrono::milliseconds max);

private:
    void run();
    void set_state(ShardState s);
    bool wait_backoff(std::chrono::milliseconds d);

    void handle(FeedConnected& ev);
    void handle(FeedTicks& ev);
    void handle(FeedClosed& ev);
    void handle(FeedError& ev);

    std::size_t index_;
    std::vector<InstrumentToken> tokens_;
    std::unique_ptr<IFeedConnection> conn_;
    TickCache& cache_;
    Options opts_;

    std::atomic<ShardState> state_{ShardState::Disconnected};
    std::atomic<std::uint64_t> ticks_{0};
    std::atomic<std::uint64_t> reconnects_{0};
    std::atomic<std::uint64_t> errors_{0};
    std::atomic<int> attempt_{0};

    std::atomic<bool> stop_{false};
    std::mutex m_;
    std::condition_variable cv_;
    std::thread worker_;
};
