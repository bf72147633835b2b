#pragma once
#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <vector>

#include "feed/feed_connection.hpp"
#include "feed_shard.hpp"
#include "tick_cache.hpp"

// Read side of the feed as seen by the sampling loop.
struct ITickSource {
    virtual ~ITickSource() = default;
    // Point-in-time copy of the latest tick per token.
    virtual TickMap latest_ticks() const = 0;
    // True when every shard has given up reconnecting.
    virtual bool all_exhausted() const = 0;
};

struct ShardPlan {
    std::size_t requested{0}; // distinct tokens asked for
    std::size_t accepted{0};
    std::size_t dropped{0};   // beyond capacity, cut from the end of the input
    std::size_t shard_count{0};
};

struct FeedStats {
    std::uint64_t ticks_received{0};
    std::uint64_t reconnect_count{0};
    std::uint64_t error_count{0};
    std::size_t shard_count{0};
    std::size_t exhausted_shards{0};
};

struct ShardStatus {
    std::size_t index{0};
    ShardState state{ShardState::Disconnected};
    std::size_t tokens{0};
    int attempts{0};
    ShardCounters counters;
};

// Presents one logical tick source over several feed connections, hiding the
// per-connection subscription limit. Tokens are split into disjoint shards in
// input order; every shard feeds the same latest-tick cache.
class FeedOrchestrator final : public ITickSource {
public:
    static constexpr std::size_t MAX_TOKENS_PER_CONNECTION = 3000;
    static constexpr std::size_t MAX_CONNECTIONS = 3;

    using ConnectionFactory = std::function<std::unique_ptr<IFeedConnection>(std::size_t shard_index)>;

    struct Options {
        FeedShard::Options shard;
        std::size_t max_tokens_per_connection{MAX_TOKENS_PER_CONNECTION};
        std::size_t max_connections{MAX_CONNECTIONS};
    };

    FeedOrchestrator(ConnectionFactory factory, Options opts);
    ~FeedOrchestrator();

    FeedOrchestrator(const FeedOrchestrator&) = delete;
    FeedOrchestrator& operator=(const FeedOrchestrator&) = delete;

    // Rebuilds every shard. Duplicate tokens keep their first position; tokens
    // beyond capacity are dropped with a warning. If running, the old shards are
    // stopped and the new ones started.
    ShardPlan configure(const std::vector<InstrumentToken>& tokens);

    void start();
    void stop() noexcept;
    bool running() const;

    TickMap latest_ticks() const override;
    bool all_exhausted() const override;

    FeedStats stats() const;
    std::vector<ShardStatus> shard_status() const;

    // Splits de-duplicated `tokens` into chunks of at most `per_shard`, keeping
    // at most `max_shards` chunks. `dropped` receives the number of tokens cut.
    static std::vector<std::vector<InstrumentToken>> partition(const std::vector<InstrumentToken>& tokens,
                                                               std::size_t per_shard,
                                                               std::size_t max_shards,
                                                               std::size_t& dropped);

private:
    ConnectionFactory factory_;
    Options opts_;
    TickCache cache_;

    mutable std::mutex m_; // protects shards_ and running_
    std::vector<std::unique_ptr<FeedShard>> shards_;
    bool running_{false};
};
