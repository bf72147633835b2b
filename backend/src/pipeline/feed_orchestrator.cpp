#include "feed_orchestrator.hpp"

#include <algorithm>
#include <iostream>
#include <unordered_set>

FeedOrchestrator::FeedOrchestrator(ConnectionFactory factory, Options opts)
    : factory_(std::move(factory)), opts_(opts) {
    if (opts_.max_tokens_per_connection == 0) opts_.max_tokens_per_connection = MAX_TOKENS_PER_CONNECTION;
    if (opts_.max_connections == 0) opts_.max_connections = MAX_CONNECTIONS;
}

FeedOrchestrator::~FeedOrchestrator() { stop(); }

std::vector<std::vector<InstrumentToken>> FeedOrchestrator::partition(const std::vector<InstrumentToken>& tokens,
                                                                      std::size_t per_shard,
                                                                      std::size_t max_shards,
                                                                      std::size_t& dropped) {
    std::vector<InstrumentToken> unique;
    unique.reserve(tokens.size());
    std::unordered_set<InstrumentToken> seen;
    for (auto t : tokens) {
        if (seen.insert(t).second) unique.push_back(t);
    }

    const std::size_t capacity = per_shard * max_shards;
    dropped = unique.size() > capacity ? unique.size() - capacity : 0;
    if (dropped) unique.resize(capacity);

    std::vector<std::vector<InstrumentToken>> chunks;
    for (std::size_t i = 0; i < unique.size(); i += per_shard) {
        const std::size_t end = std::min(unique.size(), i + per_shard);
        chunks.emplace_back(unique.begin() + static_cast<std::ptrdiff_t>(i),
                            unique.begin() + static_cast<std::ptrdiff_t>(end));
    }
    return chunks;
}

ShardPlan FeedOrchestrator::configure(const std::vector<InstrumentToken>& tokens) {
    ShardPlan plan;
    std::size_t dropped = 0;
    auto chunks = partition(tokens, opts_.max_tokens_per_connection, opts_.max_connections, dropped);

    plan.dropped = dropped;
    plan.shard_count = chunks.size();
    for (const auto& c : chunks) plan.accepted += c.size();
    plan.requested = plan.accepted + plan.dropped;

    if (dropped) {
        std::cerr << "[feed] Token count (" << plan.requested << ") exceeds capacity ("
                  << opts_.max_tokens_per_connection * opts_.max_connections
                  << "); dropping the last " << dropped << " tokens." << std::endl;
    }

    std::vector<std::unique_ptr<FeedShard>> old;
    bool was_running = false;
    {
        std::lock_guard<std::mutex> lk(m_);
        old.swap(shards_);
        was_running = running_;
    }
    for (auto& s : old) s->stop();
    old.clear();

    std::unordered_set<InstrumentToken> keep;
    std::vector<std::unique_ptr<FeedShard>> fresh;
    for (std::size_t i = 0; i < chunks.size(); ++i) {
        keep.insert(chunks[i].begin(), chunks[i].end());
        auto conn = factory_ ? factory_(i) : nullptr;
        if (!conn) {
            std::cerr << "[feed] No connection for shard " << i << "; its "
                      << chunks[i].size() << " tokens are not covered." << std::endl;
            continue;
        }
        fresh.push_back(std::make_unique<FeedShard>(i, std::move(chunks[i]), std::move(conn), cache_, opts_.shard));
    }
    cache_.retain(keep);

    std::cout << "[feed] Configured " << fresh.size() << " shard(s) for "
              << plan.accepted << " tokens." << std::endl;

    std::lock_guard<std::mutex> lk(m_);
    shards_ = std::move(fresh);
    if (was_running) {
        for (auto& s : shards_) s->start();
    }
    return plan;
}

void FeedOrchestrator::start() {
    std::lock_guard<std::mutex> lk(m_);
    if (running_) return;
    running_ = true;
    for (auto& s : shards_) {
        std::cout << "[feed] Starting shard " << s->index() + 1 << "/" << shards_.size()
                  << " (" << s->tokens().size() << " tokens)" << std::endl;
        s->start();
    }
}

void FeedOrchestrator::stop() noexcept {
    std::lock_guard<std::mutex> lk(m_);
    running_ = false;
    for (auto& s : shards_) s->stop();
}

bool FeedOrchestrator::running() const {
    std::lock_guard<std::mutex> lk(m_);
    return running_;
}

TickMap FeedOrchestrator::latest_ticks() const {
    return cache_.snapshot();
}

bool FeedOrchestrator::all_exhausted() const {
    std::lock_guard<std::mutex> lk(m_);
    if (shards_.empty()) return false;
    for (const auto& s : shards_) {
        if (s->state() != ShardState::Exhausted) return false;
    }
    return true;
}

FeedStats FeedOrchestrator::stats() const {
    FeedStats out;
    std::lock_guard<std::mutex> lk(m_);
    out.shard_count = shards_.size();
    for (const auto& s : shards_) {
        const auto c = s->counters();
        out.ticks_received += c.ticks_received;
        out.reconnect_count += c.reconnect_count;
        out.error_count += c.error_count;
        if (s->state() == ShardState::Exhausted) ++out.exhausted_shards;
    }
    return out;
}

std::vector<ShardStatus> FeedOrchestrator::shard_status() const {
    std::vector<ShardStatus> out;
    std::lock_guard<std::mutex> lk(m_);
    out.reserve(shards_.size());
    for (const auto& s : shards_) {
        ShardStatus st;
        st.index = s->index();
        st.state = s->state();
        st.tokens = s->tokens().size();
        st.attempts = s->attempts();
        st.counters = s->counters();
        out.push_back(st);
    }
    return out;
}
