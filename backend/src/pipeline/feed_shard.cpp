#include "feed_shard.hpp"

#include <algorithm>
#include <iostream>
#include <variant>

const char* to_string(ShardState s) {
    switch (s) {
        case ShardState::Disconnected: return "Disconnected";
        case ShardState::Connecting:   return "Connecting";
        case ShardState::Connected:    return "Connected";
        case ShardState::Reconnecting: return "Reconnecting";
        case ShardState::Exhausted:    return "Exhausted";
    }
    return "Unknown";
}

FeedShard::FeedShard(std::size_t index,
                     std::vector<InstrumentToken> tokens,
                     std::unique_ptr<IFeedConnection> conn,
                     TickCache& cache,
                     Options opts)
    : index_(index),
      tokens_(std::move(tokens)),
      conn_(std::move(conn)),
      cache_(cache),
      opts_(opts) {}

FeedShard::~FeedShard() { stop(); }

void FeedShard::start() {
    if (worker_.joinable() || !conn_) return;
    stop_.store(false, std::memory_order_relaxed);
    worker_ = std::thread([this] { run(); });
}

void FeedShard::stop() noexcept {
    {
        std::lock_guard<std::mutex> lk(m_);
        stop_.store(true, std::memory_order_relaxed);
    }
    cv_.notify_all();
    if (conn_) conn_->close();

    try {
        if (worker_.joinable()) worker_.join();
    } catch (const std::exception& e) {
        std::cerr << "[shard " << index_ << "] stop: " << e.what() << std::endl;
    }
    if (state() != ShardState::Exhausted) set_state(ShardState::Disconnected);
}

ShardCounters FeedShard::counters() const noexcept {
    ShardCounters c;
    c.ticks_received = ticks_.load(std::memory_order_relaxed);
    c.reconnect_count = reconnects_.load(std::memory_order_relaxed);
    c.error_count = errors_.load(std::memory_order_relaxed);
    return c;
}

std::chrono::milliseconds FeedShard::backoff_delay(int attempt,
                                                   std::chrono::milliseconds initial,
                                                   std::chrono::milliseconds max) {
    const int shift = std::clamp(attempt - 1, 0, 20);
    const std::chrono::milliseconds d{initial.count() * (std::int64_t{1} << shift)};
    return std::min(d, max);
}

void FeedShard::set_state(ShardState s) {
    state_.store(s, std::memory_order_release);
}

// false once stop was requested
bool FeedShard::wait_backoff(std::chrono::milliseconds d) {
    std::unique_lock<std::mutex> lk(m_);
    return !cv_.wait_for(lk, d, [this] { return stop_.load(std::memory_order_relaxed); });
}

void FeedShard::run() {
    const IFeedConnection::Sink sink = [this](FeedEvent ev) {
        std::visit([this](auto& e) { handle(e); }, ev);
    };

    while (!stop_.load(std::memory_order_relaxed)) {
        set_state(ShardState::Connecting);
        try {
            conn_->connect(tokens_, sink);
        } catch (const std::exception& e) {
            errors_.fetch_add(1, std::memory_order_relaxed);
            std::cerr << "[shard " << index_ << "] session failed: " << e.what() << std::endl;
        }
        if (stop_.load(std::memory_order_relaxed)) break;

        const int attempt = attempt_.fetch_add(1, std::memory_order_relaxed) + 1;
        if (attempt > opts_.reconnect_max_tries) {
            set_state(ShardState::Exhausted);
            std::cerr << "[shard " << index_ << "] EXHAUSTED after "
                      << opts_.reconnect_max_tries << " reconnect attempts; "
                      << tokens_.size() << " tokens have no coverage until the shard is rebuilt"
                      << std::endl;
            return;
        }

        set_state(ShardState::Reconnecting);
        reconnects_.fetch_add(1, std::memory_order_relaxed);
        const auto delay = backoff_delay(attempt, opts_.reconnect_initial_delay, opts_.reconnect_max_delay);
        std::cout << "[shard " << index_ << "] reconnecting, attempt " << attempt
                  << "/" << opts_.reconnect_max_tries << " in " << delay.count() << "ms"
                  << std::endl;
        if (!wait_backoff(delay)) break;
    }
}

void FeedShard::handle(FeedConnected&) {
    set_state(ShardState::Connected);
    attempt_.store(0, std::memory_order_relaxed);
    std::cout << "[shard " << index_ << "] connected; subscribing "
              << tokens_.size() << " tokens in full mode" << std::endl;
    // Subscriptions do not survive a reconnect; redo them on every connect.
    conn_->subscribe_full(tokens_);
}

void FeedShard::handle(FeedTicks& ev) {
    const auto stored = cache_.put_many(std::move(ev.ticks));
    ticks_.fetch_add(stored, std::memory_order_relaxed);
}

void FeedShard::handle(FeedClosed& ev) {
    std::cout << "[shard " << index_ << "] closed: code=" << ev.code
              << " reason=" << ev.reason << std::endl;
}

void FeedShard::handle(FeedError& ev) {
    errors_.fetch_add(1, std::memory_order_relaxed);
    std::cerr << "[shard " << index_ << "] error: code=" << ev.code
              << " reason=" << ev.reason << std::endl;
}
