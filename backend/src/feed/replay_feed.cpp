#include "replay_feed.hpp"

#include <fstream>
#include <iostream>

ReplayFeedConnection::ReplayFeedConnection(Options opts, std::unique_ptr<ITickDecoder> decoder)
    : opts_(std::move(opts)), decoder_(std::move(decoder)) {}

void ReplayFeedConnection::connect(const std::vector<InstrumentToken> &tokens, const Sink &sink)
{
    {
        std::lock_guard<std::mutex> lk(m_);
        if (closed_) {
            sink(FeedClosed{1000, "connection closed locally"});
            return;
        }
    }

    std::ifstream in(opts_.path);
    if (!in.is_open()) {
        sink(FeedError{-1, "cannot open replay file " + opts_.path});
        return;
    }

    subscribed_.clear();
    std::cout << "[replay] streaming " << opts_.path << " for " << tokens.size() << " tokens" << std::endl;
    sink(FeedConnected{});

    std::string line;
    std::vector<Tick> decoded;
    bool frame_seen = false; // in the current pass over the file
    for (;;) {
        if (!std::getline(in, line)) {
            if (!opts_.loop || !frame_seen) break;
            frame_seen = false;
            in.clear();
            in.seekg(0);
            continue;
        }
        if (line.empty() || line[0] == '#') continue;
        frame_seen = true;

        decoded.clear();
        if (decoder_ && decoder_->decode(line, false, decoded)) {
            FeedTicks batch;
            for (auto &t : decoded) {
                if (subscribed_.count(t.token)) batch.ticks.push_back(std::move(t));
            }
            if (!batch.ticks.empty()) sink(std::move(batch));
        }

        if (!wait_interval()) {
            sink(FeedClosed{1000, "connection closed locally"});
            return;
        }
    }
    // A finished replay stays connected and quiet, so the last ticks remain
    // the latest ones until the session is closed.
    std::cout << "[replay] " << opts_.path << " finished; idling until closed" << std::endl;
    {
        std::unique_lock<std::mutex> lk(m_);
        cv_.wait(lk, [this] { return closed_; });
    }
    sink(FeedClosed{1000, "replay finished"});
}

void ReplayFeedConnection::subscribe_full(const std::vector<InstrumentToken> &tokens)
{
    subscribed_.insert(tokens.begin(), tokens.end());
}

void ReplayFeedConnection::close() noexcept
{
    {
        std::lock_guard<std::mutex> lk(m_);
        closed_ = true;
    }
    cv_.notify_all();
}

// false once closed
bool ReplayFeedConnection::wait_interval()
{
    std::unique_lock<std::mutex> lk(m_);
    return !cv_.wait_for(lk, opts_.interval, [this] { return closed_; });
}
