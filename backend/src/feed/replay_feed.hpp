#pragma once
#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_set>

#include "feed_connection.hpp"
#include "md/tick_decoder.hpp"

// Replays a recorded feed: one frame per line of a text file, decoded with the
// injected decoder and paced at a fixed interval. Only ticks for subscribed
// tokens are delivered, so several shards can share one file. Without `loop`
// the session idles after the last frame until close().
class ReplayFeedConnection final : public IFeedConnection
{
public:
    struct Options
    {
        std::string path;
        std::chrono::milliseconds interval{1000};
        bool loop{true};
    };

    ReplayFeedConnection(Options opts, std::unique_ptr<ITickDecoder> decoder);

    void connect(const std::vector<InstrumentToken> &tokens, const Sink &sink) override;
    void subscribe_full(const std::vector<InstrumentToken> &tokens) override;
    void close() noexcept override;

private:
    bool wait_interval();

    Options opts_;
    std::unique_ptr<ITickDecoder> decoder_;
    std::unordered_set<InstrumentToken> subscribed_;

    std::mutex m_;
    std::condition_variable cv_;
    bool closed_{false};
};
