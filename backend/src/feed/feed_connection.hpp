#pragma once
#include <functional>
#include <string>
#include <variant>
#include <vector>

#include "md/tick.hpp"

// Events raised by one feed session, delivered in order on the session's
// thread to the sink passed to connect().
struct FeedConnected {};
struct FeedTicks { std::vector<Tick> ticks; };
struct FeedClosed { int code{0}; std::string reason; };
struct FeedError { int code{0}; std::string reason; };

using FeedEvent = std::variant<FeedConnected, FeedTicks, FeedClosed, FeedError>;

// One logical streaming session with the market-data service.
//
// connect() runs the whole session on the calling thread: it opens the
// transport, emits FeedConnected, then FeedTicks as frames arrive, and returns
// once the session has ended (after emitting FeedClosed or FeedError).
// Reconnection is not this object's concern; the owner decides whether and
// when to call connect() again.
//
// subscribe_full() may be called from inside the sink (typically on
// FeedConnected). close() may be called from any thread and makes a running
// connect() return promptly.
struct IFeedConnection
{
    using Sink = std::function<void(FeedEvent)>;

    virtual ~IFeedConnection() = default;
    virtual void connect(const std::vector<InstrumentToken> &tokens, const Sink &sink) = 0;
    virtual void subscribe_full(const std::vector<InstrumentToken> &tokens) = 0;
    virtual void close() noexcept = 0;
};
