#pragma once
#include <chrono>
#include <memory>
#include <string>

#include "feed_connection.hpp"
#include "md/tick_decoder.hpp"

// Websocket feed session over TLS (Boost.Beast).
//
// Connects to wss://host:port/path?api_key=..&access_token=.., and speaks the
// broker's JSON control protocol:
//   {"a":"subscribe","v":[tokens]}   then   {"a":"mode","v":["full",[tokens]]}
// Every received frame goes through the injected decoder. close() may be
// called from any thread; the session thread performs the teardown.
//
// NOTE: PIMPL keeps Boost headers away from dependents.
class WsFeedConnection final : public IFeedConnection
{
public:
    struct Endpoint
    {
        std::string host = "ws.kite.trade";
        unsigned short port = 443;
        std::string path = "/";
        std::string api_key;
        std::string access_token;
        // bounds TCP connect plus TLS handshake
        std::chrono::milliseconds connect_timeout{10000};
    };

    WsFeedConnection(Endpoint endpoint, std::unique_ptr<ITickDecoder> decoder);
    ~WsFeedConnection();
    WsFeedConnection(const WsFeedConnection &) = delete;
    WsFeedConnection &operator=(const WsFeedConnection &) = delete;

    void connect(const std::vector<InstrumentToken> &tokens, const Sink &sink) override;
    void subscribe_full(const std::vector<InstrumentToken> &tokens) override;
    void close() noexcept override;

private:
    struct Impl;
    Impl *impl_;
};
