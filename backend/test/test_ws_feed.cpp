#include "feed/ws_feed.hpp"
#include "md/json_tick_decoder.hpp"
#include "test_support.hpp"

#include <atomic>
#include <mutex>
#include <thread>

#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>

using namespace std::chrono_literals;
using tcp = boost::asio::ip::tcp;

namespace {

// Accepts TCP connections through the kernel backlog but never answers, so a
// client sits in its TLS handshake.
struct SilentListener {
    boost::asio::io_context ioc;
    tcp::acceptor acceptor{ioc, tcp::endpoint(boost::asio::ip::make_address("127.0.0.1"), 0)};

    unsigned short port() const { return acceptor.local_endpoint().port(); }
};

struct Recorded {
    std::mutex m;
    std::vector<FeedEvent> events;

    IFeedConnection::Sink sink() {
        return [this](FeedEvent ev) {
            std::lock_guard<std::mutex> lk(m);
            events.push_back(std::move(ev));
        };
    }
};

WsFeedConnection::Endpoint local_endpoint(unsigned short port) {
    WsFeedConnection::Endpoint ep;
    ep.host = "127.0.0.1";
    ep.port = port;
    ep.api_key = "key";
    ep.access_token = "token";
    return ep;
}

void close_before_connect() {
    WsFeedConnection conn(local_endpoint(1), std::make_unique<JsonTickDecoder>());
    conn.close();
    Recorded rec;
    conn.connect({1, 2}, rec.sink());
    CHECK_EQ(rec.events.size(), 1u);
    CHECK(std::holds_alternative<FeedClosed>(rec.events[0]));
}

void close_interrupts_handshake() {
    SilentListener server;
    WsFeedConnection::Endpoint ep = local_endpoint(server.port());
    ep.connect_timeout = 30s;
    WsFeedConnection conn(ep, std::make_unique<JsonTickDecoder>());

    Recorded rec;
    std::atomic<bool> returned{false};
    const auto started = std::chrono::steady_clock::now();
    std::thread session([&] {
        conn.connect({1}, rec.sink());
        returned = true;
    });

    std::this_thread::sleep_for(200ms);
    CHECK(!returned.load());
    conn.close();
    CHECK(eventually([&] { return returned.load(); }, 3s));
    session.join();
    CHECK(std::chrono::steady_clock::now() - started < 5s);

    std::lock_guard<std::mutex> lk(rec.m);
    CHECK_EQ(rec.events.size(), 1u);
    if (!rec.events.empty())
        CHECK(std::holds_alternative<FeedClosed>(rec.events.back()));
}

void handshake_times_out() {
    SilentListener server;
    WsFeedConnection::Endpoint ep = local_endpoint(server.port());
    ep.connect_timeout = 300ms;
    WsFeedConnection conn(ep, std::make_unique<JsonTickDecoder>());

    Recorded rec;
    const auto started = std::chrono::steady_clock::now();
    conn.connect({1}, rec.sink());
    CHECK(std::chrono::steady_clock::now() - started < 5s);
    CHECK_EQ(rec.events.size(), 1u);
    if (!rec.events.empty())
        CHECK(std::holds_alternative<FeedError>(rec.events.back()));
}

} // namespace

int main() {
    return run_tests({
        {"close_before_connect", close_before_connect},
        {"close_interrupts_handshake", close_interrupts_handshake},
        {"handshake_times_out", handshake_times_out},
    });
}
