#include "ws_feed.hpp"

#include <boost/beast/core.hpp>
#include <boost/beast/ssl.hpp>
#include <boost/beast/websocket.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/post.hpp>
#include <nlohmann/json.hpp>
#include <openssl/err.h>
#include <openssl/ssl.h>
#include <atomic>
#include <iostream>
#include <memory>

namespace beast = boost::beast;
namespace http = beast::http;
namespace websocket = beast::websocket;
namespace net = boost::asio;
using tcp = boost::asio::ip::tcp;

struct WsFeedConnection::Impl
{
    using Stream = websocket::stream<beast::ssl_stream<beast::tcp_stream>>;

    Endpoint ep;
    std::unique_ptr<ITickDecoder> decoder;

    // Every stream operation runs on the session thread through this context;
    // close() posts its teardown here instead of touching the socket itself.
    net::io_context ioc{1};
    net::ssl::context ssl_ctx{net::ssl::context::tls_client};

    std::unique_ptr<Stream> ws;
    tcp::resolver *resolving = nullptr;
    std::atomic<bool> closed{false};

    Impl(Endpoint e, std::unique_ptr<ITickDecoder> d)
    : ep(std::move(e)), decoder(std::move(d))
    {
        ssl_ctx.set_default_verify_paths();
        ssl_ctx.set_verify_mode(net::ssl::verify_peer);
    }

    std::string target() const
    {
        std::string t = ep.path.empty() ? "/" : ep.path;
        t += (t.find('?') == std::string::npos) ? '?' : '&';
        t += "api_key=" + ep.api_key + "&access_token=" + ep.access_token;
        return t;
    }

    // Starts one async operation and runs the context until it completes.
    template <class Start>
    beast::error_code await(Start &&start)
    {
        bool done = false;
        beast::error_code result;
        ioc.restart();
        start([&done, &result](beast::error_code ec, auto &&...) {
            result = ec;
            done = true;
        });
        while (!done && ioc.run_one()) {}
        return done ? result : beast::error_code(net::error::operation_aborted);
    }

    static void check(const beast::error_code &ec, const char *what)
    {
        if (ec) throw beast::system_error{ec, what};
    }

    void run(const std::vector<InstrumentToken> &tokens, const Sink &sink)
    {
        if (closed.load(std::memory_order_relaxed)) {
            sink(FeedClosed{1000, "connection closed locally"});
            return;
        }

        bool emitted_end = false;
        try
        {
            tcp::resolver resolver{ioc};
            tcp::resolver::results_type results;
            resolving = &resolver;
            const auto resolve_ec = await([&](auto done) {
                resolver.async_resolve(ep.host, std::to_string(ep.port),
                    [&results, done](beast::error_code ec, tcp::resolver::results_type r) {
                        results = std::move(r);
                        done(ec);
                    });
            });
            resolving = nullptr;
            check(resolve_ec, "resolve");

            ws = std::make_unique<Stream>(ioc, ssl_ctx);

            // TCP connect and TLS handshake share one deadline
            beast::get_lowest_layer(*ws).expires_after(ep.connect_timeout);
            check(await([&](auto done) { beast::get_lowest_layer(*ws).async_connect(results, done); }), "connect");
            beast::get_lowest_layer(*ws).socket().set_option(net::socket_base::keep_alive(true));

            // SNI
            if (!SSL_set_tlsext_host_name(ws->next_layer().native_handle(), ep.host.c_str())) {
                throw beast::system_error{
                    beast::error_code(static_cast<int>(::ERR_get_error()), net::error::get_ssl_category()),
                    "SNI set failed"
                };
            }

            check(await([&](auto done) { ws->next_layer().async_handshake(net::ssl::stream_base::client, done); }), "tls handshake");

            // WS handshake; the websocket timeouts take over from here
            beast::get_lowest_layer(*ws).expires_never();
            ws->set_option(websocket::stream_base::timeout::suggested(beast::role_type::client));
            ws->set_option(websocket::stream_base::decorator([](websocket::request_type& req){
                req.set(http::field::user_agent, "optchain-recorder/1.0");
                req.set("X-Kite-Version", "3");
            }));
            check(await([&](auto done) { ws->async_handshake(ep.host, target(), done); }), "ws handshake");

            if (closed.load(std::memory_order_relaxed)) {
                throw beast::system_error{net::error::operation_aborted};
            }

            std::cout << "[ws-feed] connected to " << ep.host << " for "
                      << tokens.size() << " tokens" << std::endl;
            sink(FeedConnected{});

            // Read loop: orderly shutdowns end the session as Closed, anything
            // else as Error.
            beast::flat_buffer buffer;
            std::vector<Tick> batch;
            while (!closed.load(std::memory_order_relaxed))
            {
                buffer.clear();
                const auto ec = await([&](auto done) { ws->async_read(buffer, done); });
                if (ec)
                {
                    if (ec == websocket::error::closed) {
                        const auto& r = ws->reason();
                        sink(FeedClosed{static_cast<int>(r.code), std::string(r.reason.c_str())});
                    } else if (ec == net::error::operation_aborted ||
                               ec == net::error::eof ||
                               ec == net::error::not_connected ||
                               ec == beast::errc::not_connected) {
                        sink(FeedClosed{ec.value(), ec.message()});
                    } else {
                        sink(FeedError{ec.value(), ec.message()});
                    }
                    emitted_end = true;
                    break;
                }

                const std::string data = beast::buffers_to_string(buffer.cdata());
                batch.clear();
                if (decoder && decoder->decode(data, ws->got_binary(), batch)) {
                    sink(FeedTicks{std::move(batch)});
                    batch = {};
                }
            }

            if (!emitted_end) {
                const auto close_ec = await([&](auto done) { ws->async_close(websocket::close_code::normal, done); });
                if (close_ec && close_ec != net::error::operation_aborted)
                    std::cerr << "[ws-feed] close: " << close_ec.message() << "\n";
                sink(FeedClosed{1000, "connection closed locally"});
                emitted_end = true;
            }
        }
        catch (const std::exception &e)
        {
            resolving = nullptr;
            const bool local = closed.load(std::memory_order_relaxed);
            if (!local) std::cerr << "[ws-feed] error: " << e.what() << "\n";
            if (!emitted_end) {
                if (local) sink(FeedClosed{1000, "connection closed locally"});
                else sink(FeedError{-1, e.what()});
            }
        }

        ws.reset();
    }

    // Runs on the session thread, from inside await().
    void teardown()
    {
        if (resolving) resolving->cancel();
        if (ws) {
            beast::error_code ec;
            beast::get_lowest_layer(*ws).socket().shutdown(tcp::socket::shutdown_both, ec);
            beast::get_lowest_layer(*ws).close();
        }
    }

    // Called from the sink, on the session thread.
    void send_json(const nlohmann::json &msg)
    {
        if (!ws) return;
        const std::string body = msg.dump();
        beast::error_code ec;
        ws->text(true);
        ws->write(net::buffer(body), ec);
        if (ec) {
            std::cerr << "[ws-feed] write failed: " << ec.message() << "\n";
        }
    }

    void subscribe_full(const std::vector<InstrumentToken> &tokens)
    {
        if (tokens.empty()) return;
        send_json({{"a", "subscribe"}, {"v", tokens}});
        send_json({{"a", "mode"}, {"v", nlohmann::json::array({"full", tokens})}});
        std::cout << "[ws-feed] subscribed " << tokens.size() << " tokens in full mode" << std::endl;
    }

    void close() noexcept
    {
        closed.store(true, std::memory_order_relaxed);
        net::post(ioc, [this] { teardown(); });
    }
};

WsFeedConnection::WsFeedConnection(Endpoint endpoint, std::unique_ptr<ITickDecoder> decoder)
    : impl_(new Impl(std::move(endpoint), std::move(decoder))) {}

WsFeedConnection::~WsFeedConnection() { delete impl_; }

void WsFeedConnection::connect(const std::vector<InstrumentToken> &tokens, const Sink &sink) { impl_->run(tokens, sink); }
void WsFeedConnection::subscribe_full(const std::vector<InstrumentToken> &tokens) { impl_->subscribe_full(tokens); }
void WsFeedConnection::close() noexcept { impl_->close(); }
