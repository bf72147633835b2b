#include "feed/replay_feed.hpp"
#include "md/json_tick_decoder.hpp"
#include "test_support.hpp"

#include <limits>
#include <mutex>

using namespace std::chrono_literals;

namespace {

void array_frame() {
    JsonTickDecoder dec;
    std::vector<Tick> out;
    const std::string frame = R"([
        {"instrument_token": 111, "last_price": 120.5, "last_traded_quantity": 75,
         "depth": {"buy": [{"price": 150, "quantity": 100, "orders": 3}],
                   "sell": [{"price": 0, "quantity": 0, "orders": 0}]}},
        {"last_price": 9.0}
    ])";
    CHECK(dec.decode(frame, false, out));
    CHECK_EQ(out.size(), 1u);
    CHECK_EQ(dec.rejected(), 1u);

    const auto& t = out[0];
    CHECK_EQ(t.token, 111u);
    CHECK(t.last_price && *t.last_price == 120.5);
    CHECK(t.last_quantity && *t.last_quantity == 75);
    CHECK_EQ(t.buy.size(), 1u);
    CHECK_EQ(t.buy[0].price, 150.0);
    CHECK_EQ(t.buy[0].quantity, std::int64_t{100});
    CHECK_EQ(t.buy[0].orders, 3);
    CHECK_EQ(t.sell.size(), 1u);
    CHECK_EQ(t.sell[0].price, 0.0);
    CHECK(!t.exchange_ts);
}

void envelope_frames() {
    JsonTickDecoder dec;
    std::vector<Tick> out;
    CHECK(dec.decode(R"({"type":"ticks","data":[{"instrument_token":222,"last_price":1.5}]})", false, out));
    CHECK_EQ(out.size(), 1u);
    CHECK_EQ(out[0].token, 222u);

    out.clear();
    CHECK(!dec.decode(R"({"type":"error","data":"Invalid access token"})", false, out));
    CHECK(!dec.decode(R"({"type":"message","data":"hello"})", false, out));
    CHECK(out.empty());
}

void rejects_bad_input() {
    JsonTickDecoder dec;
    std::vector<Tick> out;
    CHECK(!dec.decode("not json", false, out));
    CHECK(!dec.decode("{\"instrument_token\":", false, out));
    CHECK(!dec.decode(std::string("\x00\x01\x02", 3), true, out));
    CHECK(!dec.decode(R"([{"instrument_token": 0}])", false, out));
    CHECK(!dec.decode(R"([{"instrument_token": 99999999999}])", false, out));
    CHECK(out.empty());
    CHECK_EQ(dec.rejected(), 2u);
}

void depth_is_capped() {
    JsonTickDecoder dec;
    std::vector<Tick> out;
    std::string levels;
    for (int i = 0; i < 7; ++i) {
        if (i) levels += ",";
        levels += "{\"price\":" + std::to_string(100 - i) + ",\"quantity\":" + std::to_string(10 + i) + ",\"orders\":1}";
    }
    CHECK(dec.decode("[{\"instrument_token\":5,\"depth\":{\"buy\":[" + levels + "],\"sell\":[]}}]", false, out));
    CHECK_EQ(out[0].buy.size(), MAX_DEPTH_LEVELS);
    CHECK_EQ(out[0].buy[4].price, 96.0);
    CHECK(out[0].sell.empty());
}

void null_fields() {
    JsonTickDecoder dec;
    std::vector<Tick> out;
    CHECK(dec.decode(R"([{"instrument_token":7,"last_price":null,"last_quantity":null,"depth":null}])", false, out));
    CHECK(!out[0].last_price);
    CHECK(!out[0].last_quantity);
    CHECK(out[0].buy.empty() && out[0].sell.empty());
}

void exchange_timestamps() {
    JsonTickDecoder dec;
    std::vector<Tick> out;
    CHECK(dec.decode(R"([
        {"instrument_token":1,"exchange_timestamp":"2024-05-20 09:30:00"},
        {"instrument_token":2,"exchange_timestamp":"2024-05-20T04:00:00Z"},
        {"instrument_token":3,"exchange_timestamp":1716177600},
        {"instrument_token":4,"exchange_timestamp":"garbage"}
    ])", false, out));
    CHECK_EQ(out.size(), 4u);
    CHECK(out[0].exchange_ts && !out[0].exchange_ts->utc);
    CHECK_EQ(out[0].exchange_ts->micros, utc_micros(2024, 5, 20, 9, 30, 0));
    CHECK(out[1].exchange_ts && out[1].exchange_ts->utc);
    CHECK_EQ(out[1].exchange_ts->micros, utc_micros(2024, 5, 20, 4, 0, 0));
    CHECK(out[2].exchange_ts && out[2].exchange_ts->utc);
    CHECK_EQ(out[2].exchange_ts->micros, utc_micros(2024, 5, 20, 4, 0, 0));
    CHECK(!out[3].exchange_ts);
}

void timestamp_parsing() {
    auto ts = JsonTickDecoder::parse_timestamp("2024-05-20 09:30:00.1234567");
    CHECK(ts && !ts->utc);
    CHECK_EQ(ts->micros, utc_micros(2024, 5, 20, 9, 30, 0) + 123456);

    ts = JsonTickDecoder::parse_timestamp("2024-05-20 09:30:00.5Z");
    CHECK(ts && ts->utc);
    CHECK_EQ(ts->micros, utc_micros(2024, 5, 20, 9, 30, 0) + 500000);

    CHECK(!JsonTickDecoder::parse_timestamp("2024-02-30 09:30:00"));
    CHECK(!JsonTickDecoder::parse_timestamp("2024-05-20 25:00:00"));
    CHECK(!JsonTickDecoder::parse_timestamp("2024-05-20 09:30:00 IST"));
    CHECK(!JsonTickDecoder::parse_timestamp("20240520"));
}

void out_of_range_numbers() {
    JsonTickDecoder dec;
    std::vector<Tick> out;
    CHECK(dec.decode(R"([
        {"instrument_token": 9, "last_quantity": 1e20, "exchange_timestamp": 1e300,
         "depth": {"buy": [{"price": 10, "quantity": 1e19, "orders": 5e9}],
                   "sell": [{"price": 11, "quantity": 4, "orders": -3}]}},
        {"instrument_token": 10, "exchange_timestamp": -1e13}
    ])", false, out));
    CHECK_EQ(out.size(), 2u);
    CHECK(!out[0].last_quantity);
    CHECK(!out[0].exchange_ts);
    CHECK_EQ(out[0].buy[0].quantity, std::int64_t{-1});
    CHECK_EQ(out[0].buy[0].orders, std::numeric_limits<std::int32_t>::max());
    CHECK_EQ(out[0].sell[0].quantity, std::int64_t{4});
    CHECK_EQ(out[0].sell[0].orders, 0);
    CHECK(!out[1].exchange_ts);
}

void replay_filters_to_subscribed_tokens() {
    TempDir dir("replay");
    const auto file = dir.path() / "ticks.jsonl";
    write_file(file,
               "# recorded frames\n"
               "[{\"instrument_token\":111,\"last_price\":1.0},{\"instrument_token\":222,\"last_price\":2.0}]\n"
               "\n"
               "[{\"instrument_token\":222,\"last_price\":2.5}]\n"
               "{\"type\":\"ticks\",\"data\":[{\"instrument_token\":111,\"last_price\":1.5}]}\n");

    ReplayFeedConnection::Options o;
    o.path = file.string();
    o.interval = 1ms;
    o.loop = false;
    ReplayFeedConnection conn(o, std::make_unique<JsonTickDecoder>());

    std::mutex m;
    std::vector<std::string> events;
    std::vector<double> prices;
    std::thread session([&] {
        conn.connect({111}, [&](FeedEvent ev) {
            std::lock_guard<std::mutex> lk(m);
            if (std::holds_alternative<FeedConnected>(ev)) {
                events.push_back("connected");
                conn.subscribe_full({111});
            } else if (auto* t = std::get_if<FeedTicks>(&ev)) {
                events.push_back("ticks");
                for (const auto& tick : t->ticks) {
                    CHECK_EQ(tick.token, 111u);
                    prices.push_back(*tick.last_price);
                }
            } else if (auto* c = std::get_if<FeedClosed>(&ev)) {
                events.push_back("closed:" + c->reason);
            } else {
                events.push_back("error");
            }
        });
    });

    // all frames delivered, then the session idles until closed
    CHECK(eventually([&] {
        std::lock_guard<std::mutex> lk(m);
        return prices.size() == 2;
    }));
    std::this_thread::sleep_for(20ms);
    {
        std::lock_guard<std::mutex> lk(m);
        CHECK_EQ(events.size(), 3u);
    }
    conn.close();
    session.join();

    CHECK(events == (std::vector<std::string>{"connected", "ticks", "ticks", "closed:replay finished"}));
    CHECK(prices == (std::vector<double>{1.0, 1.5}));
}

void replay_missing_file_is_error() {
    ReplayFeedConnection::Options o;
    o.path = "/nonexistent/ticks.jsonl";
    ReplayFeedConnection conn(o, std::make_unique<JsonTickDecoder>());
    bool error = false;
    conn.connect({1}, [&](FeedEvent ev) { error = error || std::holds_alternative<FeedError>(ev); });
    CHECK(error);
}

void replay_close_interrupts_pacing() {
    TempDir dir("replay_close");
    const auto file = dir.path() / "ticks.jsonl";
    write_file(file, "[{\"instrument_token\":1,\"last_price\":1.0}]\n");

    ReplayFeedConnection::Options o;
    o.path = file.string();
    o.interval = 10s;
    o.loop = true;
    ReplayFeedConnection conn(o, std::make_unique<JsonTickDecoder>());

    std::thread closer([&] {
        std::this_thread::sleep_for(50ms);
        conn.close();
    });
    const auto start = std::chrono::steady_clock::now();
    conn.connect({1}, [](FeedEvent) {});
    closer.join();
    CHECK(std::chrono::steady_clock::now() - start < 5s);
}

} // namespace

int main() {
    return run_tests({
        {"array_frame", array_frame},
        {"envelope_frames", envelope_frames},
        {"rejects_bad_input", rejects_bad_input},
        {"depth_is_capped", depth_is_capped},
        {"null_fields", null_fields},
        {"exchange_timestamps", exchange_timestamps},
        {"timestamp_parsing", timestamp_parsing},
        {"out_of_range_numbers", out_of_range_numbers},
        {"replay_filters_to_subscribed_tokens", replay_filters_to_subscribed_tokens},
        {"replay_missing_file_is_error", replay_missing_file_is_error},
        {"replay_close_interrupts_pacing", replay_close_interrupts_pacing},
    });
}
