#include "server/sampling_scheduler.hpp"
#include "storage/csv_format.hpp"
#include "fake_feed.hpp"
#include "test_support.hpp"

#include <atomic>
#include <mutex>
#include <thread>
#include <vector>
#include <stdexcept>

using namespace std::chrono_literals;

namespace {

// 2024-05-20 10:00 IST
const std::int64_t T0 = utc_micros(2024, 5, 20, 4, 30, 0);
const InstrumentToken NIFTY_INDEX = 256265;

class FakeSource final : public ITickSource {
public:
    TickMap latest_ticks() const override {
        std::lock_guard<std::mutex> lk(m_);
        return ticks_;
    }
    bool all_exhausted() const override { return exhausted_.load(); }

    void put(Tick t) {
        std::lock_guard<std::mutex> lk(m_);
        ticks_[t.token] = std::move(t);
    }
    void set_exhausted(bool v) { exhausted_.store(v); }

private:
    mutable std::mutex m_;
    TickMap ticks_;
    std::atomic<bool> exhausted_{false};
};

// Real time plus an offset that a test can push forward, so a cycle can appear
// to take far longer than it did.
class JumpClock final : public IClock {
public:
    std::chrono::steady_clock::time_point steady_now() const override {
        return std::chrono::steady_clock::now() + std::chrono::microseconds(offset_us_.load());
    }
    std::int64_t utc_micros() const override {
        return SystemClock::instance().utc_micros() + offset_us_.load();
    }
    void jump(std::chrono::microseconds d) { offset_us_ += d.count(); }

private:
    std::atomic<std::int64_t> offset_us_{0};
};

ContractMeta contract(InstrumentToken token, const std::string& underlying, double strike, OptionType type) {
    ContractMeta m;
    m.token = token;
    m.underlying = underlying;
    m.expiry_date = "2024-05-30";
    m.strike = strike;
    m.option_type = type;
    m.tradingsymbol = underlying + "24MAY" + std::to_string(static_cast<int>(strike)) + to_exchange_code(type);
    m.instrument_id = make_instrument_id(underlying, "20240530", strike, type);
    return m;
}

UniversePtr universe() {
    auto u = std::make_shared<Universe>();
    (*u)[101] = contract(101, "NIFTY", 24000, OptionType::Call);
    (*u)[102] = contract(102, "NIFTY", 24000, OptionType::Put);
    (*u)[201] = contract(201, "BANKNIFTY", 52000, OptionType::Call);
    return u;
}

std::vector<std::string> split(const std::string& line) {
    std::vector<std::string> out;
    std::string cur;
    for (char c : line) {
        if (c == ',') {
            out.push_back(cur);
            cur.clear();
        } else {
            cur.push_back(c);
        }
    }
    out.push_back(cur);
    return out;
}

std::size_t column(const std::string& name) {
    const auto cols = split(csv_header());
    return static_cast<std::size_t>(std::find(cols.begin(), cols.end(), name) - cols.begin());
}

// Everything a scheduler needs, wired against a fake source.
struct Rig {
    explicit Rig(const std::string& tag, const IClock& clk, SamplingScheduler::Options o = {})
        : dir(tag),
          tz("IST-5:30"),
          clock(clk),
          builder("NSE-FO", tz, clk),
          writers(writer_opts(dir), tz, clk),
          opts(std::move(o)) {}

    static MultiCsvWriter::Options writer_opts(const TempDir& d) {
        MultiCsvWriter::Options w;
        w.output_dir = d.path();
        w.underlyings = {"NIFTY", "BANKNIFTY"};
        w.flush_rows = 1000;
        w.flush_interval = 50ms;
        return w;
    }

    SamplingScheduler make(SamplingScheduler::UniverseProvider provider) {
        return SamplingScheduler(source, builder, spots, writers, std::move(provider), opts, clock);
    }

    TempDir dir;
    TzConverter tz;
    const IClock& clock;
    FakeSource source;
    SpotBook spots;
    SnapshotBuilder builder;
    MultiCsvWriter writers;
    SamplingScheduler::Options opts;
};

void skips_until_ticks_arrive() {
    ManualClock clock(T0);
    Rig rig("sched_skip", clock);
    const auto u = universe();
    auto sched = rig.make([u] { return u; });

    CHECK_EQ(sched.run_cycle(), 0u);
    CHECK_EQ(sched.run_cycle(), 0u);
    auto s = sched.stats();
    CHECK_EQ(s.cycles, 0u);
    CHECK_EQ(s.cycles_skipped, 2u);
    CHECK_EQ(s.last_cycle_ts, 0);

    rig.source.put(make_tick(101, 120.5, 120.0, 121.0));
    CHECK_EQ(sched.run_cycle(), 3u);
    s = sched.stats();
    CHECK_EQ(s.cycles, 1u);
    CHECK_EQ(s.rows_emitted, 3u);
    CHECK_EQ(s.last_cycle_ts, T0);

    rig.writers.flush();
    const auto stats = rig.writers.stats();
    CHECK_EQ(stats.at("NIFTY").rows_written, 2u);
    CHECK_EQ(stats.at("BANKNIFTY").rows_written, 1u);
}

void empty_cycles_written_when_enabled() {
    ManualClock clock(T0);
    SamplingScheduler::Options o;
    o.write_empty_cycles = true;
    Rig rig("sched_empty", clock, o);
    const auto u = universe();
    auto sched = rig.make([u] { return u; });

    CHECK_EQ(sched.run_cycle(), 3u);
    rig.writers.flush();

    const auto lines = read_lines(rig.dir.path() / "NIFTY_NSEFO_OPTION_CHAIN_1S_20240520_20240520.csv");
    CHECK_EQ(lines.size(), 3u);
    if (lines.size() == 3) {
        const auto fields = split(lines[1]);
        CHECK_EQ(fields[column("ts")], std::to_string(T0));
        CHECK_EQ(fields[column("best_bid_px")], std::string(""));
        CHECK_EQ(fields[column("last_trade_px")], std::string(""));
    }
}

void missing_universe_is_skipped() {
    ManualClock clock(T0);
    Rig rig("sched_nouni", clock);
    rig.source.put(make_tick(101, 120.5));

    auto none = rig.make([] { return UniversePtr(); });
    CHECK_EQ(none.run_cycle(), 0u);
    CHECK_EQ(none.stats().cycles_skipped, 1u);

    auto empty = rig.make([] { return std::make_shared<const Universe>(); });
    CHECK_EQ(empty.run_cycle(), 0u);
    CHECK_EQ(empty.stats().cycles_skipped, 1u);
    CHECK(rig.dir.files().empty());
}

void index_ticks_refresh_spot() {
    ManualClock clock(T0);
    SamplingScheduler::Options o;
    o.index_tokens = {{"NIFTY", NIFTY_INDEX}};
    Rig rig("sched_spot", clock, o);
    rig.spots.set("NIFTY", 23900.0);
    const auto u = universe();
    auto sched = rig.make([u] { return u; });

    rig.source.put(make_tick(101, 120.5, 120.0, 121.0));
    rig.source.put(make_tick(NIFTY_INDEX, 24012.5));
    CHECK_EQ(sched.run_cycle(), 3u);
    CHECK_EQ(*rig.spots.get("NIFTY"), 24012.5);
    CHECK(!rig.spots.get("BANKNIFTY"));

    // a zero print does not clobber the last good spot
    rig.source.put(make_tick(NIFTY_INDEX, 0.0));
    sched.run_cycle();
    CHECK_EQ(*rig.spots.get("NIFTY"), 24012.5);

    rig.writers.flush();
    const auto lines = read_lines(rig.dir.path() / "NIFTY_NSEFO_OPTION_CHAIN_1S_20240520_20240520.csv");
    CHECK_EQ(lines.size(), 5u);
    if (lines.size() == 5) {
        CHECK_EQ(split(lines[1])[column("underlying_spot")], std::string("24012.5"));
    }
}

void run_stops_on_request() {
    Rig rig("sched_run", SystemClock::instance(), SamplingScheduler::Options{20ms, false, {}, 60});
    const auto u = universe();
    rig.source.put(make_tick(101, 120.5, 120.0, 121.0));
    auto sched = rig.make([u] { return u; });

    std::atomic<int> outcome{-1};
    std::thread t([&] { outcome = static_cast<int>(sched.run()); });

    CHECK(eventually([&] { return sched.stats().cycles >= 3; }));
    sched.request_stop();
    t.join();
    CHECK_EQ(outcome.load(), static_cast<int>(RunOutcome::Stopped));
    CHECK(sched.stop_requested());

    // time-based flush ran from inside the loop
    CHECK(eventually([&] { return rig.writers.stats().at("NIFTY").rows_written >= 3; }, 500ms));
}

void run_returns_when_feed_exhausted() {
    Rig rig("sched_exhausted", SystemClock::instance(), SamplingScheduler::Options{20ms, false, {}, 60});
    const auto u = universe();
    auto sched = rig.make([u] { return u; });

    rig.source.set_exhausted(true);
    const auto started = std::chrono::steady_clock::now();
    CHECK(sched.run() == RunOutcome::FeedExhausted);
    CHECK(std::chrono::steady_clock::now() - started < 1s);
}

void failed_cycle_does_not_stop_loop() {
    Rig rig("sched_fail", SystemClock::instance(), SamplingScheduler::Options{10ms, false, {}, 60});
    std::atomic<int> calls{0};
    const auto u = universe();
    rig.source.put(make_tick(101, 120.5));
    auto sched = rig.make([&calls, u]() -> UniversePtr {
        if (++calls % 2 == 1) throw std::runtime_error("universe unavailable");
        return u;
    });

    std::thread t([&] { sched.run(); });
    CHECK(eventually([&] {
        const auto s = sched.stats();
        return s.cycles_failed >= 2 && s.cycles >= 2;
    }));
    sched.request_stop();
    t.join();
}

void slow_cycle_is_not_caught_up() {
    constexpr auto interval = 100ms;
    JumpClock clock;
    Rig rig("sched_slow", clock, SamplingScheduler::Options{interval, false, {}, 60});
    rig.source.put(make_tick(101, 120.5, 120.0, 121.0));
    const auto u = universe();

    std::mutex m;
    std::vector<std::chrono::steady_clock::time_point> starts;
    auto sched = rig.make([&]() -> UniversePtr {
        std::lock_guard<std::mutex> lk(m);
        starts.push_back(clock.steady_now());
        // the third cycle "takes" five intervals
        if (starts.size() == 3)
            clock.jump(5 * interval);
        return u;
    });

    std::thread t([&] { sched.run(); });
    CHECK(eventually([&] {
        std::lock_guard<std::mutex> lk(m);
        return starts.size() >= 7;
    }, 5s));
    sched.request_stop();
    t.join();

    std::lock_guard<std::mutex> lk(m);
    CHECK(starts.size() >= 7);
    if (starts.size() < 7)
        return;
    auto gap = [&](std::size_t i) { return starts[i + 1] - starts[i]; };

    // the overrun cycle is followed by exactly one immediate cycle
    CHECK(gap(2) >= 5 * interval);
    CHECK(gap(2) < 5 * interval + interval / 2);
    // then the regular cadence resumes with no burst of back-filled cycles
    for (std::size_t i = 3; i + 1 < starts.size(); ++i)
        CHECK(gap(i) >= interval / 2);
    CHECK_EQ(sched.stats().cycles, static_cast<std::uint64_t>(starts.size()));
}

} // namespace

int main() {
    return run_tests({
        {"skips_until_ticks_arrive", skips_until_ticks_arrive},
        {"empty_cycles_written_when_enabled", empty_cycles_written_when_enabled},
        {"missing_universe_is_skipped", missing_universe_is_skipped},
        {"index_ticks_refresh_spot", index_ticks_refresh_spot},
        {"run_stops_on_request", run_stops_on_request},
        {"run_returns_when_feed_exhausted", run_returns_when_feed_exhausted},
        {"failed_cycle_does_not_stop_loop", failed_cycle_does_not_stop_loop},
        {"slow_cycle_is_not_caught_up", slow_cycle_is_not_caught_up},
    });
}
