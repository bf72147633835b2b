#include <csignal>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <boost/date_time/gregorian/gregorian.hpp>

#include "feed/replay_feed.hpp"
#include "feed/ws_feed.hpp"
#include "md/json_tick_decoder.hpp"
#include "pipeline/feed_orchestrator.hpp"
#include "recorder_config.hpp"
#include "sampling_scheduler.hpp"
#include "session.hpp"
#include "signal_watcher.hpp"
#include "snapshot/snapshot_builder.hpp"
#include "snapshot/spot_book.hpp"
#include "storage/multi_csv_writer.hpp"
#include "universe/instrument_catalog.hpp"
#include "universe/option_universe.hpp"
#include "util/clock.hpp"
#include "util/tz.hpp"

namespace {

constexpr int EXIT_FEED_EXHAUSTED = 2;

TzConverter make_tz(const std::string& zone) {
    try {
        return TzConverter(zone);
    } catch (const std::invalid_argument& e) {
        throw ConfigurationError(std::string("config key 'timezone': ") + e.what());
    }
}

FeedOrchestrator::ConnectionFactory make_factory(const RecorderConfig& cfg,
                                                 const std::optional<SessionCredentials>& creds) {
    if (cfg.feed.source == "replay") {
        ReplayFeedConnection::Options ro;
        ro.path = cfg.feed.replay_file;
        ro.interval = cfg.feed.replay_interval;
        ro.loop = cfg.feed.replay_loop;
        return [ro](std::size_t) -> std::unique_ptr<IFeedConnection> {
            return std::make_unique<ReplayFeedConnection>(ro, std::make_unique<JsonTickDecoder>());
        };
    }

    WsFeedConnection::Endpoint ep;
    ep.host = cfg.feed.host;
    ep.port = cfg.feed.port;
    ep.path = cfg.feed.path;
    ep.api_key = creds->api_key;
    ep.access_token = creds->access_token;
    return [ep](std::size_t) -> std::unique_ptr<IFeedConnection> {
        return std::make_unique<WsFeedConnection>(ep, std::make_unique<JsonTickDecoder>());
    };
}

void log_final_stats(const SamplingScheduler& scheduler,
                     const FeedOrchestrator& feed,
                     const MultiCsvWriter& writers) {
    const auto s = scheduler.stats();
    const auto f = feed.stats();
    std::cout << "[setup] final: cycles=" << s.cycles
              << " rows=" << s.rows_emitted
              << " skipped=" << s.cycles_skipped
              << " failed=" << s.cycles_failed
              << " ticks=" << f.ticks_received
              << " reconnects=" << f.reconnect_count
              << " feed_errors=" << f.error_count << std::endl;
    for (const auto& [name, w] : writers.stats()) {
        std::cout << "[setup] " << name << ": rows_written=" << w.rows_written
                  << " write_failures=" << w.write_failures
                  << " rows_dropped=" << w.rows_dropped
                  << " file=" << w.current_file << std::endl;
    }
}

int run_recorder(const std::string& config_path) {
    const RecorderConfig cfg = load_config(config_path);
    const TzConverter tz = make_tz(cfg.timezone);
    const IClock& clock = SystemClock::instance();
    const auto today = tz.local_date(clock.utc_micros());

    std::optional<SessionCredentials> creds;
    if (cfg.feed.source == "ws") {
        creds = load_session(today);
        std::cout << "[setup] credentials from " << creds->source << std::endl;
    }

    // Universe
    const auto catalog = InstrumentCatalog::load_csv(cfg.instruments_file, cfg.instruments_exchange);
    SpotBook spots;
    for (const auto& [u, px] : cfg.spot_prices) spots.set(u, px);

    const OptionUniverseSelector selector(cfg.universe);
    const UniverseBuild built = selector.build(catalog, spots.frozen(), today);
    std::cout << "[universe] " << OptionUniverseSelector::describe(built) << std::endl;
    if (built.universe->empty()) {
        std::cerr << "[setup] no contracts selected, nothing to record" << std::endl;
        return 1;
    }
    const UniversePtr universe = built.universe;

    std::vector<InstrumentToken> tokens;
    tokens.reserve(universe->size() + cfg.index_tokens.size());
    for (const auto& [u, tok] : cfg.index_tokens) tokens.push_back(tok);
    for (const auto& [tok, meta] : *universe) tokens.push_back(tok);

    // Feed
    FeedOrchestrator::Options fo;
    fo.shard.reconnect_max_tries = cfg.reconnect_max_tries;
    fo.shard.reconnect_max_delay = cfg.reconnect_max_delay;
    fo.max_tokens_per_connection = cfg.feed.max_tokens_per_connection;
    fo.max_connections = cfg.feed.max_connections;
    FeedOrchestrator feed(make_factory(cfg, creds), fo);
    const ShardPlan plan = feed.configure(tokens);
    std::cout << "[feed] " << plan.accepted << " tokens over " << plan.shard_count << " connection(s)";
    if (plan.dropped) std::cout << ", " << plan.dropped << " dropped";
    std::cout << std::endl;

    // Output
    MultiCsvWriter::Options wo;
    wo.output_dir = cfg.output_dir;
    wo.underlyings = cfg.underlyings;
    wo.file_venue_token = cfg.file_venue_token;
    wo.flush_rows = cfg.flush_rows_per_write;
    wo.flush_interval = cfg.flush_interval;
    MultiCsvWriter writers(wo, tz, clock);

    const SnapshotBuilder builder(cfg.venue_label, tz, clock);

    SamplingScheduler::Options so;
    so.interval = cfg.sampling_interval;
    so.write_empty_cycles = cfg.write_empty_cycles;
    so.index_tokens = cfg.index_tokens;
    SamplingScheduler scheduler(feed, builder, spots, writers,
                                [universe] { return universe; }, so, clock);

    int code = 0;
    {
        // SIGINT/SIGTERM -> stop the sampling loop.
        SignalWatcher signals({SIGINT, SIGTERM}, [&scheduler](int) {
            std::cout << "[setup] shutting down" << std::endl;
            scheduler.request_stop();
        });

        feed.start();
        try {
            if (scheduler.run() == RunOutcome::FeedExhausted) code = EXIT_FEED_EXHAUSTED;
        } catch (const std::exception& e) {
            std::cerr << "[scheduler] fatal: " << e.what() << std::endl;
            code = 1;
        }
    }

    feed.stop();
    writers.close();
    log_final_stats(scheduler, feed, writers);
    return code;
}

} // namespace

int main(int argc, char** argv) {
    load_env_file();

    const std::string config_path = argc > 1 ? argv[1] : "configs/option_chain.json";
    try {
        return run_recorder(config_path);
    } catch (const ConfigurationError& e) {
        std::cerr << "[config] " << e.what() << std::endl;
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "[setup] fatal: " << e.what() << std::endl;
        return 1;
    }
}
