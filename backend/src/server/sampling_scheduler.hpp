#pragma once
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <map>
#include <mutex>
#include <string>

#include "md/contract_meta.hpp"
#include "pipeline/feed_orchestrator.hpp"
#include "snapshot/snapshot_builder.hpp"
#include "snapshot/spot_book.hpp"
#include "storage/multi_csv_writer.hpp"
#include "util/clock.hpp"

enum class RunOutcome
{
    Stopped,       // request_stop() was called
    FeedExhausted  // every feed shard gave up reconnecting
};

struct SchedulerStats
{
    std::uint64_t cycles{0};
    std::uint64_t cycles_failed{0};
    std::uint64_t cycles_skipped{0};
    std::uint64_t rows_emitted{0};
    std::int64_t last_cycle_ts{0}; // UTC micros of the last written cycle, 0 if none
};

// Drives sampling: once per interval it snapshots the latest ticks for the
// current universe and hands the rows to the writers. Runs on the caller's
// thread; request_stop() may be called from any thread.
class SamplingScheduler
{
public:
    using UniverseProvider = std::function<UniversePtr()>;

    struct Options
    {
        std::chrono::milliseconds interval{1000};
        bool write_empty_cycles{false};
        // underlying -> index token; ticks for these refresh the spot book
        std::map<std::string, InstrumentToken> index_tokens;
        std::uint64_t stats_every{60};
    };

    SamplingScheduler(ITickSource& source,
                      const SnapshotBuilder& builder,
                      SpotBook& spots,
                      MultiCsvWriter& writer,
                      UniverseProvider universe,
                      Options opts,
                      const IClock& clock = SystemClock::instance());

    // Blocks until stopped or the feed is exhausted.
    RunOutcome run();

    // One sampling cycle. Returns the number of rows handed to the writer.
    std::size_t run_cycle();

    void request_stop();
    bool stop_requested() const;

    SchedulerStats stats() const;

private:
    void refresh_spots(const TickMap& ticks);
    void log_stats(const SchedulerStats& s) const;

    ITickSource& source_;
    const SnapshotBuilder& builder_;
    SpotBook& spots_;
    MultiCsvWriter& writer_;
    UniverseProvider universe_;
    Options opts_;
    const IClock& clock_;

    mutable std::mutex m_; // stop_ and stats_
    std::condition_variable cv_;
    bool stop_{false};
    SchedulerStats stats_;
};
