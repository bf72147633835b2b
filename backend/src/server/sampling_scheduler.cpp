#include "sampling_scheduler.hpp"

#include <algorithm>
#include <cmath>
#include <iostream>

SamplingScheduler::SamplingScheduler(ITickSource& source,
                                     const SnapshotBuilder& builder,
                                     SpotBook& spots,
                                     MultiCsvWriter& writer,
                                     UniverseProvider universe,
                                     Options opts,
                                     const IClock& clock)
    : source_(source),
      builder_(builder),
      spots_(spots),
      writer_(writer),
      universe_(std::move(universe)),
      opts_(std::move(opts)),
      clock_(clock) {}

void SamplingScheduler::request_stop()
{
    {
        std::lock_guard<std::mutex> lk(m_);
        stop_ = true;
    }
    cv_.notify_all();
}

bool SamplingScheduler::stop_requested() const
{
    std::lock_guard<std::mutex> lk(m_);
    return stop_;
}

SchedulerStats SamplingScheduler::stats() const
{
    std::lock_guard<std::mutex> lk(m_);
    return stats_;
}

void SamplingScheduler::refresh_spots(const TickMap& ticks)
{
    for (const auto& [underlying, token] : opts_.index_tokens)
    {
        auto it = ticks.find(token);
        if (it == ticks.end() || !it->second.last_price)
            continue;
        const double px = *it->second.last_price;
        if (std::isfinite(px) && px > 0)
            spots_.set(underlying, px);
    }
}

void SamplingScheduler::log_stats(const SchedulerStats& s) const
{
    const auto feed = source_.latest_ticks().size();
    std::cout << "[scheduler] cycles=" << s.cycles
              << " rows=" << s.rows_emitted
              << " skipped=" << s.cycles_skipped
              << " failed=" << s.cycles_failed
              << " cached_ticks=" << feed << std::endl;
}

std::size_t SamplingScheduler::run_cycle()
{
    const UniversePtr universe = universe_ ? universe_() : nullptr;
    if (!universe || universe->empty())
    {
        std::lock_guard<std::mutex> lk(m_);
        ++stats_.cycles_skipped;
        return 0;
    }

    TickMap ticks = source_.latest_ticks();
    refresh_spots(ticks);

    if (ticks.empty() && !opts_.write_empty_cycles)
    {
        std::uint64_t skipped;
        {
            std::lock_guard<std::mutex> lk(m_);
            skipped = ++stats_.cycles_skipped;
        }
        if (skipped == 1 || (opts_.stats_every && skipped % opts_.stats_every == 0))
            std::cout << "[scheduler] no ticks yet, cycle skipped (" << skipped << " so far)" << std::endl;
        return 0;
    }

    const std::int64_t ts = clock_.utc_micros();
    const auto rows = builder_.build_snapshot(ticks, *universe, spots_.frozen(), ts);
    writer_.write_many(rows);

    SchedulerStats snap;
    {
        std::lock_guard<std::mutex> lk(m_);
        ++stats_.cycles;
        stats_.rows_emitted += rows.size();
        stats_.last_cycle_ts = ts;
        snap = stats_;
    }
    if (opts_.stats_every && snap.cycles % opts_.stats_every == 0)
        log_stats(snap);
    return rows.size();
}

RunOutcome SamplingScheduler::run()
{
    using namespace std::chrono;
    constexpr milliseconds SLICE{100};

    std::cout << "[scheduler] sampling every " << opts_.interval.count() << " ms" << std::endl;

    auto next = clock_.steady_now() + opts_.interval;
    while (!stop_requested())
    {
        if (clock_.steady_now() >= next)
        {
            try
            {
                run_cycle();
            }
            catch (const std::exception &e)
            {
                {
                    std::lock_guard<std::mutex> lk(m_);
                    ++stats_.cycles_failed;
                }
                std::cerr << "[scheduler] cycle failed: " << e.what() << std::endl;
            }
            next += opts_.interval;
            const auto now = clock_.steady_now();
            if (next < now)
                next = now;
        }

        writer_.check_time_flush();

        if (source_.all_exhausted())
        {
            std::cerr << "[scheduler] all feed shards exhausted, stopping" << std::endl;
            return RunOutcome::FeedExhausted;
        }

        const auto remaining = duration_cast<milliseconds>(next - clock_.steady_now());
        const auto wait = std::min(SLICE, remaining);
        if (wait > milliseconds::zero())
        {
            std::unique_lock<std::mutex> lk(m_);
            cv_.wait_for(lk, wait, [this] { return stop_; });
        }
    }
    return RunOutcome::Stopped;
}
