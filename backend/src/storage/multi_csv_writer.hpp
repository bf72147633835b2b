#pragma once
#include <atomic>
#include <map>
#include <memory>
#include <mutex>
#include <set>
#include <string>
#include <vector>

#include "csv_writer.hpp"

// One RollingCsvWriter per configured underlying. Rows are routed by
// underlying_symbol; rows for an underlying without a writer are dropped with
// a warning.
class MultiCsvWriter
{
public:
    struct Options
    {
        std::filesystem::path output_dir;
        std::vector<std::string> underlyings;
        std::string file_venue_token{"NSEFO"};
        std::size_t flush_rows{500};
        std::chrono::milliseconds flush_interval{1000};
    };

    MultiCsvWriter(const Options& opts, const TzConverter& tz, const IClock& clock = SystemClock::instance());

    void write(const SnapshotRow& row);
    void write_many(const std::vector<SnapshotRow>& rows);
    void flush();
    void check_time_flush();

    // Closes every writer, even if one of them fails.
    void close();

    std::map<std::string, CsvWriterStats> stats() const;
    std::size_t unknown_rows() const noexcept { return unknown_rows_.load(std::memory_order_relaxed); }

    // nullptr if the underlying is not configured.
    RollingCsvWriter* writer_for(const std::string& underlying);

private:
    std::map<std::string, std::unique_ptr<RollingCsvWriter>> writers_;
    std::atomic<std::size_t> unknown_rows_{0};
    std::mutex warn_m_;
    std::set<std::string> warned_;
};
