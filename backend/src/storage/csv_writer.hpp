#pragma once
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include <boost/date_time/gregorian/gregorian_types.hpp>

#include "snapshot/snapshot_row.hpp"
#include "util/clock.hpp"
#include "util/tz.hpp"

struct CsvWriterStats
{
    std::string current_file;
    std::uint64_t rows_written{0};
    std::size_t buffer_size{0};
    std::string start_date; // YYYY-MM-DD, empty until the first file is opened
    std::uint64_t write_failures{0};
    std::uint64_t rows_dropped{0};
};

// Buffered CSV writer for one underlying, one file per local calendar day:
//   {UNDERLYING}_{VENUE}_OPTION_CHAIN_1S_{START}_{END}.csv
// Files open as START=END=today and only ever receive that day's rows. The
// first flush on a later day closes the file under its final name and opens
// the new day's file.
//
// A failed flush drops the buffered rows and closes the handle; the next flush
// reopens. All public methods are thread-safe.
class RollingCsvWriter
{
public:
    struct Options
    {
        std::filesystem::path output_dir;
        std::string underlying;
        std::string file_venue_token{"NSEFO"};
        std::size_t flush_rows{500};
        std::chrono::milliseconds flush_interval{1000};
    };

    RollingCsvWriter(Options opts, const TzConverter& tz, const IClock& clock = SystemClock::instance());
    ~RollingCsvWriter();

    RollingCsvWriter(const RollingCsvWriter&) = delete;
    RollingCsvWriter& operator=(const RollingCsvWriter&) = delete;

    void write(const SnapshotRow& row);
    void write_many(const std::vector<SnapshotRow>& rows);

    // Flushes if rows are buffered and flush_interval has passed since the
    // last flush. Returns true if a flush ran.
    bool check_time_flush();
    void flush();

    // Flush and release the file. Later calls do nothing.
    void close();

    CsvWriterStats stats() const;
    const std::string& underlying() const noexcept { return opts_.underlying; }

    static std::string file_name(const std::string& underlying,
                                 const std::string& venue,
                                 const boost::gregorian::date& start,
                                 const boost::gregorian::date& end);

private:
    void append_locked(const SnapshotRow& row);
    void flush_locked();
    void rollover_locked();
    void open_locked(const boost::gregorian::date& today);
    void close_handle_locked() noexcept;

    Options opts_;
    const TzConverter& tz_;
    const IClock& clock_;

    mutable std::mutex m_;
    std::vector<std::string> buffer_;
    std::ofstream out_;
    std::filesystem::path current_path_;
    std::optional<boost::gregorian::date> start_date_;
    std::chrono::steady_clock::time_point last_flush_;
    std::uint64_t rows_written_{0};
    std::uint64_t write_failures_{0};
    std::uint64_t rows_dropped_{0};
    bool closed_{false};
};
