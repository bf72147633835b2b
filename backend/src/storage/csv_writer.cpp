#include "csv_writer.hpp"

#include <iostream>
#include <stdexcept>
#include <system_error>

#include <boost/date_time/gregorian/gregorian.hpp>

#include "csv_format.hpp"

namespace fs = std::filesystem;

RollingCsvWriter::RollingCsvWriter(Options opts, const TzConverter& tz, const IClock& clock)
    : opts_(std::move(opts)), tz_(tz), clock_(clock), last_flush_(clock.steady_now())
{
    std::error_code ec;
    fs::create_directories(opts_.output_dir, ec);
    if (ec)
        throw std::runtime_error("cannot create output dir " + opts_.output_dir.string() + ": " + ec.message());
    buffer_.reserve(opts_.flush_rows);
}

RollingCsvWriter::~RollingCsvWriter()
{
    try
    {
        close();
    }
    catch (const std::exception &e)
    {
        std::cerr << "[csv] " << opts_.underlying << " close in destructor failed: " << e.what() << std::endl;
    }
}

std::string RollingCsvWriter::file_name(const std::string& underlying,
                                        const std::string& venue,
                                        const boost::gregorian::date& start,
                                        const boost::gregorian::date& end)
{
    return underlying + "_" + venue + "_OPTION_CHAIN_1S_" + format_yyyymmdd(start) + "_" + format_yyyymmdd(end) + ".csv";
}

void RollingCsvWriter::append_locked(const SnapshotRow& row)
{
    buffer_.push_back(format_row(row));
    if (buffer_.size() >= opts_.flush_rows)
        flush_locked();
}

void RollingCsvWriter::write(const SnapshotRow& row)
{
    std::lock_guard<std::mutex> lk(m_);
    if (closed_)
    {
        ++rows_dropped_;
        return;
    }
    append_locked(row);
}

void RollingCsvWriter::write_many(const std::vector<SnapshotRow>& rows)
{
    std::lock_guard<std::mutex> lk(m_);
    if (closed_)
    {
        rows_dropped_ += rows.size();
        return;
    }
    for (const auto& r : rows)
        append_locked(r);
}

bool RollingCsvWriter::check_time_flush()
{
    std::lock_guard<std::mutex> lk(m_);
    if (closed_ || buffer_.empty())
        return false;
    if (clock_.steady_now() - last_flush_ < opts_.flush_interval)
        return false;
    flush_locked();
    return true;
}

void RollingCsvWriter::flush()
{
    std::lock_guard<std::mutex> lk(m_);
    if (!closed_)
        flush_locked();
}

void RollingCsvWriter::close()
{
    std::lock_guard<std::mutex> lk(m_);
    if (closed_)
        return;
    flush_locked();
    close_handle_locked();
    closed_ = true;
    std::cout << "[csv] " << opts_.underlying << " closed, rows_written=" << rows_written_ << std::endl;
}

void RollingCsvWriter::flush_locked()
{
    if (buffer_.empty())
    {
        last_flush_ = clock_.steady_now();
        return;
    }

    try
    {
        const auto today = tz_.local_date(clock_.utc_micros());
        if (start_date_ && *start_date_ != today)
            rollover_locked();
        if (!out_.is_open())
            open_locked(today);

        for (const auto& line : buffer_)
            out_ << line << '\n';
        out_.flush();
        if (!out_)
            throw std::runtime_error("write to " + current_path_.string() + " failed");

        rows_written_ += buffer_.size();
    }
    catch (const std::exception &e)
    {
        ++write_failures_;
        rows_dropped_ += buffer_.size();
        std::cerr << "[csv] " << opts_.underlying << " flush failed, dropped " << buffer_.size()
                  << " rows: " << e.what() << std::endl;
        close_handle_locked();
    }
    buffer_.clear();
    last_flush_ = clock_.steady_now();
}

// A file is named after the single local day it holds, so closing it is the
// whole rollover; the next open starts the new day's file.
void RollingCsvWriter::rollover_locked()
{
    close_handle_locked();
    std::cout << "[csv] " << opts_.underlying << " day rollover, closed " << current_path_.filename().string() << std::endl;
    start_date_.reset();
    current_path_.clear();
}

void RollingCsvWriter::open_locked(const boost::gregorian::date& today)
{
    const fs::path path = opts_.output_dir / file_name(opts_.underlying, opts_.file_venue_token, today, today);

    std::error_code ec;
    const bool existed = fs::exists(path, ec);

    out_.clear();
    out_.open(path, std::ios::out | std::ios::app);
    if (!out_.is_open())
        throw std::runtime_error("cannot open " + path.string());

    start_date_ = today;
    current_path_ = path;

    if (!existed)
    {
        out_ << csv_header() << '\n';
        std::cout << "[csv] created " << path.string() << std::endl;
    }
    else
    {
        std::cout << "[csv] appending to " << path.string() << std::endl;
    }
}

void RollingCsvWriter::close_handle_locked() noexcept
{
    if (!out_.is_open())
        return;
    out_.flush();
    out_.close();
    out_.clear();
}

CsvWriterStats RollingCsvWriter::stats() const
{
    std::lock_guard<std::mutex> lk(m_);
    CsvWriterStats s;
    s.current_file = current_path_.string();
    s.rows_written = rows_written_;
    s.buffer_size = buffer_.size();
    if (start_date_)
        s.start_date = boost::gregorian::to_iso_extended_string(*start_date_);
    s.write_failures = write_failures_;
    s.rows_dropped = rows_dropped_;
    return s;
}
