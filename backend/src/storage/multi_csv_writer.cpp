#include "multi_csv_writer.hpp"

#include <algorithm>
#include <cctype>
#include <iostream>

namespace
{
    std::string to_upper(std::string s)
    {
        std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c)
                       { return static_cast<char>(std::toupper(c)); });
        return s;
    }
}

MultiCsvWriter::MultiCsvWriter(const Options& opts, const TzConverter& tz, const IClock& clock)
{
    for (const auto& u : opts.underlyings)
    {
        const auto key = to_upper(u);
        if (writers_.count(key))
            continue;
        RollingCsvWriter::Options wo;
        wo.output_dir = opts.output_dir;
        wo.underlying = key;
        wo.file_venue_token = opts.file_venue_token;
        wo.flush_rows = opts.flush_rows;
        wo.flush_interval = opts.flush_interval;
        writers_.emplace(key, std::make_unique<RollingCsvWriter>(std::move(wo), tz, clock));
    }
}

RollingCsvWriter* MultiCsvWriter::writer_for(const std::string& underlying)
{
    auto it = writers_.find(to_upper(underlying));
    return it == writers_.end() ? nullptr : it->second.get();
}

void MultiCsvWriter::write(const SnapshotRow& row)
{
    if (auto* w = writer_for(row.underlying_symbol))
    {
        w->write(row);
        return;
    }
    unknown_rows_.fetch_add(1, std::memory_order_relaxed);
    std::lock_guard<std::mutex> lk(warn_m_);
    if (warned_.insert(row.underlying_symbol).second)
    {
        std::cerr << "[csv] no writer for underlying '" << row.underlying_symbol << "', dropping its rows" << std::endl;
    }
}

void MultiCsvWriter::write_many(const std::vector<SnapshotRow>& rows)
{
    // Group per writer so each takes its lock once.
    std::map<RollingCsvWriter*, std::vector<SnapshotRow>> grouped;
    for (const auto& r : rows)
    {
        if (auto* w = writer_for(r.underlying_symbol))
            grouped[w].push_back(r);
        else
            write(r);
    }
    for (auto& [w, batch] : grouped)
        w->write_many(batch);
}

void MultiCsvWriter::flush()
{
    for (auto& [_, w] : writers_)
        w->flush();
}

void MultiCsvWriter::check_time_flush()
{
    for (auto& [_, w] : writers_)
        w->check_time_flush();
}

void MultiCsvWriter::close()
{
    for (auto& [name, w] : writers_)
    {
        try
        {
            w->close();
        }
        catch (const std::exception &e)
        {
            std::cerr << "[csv] close " << name << " failed: " << e.what() << std::endl;
        }
    }
}

std::map<std::string, CsvWriterStats> MultiCsvWriter::stats() const
{
    std::map<std::string, CsvWriterStats> out;
    for (const auto& [name, w] : writers_)
        out.emplace(name, w->stats());
    return out;
}
