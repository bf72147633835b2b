#pragma once
#include <cstddef>
#include <cstdint>
#include <istream>
#include <map>
#include <optional>
#include <string>
#include <vector>

#include <boost/date_time/gregorian/gregorian_types.hpp>

#include "md/contract_meta.hpp"

// One option row from the broker's instrument dump.
struct InstrumentRecord
{
    InstrumentToken token{0};
    std::string tradingsymbol;
    std::string name; // underlying, e.g. "NIFTY"
    boost::gregorian::date expiry;
    double strike{0};
    std::int64_t lot_size{1};
    OptionType type{OptionType::Call};
};

// Option contracts of one exchange, indexed by underlying.
class InstrumentCatalog
{
public:
    // Reads the dump CSV. Columns are located by header name; rows that are not
    // CE/PE of `exchange` are ignored, malformed rows are counted and skipped.
    // Throws std::runtime_error if the file cannot be read or a required column
    // is missing.
    static InstrumentCatalog load_csv(const std::string& path, const std::string& exchange = "NFO");
    static InstrumentCatalog from_stream(std::istream& in, const std::string& exchange = "NFO");

    void add(InstrumentRecord rec);

    // Sorted, unique.
    std::vector<boost::gregorian::date> expiries(const std::string& underlying) const;
    std::vector<InstrumentRecord> options(const std::string& underlying, const boost::gregorian::date& expiry) const;

    std::size_t size() const noexcept { return count_; }
    std::size_t malformed() const noexcept { return malformed_; }

    // Splits one CSV line, honoring double-quoted fields.
    static std::vector<std::string> split_csv_line(const std::string& line);

private:
    std::map<std::string, std::vector<InstrumentRecord>> by_underlying_;
    std::size_t count_{0};
    std::size_t malformed_{0};
};

// "YYYY-MM-DD" (anything after the date is ignored).
std::optional<boost::gregorian::date> parse_iso_date(const std::string& s);
