#include "instrument_catalog.hpp"

#include <algorithm>
#include <fstream>
#include <iostream>
#include <stdexcept>

namespace
{
    const char* REQUIRED_COLUMNS[] = {"instrument_token", "tradingsymbol", "name", "expiry",
                                      "strike", "instrument_type"};

    std::optional<long long> parse_int(const std::string& s)
    {
        if (s.empty())
            return std::nullopt;
        try
        {
            std::size_t pos = 0;
            long long v = std::stoll(s, &pos);
            if (pos != s.size())
                return std::nullopt;
            return v;
        }
        catch (const std::exception&)
        {
            return std::nullopt;
        }
    }

    std::optional<double> parse_double(const std::string& s)
    {
        if (s.empty())
            return std::nullopt;
        try
        {
            std::size_t pos = 0;
            double v = std::stod(s, &pos);
            if (pos != s.size())
                return std::nullopt;
            return v;
        }
        catch (const std::exception&)
        {
            return std::nullopt;
        }
    }
}

std::optional<boost::gregorian::date> parse_iso_date(const std::string& s)
{
    if (s.size() < 10 || s[4] != '-' || s[7] != '-')
        return std::nullopt;
    auto y = parse_int(s.substr(0, 4));
    auto m = parse_int(s.substr(5, 2));
    auto d = parse_int(s.substr(8, 2));
    if (!y || !m || !d)
        return std::nullopt;
    try
    {
        return boost::gregorian::date(static_cast<unsigned short>(*y),
                                      static_cast<unsigned short>(*m),
                                      static_cast<unsigned short>(*d));
    }
    catch (const std::out_of_range&)
    {
        return std::nullopt;
    }
}

std::vector<std::string> InstrumentCatalog::split_csv_line(const std::string& line)
{
    std::vector<std::string> out;
    std::string cur;
    bool quoted = false;
    for (std::size_t i = 0; i < line.size(); ++i)
    {
        char c = line[i];
        if (quoted)
        {
            if (c == '"')
            {
                if (i + 1 < line.size() && line[i + 1] == '"')
                {
                    cur.push_back('"');
                    ++i;
                }
                else
                    quoted = false;
            }
            else
                cur.push_back(c);
        }
        else if (c == '"')
            quoted = true;
        else if (c == ',')
        {
            out.push_back(std::move(cur));
            cur.clear();
        }
        else if (c != '\r')
            cur.push_back(c);
    }
    out.push_back(std::move(cur));
    return out;
}

InstrumentCatalog InstrumentCatalog::load_csv(const std::string& path, const std::string& exchange)
{
    std::ifstream in(path);
    if (!in.is_open())
        throw std::runtime_error("cannot open instrument file " + path);
    auto cat = from_stream(in, exchange);
    std::cout << "[universe] loaded " << cat.size() << " " << exchange << " options from " << path;
    if (cat.malformed())
        std::cout << " (" << cat.malformed() << " malformed rows skipped)";
    std::cout << std::endl;
    return cat;
}

InstrumentCatalog InstrumentCatalog::from_stream(std::istream& in, const std::string& exchange)
{
    std::string line;
    if (!std::getline(in, line))
        throw std::runtime_error("instrument file is empty");

    const auto header = split_csv_line(line);
    std::map<std::string, std::size_t> col;
    for (std::size_t i = 0; i < header.size(); ++i)
        col[header[i]] = i;
    for (const char* name : REQUIRED_COLUMNS)
    {
        if (!col.count(name))
            throw std::runtime_error(std::string("instrument file missing column '") + name + "'");
    }
    const auto exchange_col = col.find("exchange");
    const auto lot_col = col.find("lot_size");

    InstrumentCatalog cat;
    while (std::getline(in, line))
    {
        if (line.empty() || line == "\r")
            continue;
        const auto f = split_csv_line(line);
        auto at = [&](const char* name) -> const std::string&
        {
            static const std::string empty;
            std::size_t i = col.at(name);
            return i < f.size() ? f[i] : empty;
        };

        const auto& itype = at("instrument_type");
        if (itype != "CE" && itype != "PE")
            continue;
        if (exchange_col != col.end() && exchange_col->second < f.size() && f[exchange_col->second] != exchange)
            continue;

        auto token = parse_int(at("instrument_token"));
        auto strike = parse_double(at("strike"));
        auto expiry = parse_iso_date(at("expiry"));
        if (!token || *token <= 0 || *token > 0xFFFFFFFFLL || !strike || !expiry || at("name").empty())
        {
            ++cat.malformed_;
            continue;
        }

        InstrumentRecord rec;
        rec.token = static_cast<InstrumentToken>(*token);
        rec.tradingsymbol = at("tradingsymbol");
        rec.name = at("name");
        rec.expiry = *expiry;
        rec.strike = *strike;
        rec.type = itype == "CE" ? OptionType::Call : OptionType::Put;
        if (lot_col != col.end() && lot_col->second < f.size())
        {
            if (auto lot = parse_int(f[lot_col->second]))
                rec.lot_size = *lot;
        }
        cat.add(std::move(rec));
    }
    return cat;
}

void InstrumentCatalog::add(InstrumentRecord rec)
{
    by_underlying_[rec.name].push_back(std::move(rec));
    ++count_;
}

std::vector<boost::gregorian::date> InstrumentCatalog::expiries(const std::string& underlying) const
{
    std::vector<boost::gregorian::date> out;
    auto it = by_underlying_.find(underlying);
    if (it == by_underlying_.end())
        return out;
    for (const auto& r : it->second)
        out.push_back(r.expiry);
    std::sort(out.begin(), out.end());
    out.erase(std::unique(out.begin(), out.end()), out.end());
    return out;
}

std::vector<InstrumentRecord> InstrumentCatalog::options(const std::string& underlying,
                                                         const boost::gregorian::date& expiry) const
{
    std::vector<InstrumentRecord> out;
    auto it = by_underlying_.find(underlying);
    if (it == by_underlying_.end())
        return out;
    for (const auto& r : it->second)
    {
        if (r.expiry == expiry)
            out.push_back(r);
    }
    return out;
}
