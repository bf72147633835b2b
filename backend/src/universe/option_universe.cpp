#include "option_universe.hpp"

#include <iostream>
#include <memory>
#include <set>
#include <sstream>
#include <utility>

#include <boost/date_time/gregorian/gregorian.hpp>

#include "util/tz.hpp"

std::optional<ExpiryMode> parse_expiry_mode(const std::string& s)
{
    if (s == "nearest")
        return ExpiryMode::Nearest;
    if (s == "weekly")
        return ExpiryMode::Weekly;
    if (s == "monthly")
        return ExpiryMode::Monthly;
    if (s == "explicit_list")
        return ExpiryMode::ExplicitList;
    return std::nullopt;
}

OptionUniverseSelector::OptionUniverseSelector(UniverseSettings settings)
    : settings_(std::move(settings))
{
    if (auto m = parse_expiry_mode(settings_.expiries_mode))
        mode_ = *m;
    else
        std::cerr << "[universe] unknown expiries_mode '" << settings_.expiries_mode
                  << "', using nearest" << std::endl;
}

std::vector<boost::gregorian::date> OptionUniverseSelector::select_expiries(
    const std::vector<boost::gregorian::date>& all,
    const boost::gregorian::date& today) const
{
    std::vector<boost::gregorian::date> valid;
    for (const auto& d : all)
    {
        if (d >= today)
            valid.push_back(d);
    }

    std::vector<boost::gregorian::date> out;
    if (valid.empty())
        return out;

    switch (mode_)
    {
    case ExpiryMode::Nearest:
        out.push_back(valid.front());
        break;
    case ExpiryMode::Weekly:
        for (std::size_t i = 0; i < valid.size() && i < settings_.weekly_count; ++i)
            out.push_back(valid[i]);
        break;
    case ExpiryMode::Monthly:
    {
        // First expiry of each month falling late enough to be the monthly.
        std::set<std::pair<int, int>> months;
        for (const auto& d : valid)
        {
            if (out.size() >= settings_.monthly_count)
                break;
            if (d.day() < settings_.monthly_min_day)
                continue;
            if (months.insert({static_cast<int>(d.year()), static_cast<int>(d.month())}).second)
                out.push_back(d);
        }
        break;
    }
    case ExpiryMode::ExplicitList:
    {
        const std::set<boost::gregorian::date> available(valid.begin(), valid.end());
        for (const auto& s : settings_.expiry_list)
        {
            auto d = parse_iso_date(s);
            if (!d)
            {
                std::cerr << "[universe] invalid expiry date '" << s << "'" << std::endl;
                continue;
            }
            if (available.count(*d))
                out.push_back(*d);
        }
        break;
    }
    }
    return out;
}

UniverseBuild OptionUniverseSelector::build(const InstrumentCatalog& catalog,
                                            const SpotLookup& spots,
                                            const boost::gregorian::date& today) const
{
    auto universe = std::make_shared<Universe>();
    UniverseBuild result;

    for (const auto& underlying : settings_.underlyings)
    {
        UnderlyingSelection sel;
        sel.underlying = underlying;

        if (spots)
            sel.band_center = spots(underlying);
        if (!sel.band_center)
        {
            auto fb = settings_.fallback_spot.find(underlying);
            if (fb != settings_.fallback_spot.end())
            {
                sel.band_center = fb->second;
                std::cerr << "[universe] no spot for " << underlying << ", using fallback " << fb->second << std::endl;
            }
            else
            {
                std::cerr << "[universe] no spot for " << underlying << ", strike band disabled" << std::endl;
            }
        }

        sel.expiries = select_expiries(catalog.expiries(underlying), today);
        if (sel.expiries.empty())
            std::cerr << "[universe] no expiries selected for " << underlying << std::endl;

        for (const auto& expiry : sel.expiries)
        {
            const auto yyyymmdd = format_yyyymmdd(expiry);
            for (const auto& rec : catalog.options(underlying, expiry))
            {
                if (sel.band_center &&
                    (rec.strike < *sel.band_center - settings_.max_strike_distance ||
                     rec.strike > *sel.band_center + settings_.max_strike_distance))
                    continue;

                ContractMeta meta;
                meta.token = rec.token;
                meta.tradingsymbol = rec.tradingsymbol;
                meta.underlying = underlying;
                meta.expiry_date = boost::gregorian::to_iso_extended_string(expiry);
                meta.strike = rec.strike;
                meta.option_type = rec.type;
                meta.instrument_id = make_instrument_id(underlying, yyyymmdd, rec.strike, rec.type);
                meta.lot_size = rec.lot_size;
                if (universe->emplace(rec.token, std::move(meta)).second)
                    ++sel.contracts;
            }
        }
        result.selections.push_back(std::move(sel));
    }

    result.universe = std::move(universe);
    return result;
}

std::string OptionUniverseSelector::describe(const UniverseBuild& b)
{
    std::ostringstream os;
    os << "universe: " << (b.universe ? b.universe->size() : 0) << " contracts";
    for (const auto& s : b.selections)
    {
        os << "\n  " << s.underlying << ": " << s.contracts << " contracts, expiries [";
        for (std::size_t i = 0; i < s.expiries.size(); ++i)
            os << (i ? " " : "") << boost::gregorian::to_iso_extended_string(s.expiries[i]);
        os << "]";
        if (s.band_center)
            os << ", band center " << *s.band_center;
    }
    return os.str();
}
