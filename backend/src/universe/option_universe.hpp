#pragma once
#include <cstddef>
#include <map>
#include <optional>
#include <string>
#include <vector>

#include <boost/date_time/gregorian/gregorian_types.hpp>

#include "instrument_catalog.hpp"
#include "md/contract_meta.hpp"
#include "snapshot/spot_book.hpp"

enum class ExpiryMode
{
    Nearest,
    Weekly,
    Monthly,
    ExplicitList
};

std::optional<ExpiryMode> parse_expiry_mode(const std::string& s);

struct UniverseSettings
{
    std::vector<std::string> underlyings;
    std::string expiries_mode{"nearest"};
    std::vector<std::string> expiry_list; // YYYY-MM-DD, explicit_list mode
    double max_strike_distance{2500};
    std::size_t weekly_count{4};
    int monthly_min_day{22};
    std::size_t monthly_count{3};
    std::map<std::string, double> fallback_spot;
};

struct UnderlyingSelection
{
    std::string underlying;
    std::vector<boost::gregorian::date> expiries;
    std::optional<double> band_center; // unset: no strike band applied
    std::size_t contracts{0};
};

struct UniverseBuild
{
    UniversePtr universe;
    std::vector<UnderlyingSelection> selections;
};

// Picks the contracts to record: expiries per the configured mode, then the
// strikes within max_strike_distance of the underlying's spot.
class OptionUniverseSelector
{
public:
    explicit OptionUniverseSelector(UniverseSettings settings);

    // `all` must be sorted ascending. Only expiries on or after `today` count.
    std::vector<boost::gregorian::date> select_expiries(const std::vector<boost::gregorian::date>& all,
                                                        const boost::gregorian::date& today) const;

    UniverseBuild build(const InstrumentCatalog& catalog,
                        const SpotLookup& spots,
                        const boost::gregorian::date& today) const;

    ExpiryMode mode() const noexcept { return mode_; }

    static std::string describe(const UniverseBuild& b);

private:
    UniverseSettings settings_;
    ExpiryMode mode_{ExpiryMode::Nearest};
};
