#pragma once
#include <cstdint>
#include <string>

#include <boost/date_time/gregorian/gregorian_types.hpp>
#include <boost/date_time/local_time/local_time_types.hpp>

// Converts between UTC instants and wall-clock time in one configured zone.
//
// The zone is given either as an IANA name ("Asia/Kolkata"), resolved through
// the system zoneinfo database (TZDIR or /usr/share/zoneinfo), or as a POSIX
// TZ rule string ("IST-5:30"). Only the zone's current rule is used, which is
// what a live recorder needs.
class TzConverter {
public:
    // Throws std::invalid_argument if the zone cannot be resolved or parsed.
    explicit TzConverter(const std::string& zone);

    // Naive wall time (microseconds since 1970-01-01 00:00 local) -> UTC
    // microseconds since the Unix epoch. Nonexistent or ambiguous local times
    // are resolved against the zone's standard offset.
    std::int64_t naive_to_utc_micros(std::int64_t naive_micros) const;

    // Calendar date in this zone at the given UTC instant.
    boost::gregorian::date local_date(std::int64_t utc_micros) const;

    const std::string& name() const noexcept { return name_; }

    // POSIX TZ rule (offsets positive west of UTC) -> Boost rule (offsets
    // positive east, DST given as an adjustment). Exposed for tests.
    static std::string posix_to_boost_rule(const std::string& posix);

private:
    std::string name_;
    boost::local_time::time_zone_ptr zone_;
};

std::string format_yyyymmdd(const boost::gregorian::date& d);
