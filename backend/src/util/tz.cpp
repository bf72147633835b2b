#include "tz.hpp"

#include <boost/date_time/gregorian/gregorian.hpp>
#include <boost/date_time/local_time/local_time.hpp>
#include <boost/date_time/posix_time/posix_time.hpp>
#include <boost/make_shared.hpp>

#include <cctype>
#include <cstdio>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <optional>
#include <stdexcept>

namespace {

const boost::posix_time::ptime kEpoch(boost::gregorian::date(1970, 1, 1));

// The rule string stored after the last data block of a TZif v2+ file.
std::optional<std::string> read_tzif_footer(const std::string& zone) {
    if (zone.empty() || zone.find("..") != std::string::npos) return std::nullopt;

    const char* env_dir = std::getenv("TZDIR");
    const std::filesystem::path path =
        std::filesystem::path(env_dir ? env_dir : "/usr/share/zoneinfo") / zone;

    std::error_code ec;
    if (!std::filesystem::is_regular_file(path, ec)) return std::nullopt;

    std::ifstream in(path, std::ios::binary);
    if (!in.is_open()) return std::nullopt;
    std::string data((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());

    if (data.size() < 6 || data.compare(0, 4, "TZif") != 0) return std::nullopt;
    if (data[4] < '2') return std::nullopt; // v1 files carry no footer
    if (data.back() != '\n') return std::nullopt;

    const auto start = data.rfind('\n', data.size() - 2);
    if (start == std::string::npos) return std::nullopt;
    std::string footer = data.substr(start + 1, data.size() - start - 2);
    if (footer.empty()) return std::nullopt;
    return footer;
}

// Zone abbreviation: alphabetic run or a <quoted> name.
std::string parse_abbrev(const std::string& s, std::size_t& i, const char* placeholder) {
    if (i < s.size() && s[i] == '<') {
        const auto close = s.find('>', i);
        if (close == std::string::npos) throw std::invalid_argument("unterminated <name> in '" + s + "'");
        i = close + 1;
        return placeholder;
    }
    const std::size_t begin = i;
    while (i < s.size() && std::isalpha(static_cast<unsigned char>(s[i]))) ++i;
    return s.substr(begin, i - begin);
}

// [+|-]hh[:mm[:ss]] -> seconds, POSIX sign convention.
bool parse_offset(const std::string& s, std::size_t& i, long& seconds) {
    int sign = 1;
    std::size_t j = i;
    if (j < s.size() && (s[j] == '+' || s[j] == '-')) {
        if (s[j] == '-') sign = -1;
        ++j;
    }
    if (j >= s.size() || !std::isdigit(static_cast<unsigned char>(s[j]))) return false;

    long parts[3] = {0, 0, 0};
    int n = 0;
    while (n < 3) {
        long v = 0;
        bool any = false;
        while (j < s.size() && std::isdigit(static_cast<unsigned char>(s[j]))) {
            v = v * 10 + (s[j] - '0');
            ++j;
            any = true;
        }
        if (!any) break;
        parts[n++] = v;
        if (j < s.size() && s[j] == ':') ++j;
        else break;
    }
    seconds = sign * (parts[0] * 3600 + parts[1] * 60 + parts[2]);
    i = j;
    return true;
}

std::string format_offset(long seconds) {
    const char sign = seconds < 0 ? '-' : '+';
    if (seconds < 0) seconds = -seconds;
    char buf[16];
    std::snprintf(buf, sizeof(buf), "%c%02ld:%02ld:%02ld",
                  sign, seconds / 3600, (seconds / 60) % 60, seconds % 60);
    return buf;
}

} // namespace

std::string TzConverter::posix_to_boost_rule(const std::string& posix) {
    std::size_t i = 0;
    const std::string std_name = parse_abbrev(posix, i, "STD");
    if (std_name.empty()) throw std::invalid_argument("missing zone name in '" + posix + "'");

    long std_west = 0;
    if (!parse_offset(posix, i, std_west)) {
        throw std::invalid_argument("missing UTC offset in '" + posix + "'");
    }

    std::string out = std_name + format_offset(-std_west);
    if (i >= posix.size()) return out;

    const std::string dst_name = parse_abbrev(posix, i, "DST");
    if (dst_name.empty()) throw std::invalid_argument("bad DST section in '" + posix + "'");

    long dst_west = std_west - 3600;
    (void)parse_offset(posix, i, dst_west);

    std::string rules;
    if (i < posix.size() && posix[i] == ',') {
        rules = posix.substr(i);
    } else if (i >= posix.size()) {
        rules = ",M3.2.0,M11.1.0"; // POSIX default transition dates
    } else {
        throw std::invalid_argument("unexpected text in '" + posix + "'");
    }

    out += dst_name + format_offset(std_west - dst_west) + rules;
    return out;
}

TzConverter::TzConverter(const std::string& zone) : name_(zone) {
    const std::string rule = read_tzif_footer(zone).value_or(zone);
    try {
        zone_ = boost::make_shared<boost::local_time::posix_time_zone>(posix_to_boost_rule(rule));
    } catch (const std::exception& e) {
        throw std::invalid_argument("cannot resolve timezone '" + zone + "': " + e.what());
    }
}

std::int64_t TzConverter::naive_to_utc_micros(std::int64_t naive_micros) const {
    using boost::local_time::local_date_time;
    const boost::posix_time::ptime local = kEpoch + boost::posix_time::microseconds(naive_micros);

    const local_date_time ldt(local.date(), local.time_of_day(), zone_,
                              local_date_time::NOT_DATE_TIME_ON_ERROR);
    const boost::posix_time::ptime utc = ldt.is_not_a_date_time()
        ? local - zone_->base_utc_offset()
        : ldt.utc_time();
    return (utc - kEpoch).total_microseconds();
}

boost::gregorian::date TzConverter::local_date(std::int64_t utc_micros) const {
    const boost::posix_time::ptime utc = kEpoch + boost::posix_time::microseconds(utc_micros);
    const boost::local_time::local_date_time ldt(utc, zone_);
    return ldt.local_time().date();
}

std::string format_yyyymmdd(const boost::gregorian::date& d) {
    return boost::gregorian::to_iso_string(d);
}
