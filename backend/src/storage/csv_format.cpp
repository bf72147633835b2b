#include "csv_format.hpp"

#include <array>
#include <charconv>
#include <cmath>
#include <type_traits>

namespace
{
    constexpr double TRUNCATE_ABOVE = 1e10;
}

std::string format_double(double v)
{
    if (!std::isfinite(v))
        return {};

    // Fixed notation of 1e308 needs ~310 chars.
    std::array<char, 400> buf;
    if (std::fabs(v) > TRUNCATE_ABOVE)
    {
        auto [end, ec] = std::to_chars(buf.data(), buf.data() + buf.size(), std::trunc(v),
                                       std::chars_format::fixed, 0);
        if (ec != std::errc{})
            return {};
        return std::string(buf.data(), end);
    }

    auto [end, ec] = std::to_chars(buf.data(), buf.data() + buf.size(), v, std::chars_format::fixed);
    if (ec != std::errc{})
        return {};
    std::string s(buf.data(), end);
    if (s.find('.') == std::string::npos)
        s += ".0";
    return s;
}

std::string csv_quote(std::string_view s)
{
    if (s.find_first_of(",\"\r\n") == std::string_view::npos)
        return std::string(s);

    std::string out;
    out.reserve(s.size() + 2);
    out.push_back('"');
    for (char c : s)
    {
        if (c == '"')
            out.push_back('"');
        out.push_back(c);
    }
    out.push_back('"');
    return out;
}

std::string format_value(const FieldValue& v)
{
    return std::visit([](const auto& x) -> std::string
                      {
        using T = std::decay_t<decltype(x)>;
        if constexpr (std::is_same_v<T, std::monostate>) return {};
        else if constexpr (std::is_same_v<T, std::int64_t>) return std::to_string(x);
        else if constexpr (std::is_same_v<T, double>) return format_double(x);
        else return csv_quote(x); },
                      v);
}

std::string csv_header()
{
    std::string out;
    for (std::size_t i = 0; i < SNAPSHOT_COLUMNS.size(); ++i)
    {
        if (i)
            out.push_back(',');
        out += SNAPSHOT_COLUMNS[i];
    }
    return out;
}

std::string format_row(const SnapshotRow& row)
{
    const auto fields = row.fields();
    std::string out;
    out.reserve(256);
    for (std::size_t i = 0; i < fields.size(); ++i)
    {
        if (i)
            out.push_back(',');
        out += format_value(fields[i]);
    }
    return out;
}
