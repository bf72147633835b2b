#include "json_tick_decoder.hpp"

#include <cctype>
#include <chrono>
#include <cmath>
#include <cstdio>
#include <iostream>
#include <limits>
#include <string>

namespace
{
    bool read_number(simdjson::ondemand::value &v, std::optional<double> &out)
    {
        simdjson::ondemand::json_type t;
        if (v.type().get(t))
            return false;
        if (t == simdjson::ondemand::json_type::null)
        {
            out.reset();
            return true;
        }
        double d = 0;
        if (v.get_double().get(d))
            return false;
        out = d;
        return true;
    }

    // Largest magnitude that still converts to int64 without overflow.
    constexpr double MAX_INT64_DOUBLE = 9.2e18;
    constexpr double MAX_EPOCH_SECONDS = MAX_INT64_DOUBLE / 1e6;

    std::optional<std::int64_t> to_int64(double d)
    {
        if (!std::isfinite(d) || std::fabs(d) >= MAX_INT64_DOUBLE)
            return std::nullopt;
        return static_cast<std::int64_t>(std::llround(d));
    }

    bool read_quantity(simdjson::ondemand::value &v, std::optional<std::int64_t> &out)
    {
        std::optional<double> d;
        if (!read_number(v, d))
            return false;
        out = d ? to_int64(*d) : std::nullopt;
        return true;
    }

    std::optional<std::int64_t> epoch_seconds_to_micros(double seconds)
    {
        if (!std::isfinite(seconds) || std::fabs(seconds) >= MAX_EPOCH_SECONDS)
            return std::nullopt;
        return static_cast<std::int64_t>(std::trunc(seconds * 1e6));
    }

    std::int32_t clamp_orders(double d)
    {
        if (!std::isfinite(d) || d <= 0)
            return 0;
        if (d >= static_cast<double>(std::numeric_limits<std::int32_t>::max()))
            return std::numeric_limits<std::int32_t>::max();
        return static_cast<std::int32_t>(d);
    }
}

std::optional<ExchangeTimestamp> JsonTickDecoder::parse_timestamp(std::string_view text)
{
    // YYYY-MM-DD[ T]HH:MM:SS[.ffffff][Z]
    const std::string s(text);
    int y = 0, mo = 0, d = 0, h = 0, mi = 0, sec = 0, consumed = 0;
    char sep = 0;
    if (std::sscanf(s.c_str(), "%4d-%2d-%2d%c%2d:%2d:%2d%n", &y, &mo, &d, &sep, &h, &mi, &sec, &consumed) != 7)
        return std::nullopt;
    if (sep != ' ' && sep != 'T')
        return std::nullopt;
    if (h > 23 || mi > 59 || sec > 60)
        return std::nullopt;

    using namespace std::chrono;
    const year_month_day ymd{year{y}, month{static_cast<unsigned>(mo)}, day{static_cast<unsigned>(d)}};
    if (!ymd.ok())
        return std::nullopt;

    std::size_t i = static_cast<std::size_t>(consumed);
    std::int64_t frac_us = 0;
    if (i < s.size() && s[i] == '.')
    {
        ++i;
        int digits = 0;
        while (i < s.size() && std::isdigit(static_cast<unsigned char>(s[i])))
        {
            if (digits < 6)
            {
                frac_us = frac_us * 10 + (s[i] - '0');
                ++digits;
            }
            ++i; // digits past microseconds are truncated
        }
        for (; digits < 6; ++digits)
            frac_us *= 10;
    }

    ExchangeTimestamp ts;
    if (i < s.size() && s[i] == 'Z')
    {
        ts.utc = true;
        ++i;
    }
    if (i != s.size())
        return std::nullopt;

    const auto day_start = sys_days{ymd}.time_since_epoch();
    ts.micros = duration_cast<microseconds>(day_start).count() +
                ((h * 60LL + mi) * 60LL + sec) * 1000000LL + frac_us;
    return ts;
}

bool JsonTickDecoder::decode(const std::string &frame, bool binary, std::vector<Tick> &out)
{
    if (binary)
    {
        if (!warned_binary_)
        {
            std::cerr << "[json-tick] binary frames are not decoded by the JSON decoder; dropping them" << std::endl;
            warned_binary_ = true;
        }
        return false;
    }

    simdjson::padded_string pj(frame);
    auto doc_res = parser_.iterate(pj);
    if (auto err = doc_res.error())
    {
        std::cerr << "[json-tick] iterate error: " << err << "\n";
        return false;
    }
    simdjson::ondemand::document doc = std::move(doc_res.value());

    simdjson::ondemand::json_type root_type;
    if (auto err = doc.type().get(root_type))
    {
        std::cerr << "[json-tick] bad frame: " << err << "\n";
        return false;
    }

    const std::size_t before = out.size();

    if (root_type == simdjson::ondemand::json_type::array)
    {
        simdjson::ondemand::array arr;
        if (doc.get_array().get(arr))
            return false;
        parse_ticks(arr, out);
        return out.size() > before;
    }

    if (root_type != simdjson::ondemand::json_type::object)
        return false;

    simdjson::ondemand::object root;
    if (doc.get_object().get(root))
        return false;

    std::string_view type_sv;
    if (root["type"].get_string().get(type_sv))
        return false;

    if (type_sv == "ticks")
    {
        simdjson::ondemand::array arr;
        if (auto err = root["data"].get_array().get(arr))
        {
            std::cerr << "[json-tick] ticks frame without data array: " << err << "\n";
            return false;
        }
        parse_ticks(arr, out);
        return out.size() > before;
    }

    if (type_sv == "error" || type_sv == "message")
    {
        std::string_view msg;
        if (root["data"].get_string().get(msg))
            msg = "(no text)";
        std::cerr << "[json-tick] feed " << type_sv << ": " << msg << std::endl;
    }
    return false;
}

bool JsonTickDecoder::parse_ticks(simdjson::ondemand::array arr, std::vector<Tick> &out)
{
    bool any = false;
    for (auto item : arr)
    {
        simdjson::ondemand::object obj;
        if (item.get_object().get(obj))
        {
            ++rejected_;
            continue;
        }
        Tick t;
        if (parse_tick(obj, t))
        {
            out.push_back(std::move(t));
            any = true;
        }
        else
        {
            ++rejected_;
        }
    }
    return any;
}

bool JsonTickDecoder::parse_tick(simdjson::ondemand::object obj, Tick &out)
{
    bool have_token = false;

    for (auto field_res : obj)
    {
        simdjson::ondemand::field field;
        if (std::move(field_res).get(field))
            return false;
        std::string_view key;
        if (field.unescaped_key().get(key))
            return false;
        simdjson::ondemand::value &v = field.value();

        if (key == "instrument_token")
        {
            std::uint64_t token = 0;
            if (v.get_uint64().get(token))
                return false;
            if (token == 0 || token > std::numeric_limits<InstrumentToken>::max())
                return false;
            out.token = static_cast<InstrumentToken>(token);
            have_token = true;
        }
        else if (key == "last_price")
        {
            if (!read_number(v, out.last_price))
                return false;
            if (out.last_price && !std::isfinite(*out.last_price))
                out.last_price.reset();
        }
        else if (key == "last_quantity" || key == "last_traded_quantity")
        {
            if (!read_quantity(v, out.last_quantity))
                return false;
        }
        else if (key == "exchange_timestamp")
        {
            simdjson::ondemand::json_type t;
            if (v.type().get(t))
                return false;
            if (t == simdjson::ondemand::json_type::string)
            {
                std::string_view sv;
                if (v.get_string().get(sv))
                    return false;
                out.exchange_ts = parse_timestamp(sv); // unparseable => wall clock later
            }
            else if (t == simdjson::ondemand::json_type::number)
            {
                double secs = 0;
                if (v.get_double().get(secs))
                    return false;
                // out of range => wall clock later, like an unparseable string
                if (auto us = epoch_seconds_to_micros(secs))
                    out.exchange_ts = ExchangeTimestamp{*us, true};
            }
        }
        else if (key == "depth")
        {
            simdjson::ondemand::object depth;
            if (v.get_object().get(depth))
                continue; // depth:null in non-full modes
            if (!parse_depth(depth, out))
                return false;
        }
    }
    return have_token;
}

bool JsonTickDecoder::parse_depth(simdjson::ondemand::object obj, Tick &out)
{
    for (auto field_res : obj)
    {
        simdjson::ondemand::field field;
        if (std::move(field_res).get(field))
            return false;
        std::string_view key;
        if (field.unescaped_key().get(key))
            return false;

        std::vector<DepthLevel> *side = nullptr;
        if (key == "buy")
            side = &out.buy;
        else if (key == "sell")
            side = &out.sell;
        else
            continue;

        simdjson::ondemand::array levels;
        if (field.value().get_array().get(levels))
            return false;
        if (!parse_side(levels, *side))
            return false;
    }
    return true;
}

bool JsonTickDecoder::parse_side(simdjson::ondemand::array arr, std::vector<DepthLevel> &out)
{
    out.clear();
    for (auto item : arr)
    {
        simdjson::ondemand::object o;
        if (item.get_object().get(o))
            return false;
        if (out.size() >= MAX_DEPTH_LEVELS)
            continue;

        DepthLevel lvl;
        for (auto field_res : o)
        {
            simdjson::ondemand::field field;
            if (std::move(field_res).get(field))
                return false;
            std::string_view key;
            if (field.unescaped_key().get(key))
                return false;
            simdjson::ondemand::value &v = field.value();

            std::optional<double> num;
            if (key == "price" || key == "quantity" || key == "orders")
            {
                if (!read_number(v, num))
                    return false;
            }
            if (!num)
                continue;
            if (key == "price")
                lvl.price = *num;
            else if (key == "quantity")
                lvl.quantity = to_int64(*num).value_or(-1);
            else if (key == "orders")
                lvl.orders = clamp_orders(*num);
        }
        out.push_back(lvl);
    }
    return true;
}
