#include "recorder_config.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <limits>

#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace
{
    template <typename T>
    T get_or(const json& j, const char* key, T fallback, const std::string& prefix = "")
    {
        auto it = j.find(key);
        if (it == j.end() || it->is_null())
            return fallback;
        try
        {
            return it->get<T>();
        }
        catch (const json::exception& e)
        {
            throw ConfigurationError("config key '" + prefix + key + "': " + e.what());
        }
    }

    // Durations are configured in seconds and must survive rounding to whole milliseconds.
    std::chrono::milliseconds positive_ms(double s, const std::string& key)
    {
        if (!(s > 0) || !std::isfinite(s))
            throw ConfigurationError("config key '" + key + "' must be > 0");
        const double ms = std::round(s * 1000.0);
        if (ms < 1.0)
            throw ConfigurationError("config key '" + key + "' must be at least 0.001 seconds");
        if (ms > static_cast<double>(std::numeric_limits<std::int32_t>::max()))
            throw ConfigurationError("config key '" + key + "' is too large");
        return std::chrono::milliseconds(static_cast<std::int64_t>(ms));
    }

    std::string to_upper(std::string s)
    {
        std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c)
                       { return static_cast<char>(std::toupper(c)); });
        return s;
    }
}

RecorderConfig parse_config(const json& j)
{
    if (!j.is_object())
        throw ConfigurationError("config root must be an object");

    RecorderConfig c;

    c.underlyings = get_or<std::vector<std::string>>(j, "underlyings", {});
    if (c.underlyings.empty())
        throw ConfigurationError("config key 'underlyings' is required and must be non-empty");
    for (auto& u : c.underlyings)
    {
        u = to_upper(u);
        if (u.empty())
            throw ConfigurationError("config key 'underlyings' contains an empty symbol");
    }

    const double sampling = get_or<double>(j, "sampling_interval_seconds", 1.0);
    c.sampling_interval = positive_ms(sampling, "sampling_interval_seconds");

    const auto flush_rows = get_or<long long>(j, "flush_rows_per_write", 500);
    if (flush_rows <= 0)
        throw ConfigurationError("config key 'flush_rows_per_write' must be > 0");
    c.flush_rows_per_write = static_cast<std::size_t>(flush_rows);

    const double flush_s = get_or<double>(j, "flush_interval_seconds", 1.0);
    c.flush_interval = positive_ms(flush_s, "flush_interval_seconds");

    c.venue_label = get_or<std::string>(j, "venue_label", c.venue_label);
    c.file_venue_token = get_or<std::string>(j, "file_venue_token", c.file_venue_token);
    if (c.file_venue_token.empty())
        throw ConfigurationError("config key 'file_venue_token' must not be empty");
    c.timezone = get_or<std::string>(j, "timezone", c.timezone);

    c.reconnect_max_tries = get_or<int>(j, "reconnect_max_tries", c.reconnect_max_tries);
    if (c.reconnect_max_tries < 0)
        throw ConfigurationError("config key 'reconnect_max_tries' must be >= 0");
    const double max_delay = get_or<double>(j, "reconnect_max_delay", 30.0);
    c.reconnect_max_delay = positive_ms(max_delay, "reconnect_max_delay");

    c.output_dir = get_or<std::string>(j, "output_dir", "");
    if (c.output_dir.empty())
        throw ConfigurationError("config key 'output_dir' is required");
    c.write_empty_cycles = get_or<bool>(j, "write_empty_cycles", false);

    // feed
    const json feed = get_or<json>(j, "feed", json::object());
    if (!feed.is_object())
        throw ConfigurationError("config key 'feed' must be an object");
    c.feed.source = get_or<std::string>(feed, "source", c.feed.source, "feed.");
    if (c.feed.source != "ws" && c.feed.source != "replay")
        throw ConfigurationError("config key 'feed.source' must be \"ws\" or \"replay\"");
    c.feed.host = get_or<std::string>(feed, "host", c.feed.host, "feed.");
    const int port = get_or<int>(feed, "port", c.feed.port, "feed.");
    if (port <= 0 || port > 65535)
        throw ConfigurationError("config key 'feed.port' out of range");
    c.feed.port = static_cast<unsigned short>(port);
    c.feed.path = get_or<std::string>(feed, "path", c.feed.path, "feed.");
    c.feed.replay_file = get_or<std::string>(feed, "replay_file", "", "feed.");
    const auto replay_ms = get_or<long long>(feed, "replay_interval_ms", 1000, "feed.");
    if (replay_ms <= 0)
        throw ConfigurationError("config key 'feed.replay_interval_ms' must be > 0");
    c.feed.replay_interval = std::chrono::milliseconds(replay_ms);
    c.feed.replay_loop = get_or<bool>(feed, "replay_loop", true, "feed.");
    if (c.feed.source == "replay" && c.feed.replay_file.empty())
        throw ConfigurationError("config key 'feed.replay_file' is required for replay source");
    const auto per_conn = get_or<long long>(feed, "max_tokens_per_connection", 3000, "feed.");
    const auto max_conn = get_or<long long>(feed, "max_connections", 3, "feed.");
    if (per_conn <= 0 || max_conn <= 0)
        throw ConfigurationError("config keys 'feed.max_tokens_per_connection' and 'feed.max_connections' must be > 0");
    c.feed.max_tokens_per_connection = static_cast<std::size_t>(per_conn);
    c.feed.max_connections = static_cast<std::size_t>(max_conn);

    // instruments
    const json instruments = get_or<json>(j, "instruments", json::object());
    if (!instruments.is_object())
        throw ConfigurationError("config key 'instruments' must be an object");
    c.instruments_file = get_or<std::string>(instruments, "file", "", "instruments.");
    if (c.instruments_file.empty())
        throw ConfigurationError("config key 'instruments.file' is required");
    c.instruments_exchange = get_or<std::string>(instruments, "exchange", c.instruments_exchange, "instruments.");

    // universe
    const json uni = get_or<json>(j, "universe", json::object());
    if (!uni.is_object())
        throw ConfigurationError("config key 'universe' must be an object");
    c.universe.underlyings = c.underlyings;
    c.universe.expiries_mode = get_or<std::string>(uni, "expiries_mode", c.universe.expiries_mode, "universe.");
    c.universe.expiry_list = get_or<std::vector<std::string>>(uni, "expiry_list", {}, "universe.");
    c.universe.max_strike_distance = get_or<double>(uni, "max_strike_distance", c.universe.max_strike_distance, "universe.");
    if (c.universe.max_strike_distance < 0)
        throw ConfigurationError("config key 'universe.max_strike_distance' must be >= 0");
    const auto weekly = get_or<long long>(uni, "weekly_count", 4, "universe.");
    const auto monthly = get_or<long long>(uni, "monthly_count", 3, "universe.");
    if (weekly <= 0 || monthly <= 0)
        throw ConfigurationError("config keys 'universe.weekly_count' and 'universe.monthly_count' must be > 0");
    c.universe.weekly_count = static_cast<std::size_t>(weekly);
    c.universe.monthly_count = static_cast<std::size_t>(monthly);
    c.universe.monthly_min_day = get_or<int>(uni, "monthly_min_day", c.universe.monthly_min_day, "universe.");
    if (c.universe.monthly_min_day < 1 || c.universe.monthly_min_day > 31)
        throw ConfigurationError("config key 'universe.monthly_min_day' must be in 1..31");

    for (const auto& [k, v] : get_or<std::map<std::string, double>>(j, "spot_prices", {}))
        c.spot_prices[to_upper(k)] = v;
    for (const auto& [k, v] : get_or<std::map<std::string, double>>(j, "fallback_spot", {}))
        c.universe.fallback_spot[to_upper(k)] = v;
    for (const auto& [k, v] : get_or<std::map<std::string, long long>>(j, "index_tokens", {}))
    {
        if (v <= 0 || v > 0xFFFFFFFFLL)
            throw ConfigurationError("config key 'index_tokens." + k + "' is not a valid token");
        c.index_tokens[to_upper(k)] = static_cast<InstrumentToken>(v);
    }

    return c;
}

RecorderConfig load_config(const std::string& path)
{
    std::ifstream in(path);
    if (!in.is_open())
        throw ConfigurationError("cannot open config file " + path);

    json j;
    try
    {
        j = json::parse(in);
    }
    catch (const json::parse_error& e)
    {
        throw ConfigurationError("config file " + path + " is not valid JSON: " + e.what());
    }
    auto c = parse_config(j);
    std::cout << "[config] loaded " << path << " (" << c.underlyings.size() << " underlyings, feed="
              << c.feed.source << ")" << std::endl;
    return c;
}

void load_env_file(const std::string& filepath)
{
    std::ifstream file(filepath);
    if (!file.is_open())
        return;

    std::string line;
    while (std::getline(file, line))
    {
        if (!line.empty() && line.back() == '\r')
            line.pop_back();
        if (line.empty() || line[0] == '#')
            continue;

        const auto eq_pos = line.find('=');
        if (eq_pos == std::string::npos)
            continue;

        std::string key = line.substr(0, eq_pos);
        std::string value = line.substr(eq_pos + 1);

        key.erase(0, key.find_first_not_of(" \t"));
        key.erase(key.find_last_not_of(" \t") + 1);
        value.erase(0, value.find_first_not_of(" \t"));
        value.erase(value.find_last_not_of(" \t") + 1);
        if (key.rfind("export ", 0) == 0)
            key = key.substr(7);

        if (value.size() >= 2 && (value[0] == '"' || value[0] == '\'') && value.back() == value[0])
            value = value.substr(1, value.length() - 2);

        if (!key.empty())
            setenv(key.c_str(), value.c_str(), 0);
    }
}
