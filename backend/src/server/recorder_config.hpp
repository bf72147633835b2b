#pragma once
#include <chrono>
#include <cstddef>
#include <map>
#include <stdexcept>
#include <string>
#include <vector>

#include <nlohmann/json_fwd.hpp>

#include "md/tick.hpp"
#include "universe/option_universe.hpp"

// Invalid or missing setting. The message names the offending key.
class ConfigurationError : public std::runtime_error
{
public:
    using std::runtime_error::runtime_error;
};

struct FeedSettings
{
    std::string source{"ws"}; // "ws" | "replay"
    std::string host{"ws.kite.trade"};
    unsigned short port{443};
    std::string path{"/"};
    std::string replay_file;
    std::chrono::milliseconds replay_interval{1000};
    bool replay_loop{true};
    std::size_t max_tokens_per_connection{3000};
    std::size_t max_connections{3};
};

struct RecorderConfig
{
    std::vector<std::string> underlyings;
    std::chrono::milliseconds sampling_interval{1000};
    std::size_t flush_rows_per_write{500};
    std::chrono::milliseconds flush_interval{1000};
    std::string venue_label{"NSE-FO"};
    std::string file_venue_token{"NSEFO"};
    std::string timezone{"Asia/Kolkata"};
    int reconnect_max_tries{50};
    std::chrono::milliseconds reconnect_max_delay{30000};
    std::string output_dir;
    bool write_empty_cycles{false};

    FeedSettings feed;

    std::string instruments_file;
    std::string instruments_exchange{"NFO"};
    UniverseSettings universe; // underlyings and fallback_spot mirrored here

    std::map<std::string, double> spot_prices;
    std::map<std::string, InstrumentToken> index_tokens;
};

// Throws ConfigurationError.
RecorderConfig parse_config(const nlohmann::json& j);
RecorderConfig load_config(const std::string& path);

// KEY=VALUE lines into the environment; variables already set win. Missing
// file is not an error.
void load_env_file(const std::string& filepath = ".env");
