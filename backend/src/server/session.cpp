#include "session.hpp"

#include <cstdlib>
#include <fstream>
#include <iostream>

#include <boost/date_time/gregorian/gregorian.hpp>
#include <nlohmann/json.hpp>

#include "recorder_config.hpp"

namespace
{
    std::string env_or_empty(const char* name)
    {
        const char* v = std::getenv(name);
        return v ? std::string(v) : std::string();
    }
}

std::optional<std::string> read_token_file(const std::string& path, const boost::gregorian::date& today)
{
    std::ifstream in(path);
    if (!in.is_open())
        return std::nullopt;

    try
    {
        const auto j = nlohmann::json::parse(in);
        const auto token = j.value("access_token", std::string());
        const auto date = j.value("date", std::string());
        if (token.empty())
            return std::nullopt;
        if (date != boost::gregorian::to_iso_extended_string(today))
        {
            std::cerr << "[setup] token file " << path << " is dated '" << date << "', ignoring" << std::endl;
            return std::nullopt;
        }
        return token;
    }
    catch (const nlohmann::json::exception& e)
    {
        std::cerr << "[setup] token file " << path << " unreadable: " << e.what() << std::endl;
        return std::nullopt;
    }
}

SessionCredentials load_session(const boost::gregorian::date& today)
{
    SessionCredentials s;
    s.api_key = env_or_empty("KITE_API_KEY");
    if (s.api_key.empty())
        throw ConfigurationError("KITE_API_KEY is not set");

    s.access_token = env_or_empty("KITE_ACCESS_TOKEN");
    if (!s.access_token.empty())
    {
        s.source = "env";
        return s;
    }

    std::string path = env_or_empty("KITE_TOKEN_FILE");
    if (path.empty())
        path = ".kite_token.json";
    if (auto token = read_token_file(path, today))
    {
        s.access_token = *token;
        s.source = path;
        return s;
    }
    throw ConfigurationError("no access token: set KITE_ACCESS_TOKEN or refresh " + path);
}
