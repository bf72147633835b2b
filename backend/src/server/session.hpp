#pragma once
#include <optional>
#include <string>

#include <boost/date_time/gregorian/gregorian_types.hpp>

struct SessionCredentials
{
    std::string api_key;
    std::string access_token;
    std::string source; // "env" | token file path
};

// Credentials for the websocket feed.
//
// KITE_API_KEY and KITE_ACCESS_TOKEN come from the environment. Without an
// access token there, the token file (KITE_TOKEN_FILE, default
// .kite_token.json) is consulted: {"access_token": "...", "date": "YYYY-MM-DD"}.
// Tokens expire daily, so the file is only honored when `date` equals `today`.
//
// Throws ConfigurationError when no usable credentials are found.
SessionCredentials load_session(const boost::gregorian::date& today);

// Token from a token file if it is dated `today`; nullopt otherwise.
std::optional<std::string> read_token_file(const std::string& path, const boost::gregorian::date& today);
