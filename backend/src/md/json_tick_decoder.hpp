#pragma once
#include "tick_decoder.hpp"

#include <simdjson.h>
#include <cstdint>
#include <optional>
#include <string_view>

// Decodes JSON tick frames:
//   [ {tick}, {tick}, ... ]
//   {"type":"ticks","data":[ {tick}, ... ]}
//   {"type":"error"|"message", "data":"..."}   (logged, no ticks)
//
// Tick object fields: instrument_token (required), last_price,
// last_quantity | last_traded_quantity, exchange_timestamp
// ("YYYY-MM-DD HH:MM:SS[.ffffff]" naive, trailing 'Z' for UTC, or epoch
// seconds as a number), depth {buy:[{price,quantity,orders}], sell:[...]}.
// Binary frames are not understood by this decoder and are dropped.
class JsonTickDecoder final : public ITickDecoder {
public:
    bool decode(const std::string& frame, bool binary, std::vector<Tick>& out) override;

    std::uint64_t rejected() const noexcept { return rejected_; }

    static std::optional<ExchangeTimestamp> parse_timestamp(std::string_view text);

private:
    bool parse_ticks(simdjson::ondemand::array arr, std::vector<Tick>& out);
    bool parse_tick(simdjson::ondemand::object obj, Tick& out);
    static bool parse_depth(simdjson::ondemand::object obj, Tick& out);
    static bool parse_side(simdjson::ondemand::array arr, std::vector<DepthLevel>& out);

    simdjson::ondemand::parser parser_;
    std::uint64_t rejected_{0};
    bool warned_binary_{false};
};
