/*
Decoded market-data tick, as delivered by a feed connection
*/

#pragma once
#include <cstddef>
#include <cstdint>
#include <optional>
#include <unordered_map>
#include <vector>

using InstrumentToken = std::uint32_t;

// Depth published per side in full mode.
constexpr std::size_t MAX_DEPTH_LEVELS = 5;

struct DepthLevel
{
    double price{0};          // 0 => no quote at this level
    std::int64_t quantity{0};
    std::int32_t orders{0};
};

struct ExchangeTimestamp
{
    std::int64_t micros{0}; // since 1970-01-01 00:00:00 in the frame below
    bool utc{false};        // false: naive wall time in the configured timezone
};

// One instrument update. Immutable once received; a newer tick for the same
// token replaces the older one entirely.
struct Tick
{
    InstrumentToken token{0};
    std::optional<double> last_price;
    std::optional<std::int64_t> last_quantity;
    std::optional<ExchangeTimestamp> exchange_ts;

    std::vector<DepthLevel> buy;  // best first, at most MAX_DEPTH_LEVELS
    std::vector<DepthLevel> sell; // best first, at most MAX_DEPTH_LEVELS
};

using TickMap = std::unordered_map<InstrumentToken, Tick>;
