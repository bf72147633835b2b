#pragma once
#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <variant>

// Typed cell value: null, integer, floating or text. Rendering to text is the
// writer's job.
using FieldValue = std::variant<std::monostate, std::int64_t, double, std::string>;

constexpr std::size_t SNAPSHOT_DEPTH = 3;
constexpr std::size_t SNAPSHOT_COLUMN_COUNT = 29;

inline constexpr std::array<const char*, SNAPSHOT_COLUMN_COUNT> SNAPSHOT_COLUMNS = {
    "ts", "venue", "underlying_symbol", "underlying_spot", "instrument_id",
    "option_symbol", "expiry_date", "strike", "option_type",
    "best_bid_px", "best_bid_sz", "best_ask_px", "best_ask_sz",
    "mid_px", "spread", "last_trade_px", "last_trade_sz",
    "bid_px_1", "bid_sz_1", "bid_px_2", "bid_sz_2", "bid_px_3", "bid_sz_3",
    "ask_px_1", "ask_sz_1", "ask_px_2", "ask_sz_2", "ask_px_3", "ask_sz_3",
};

// One side's level after normalization; both members are null together.
struct RowLevel {
    std::optional<double> px;
    std::optional<std::int64_t> sz;
};

// One sampled row per (token, cycle). Never modified after it is built.
struct SnapshotRow {
    std::int64_t ts{0}; // UTC microseconds since epoch
    std::string venue;
    std::string underlying_symbol;
    std::optional<double> underlying_spot;
    std::string instrument_id;
    std::string option_symbol;
    std::string expiry_date;
    double strike{0};
    std::string option_type; // "C" | "P"

    std::optional<double> best_bid_px;
    std::optional<std::int64_t> best_bid_sz;
    std::optional<double> best_ask_px;
    std::optional<std::int64_t> best_ask_sz;
    std::optional<double> mid_px;
    std::optional<double> spread;
    std::optional<double> last_trade_px;
    std::optional<std::int64_t> last_trade_sz;

    std::array<RowLevel, SNAPSHOT_DEPTH> bids;
    std::array<RowLevel, SNAPSHOT_DEPTH> asks;

    // Values in SNAPSHOT_COLUMNS order.
    std::array<FieldValue, SNAPSHOT_COLUMN_COUNT> fields() const;
};
