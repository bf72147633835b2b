#include "snapshot_row.hpp"

namespace {

template <typename T>
FieldValue opt(const std::optional<T>& v) {
    if (!v) return std::monostate{};
    return FieldValue{*v};
}

} // namespace

std::array<FieldValue, SNAPSHOT_COLUMN_COUNT> SnapshotRow::fields() const {
    return {
        FieldValue{ts},
        FieldValue{venue},
        FieldValue{underlying_symbol},
        opt(underlying_spot),
        FieldValue{instrument_id},
        FieldValue{option_symbol},
        FieldValue{expiry_date},
        FieldValue{strike},
        FieldValue{option_type},
        opt(best_bid_px), opt(best_bid_sz),
        opt(best_ask_px), opt(best_ask_sz),
        opt(mid_px), opt(spread),
        opt(last_trade_px), opt(last_trade_sz),
        opt(bids[0].px), opt(bids[0].sz),
        opt(bids[1].px), opt(bids[1].sz),
        opt(bids[2].px), opt(bids[2].sz),
        opt(asks[0].px), opt(asks[0].sz),
        opt(asks[1].px), opt(asks[1].sz),
        opt(asks[2].px), opt(asks[2].sz),
    };
}
