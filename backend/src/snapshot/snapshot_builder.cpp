#include "snapshot_builder.hpp"

#include <cmath>

SnapshotBuilder::SnapshotBuilder(std::string venue_label, TzConverter tz, const IClock& clock)
    : venue_label_(std::move(venue_label)), tz_(std::move(tz)), clock_(clock) {}

std::array<RowLevel, SNAPSHOT_DEPTH> SnapshotBuilder::extract_depth(const std::vector<DepthLevel>& side) {
    std::array<RowLevel, SNAPSHOT_DEPTH> out{};
    for (std::size_t i = 0; i < SNAPSHOT_DEPTH && i < side.size(); ++i) {
        const auto& lvl = side[i];
        if (lvl.price == 0.0 || !std::isfinite(lvl.price) || lvl.quantity < 0) continue;
        out[i].px = lvl.price;
        out[i].sz = lvl.quantity;
    }
    return out;
}

std::int64_t SnapshotBuilder::to_utc_micros(const ExchangeTimestamp& ts) const {
    return ts.utc ? ts.micros : tz_.naive_to_utc_micros(ts.micros);
}

SnapshotRow SnapshotBuilder::build_row(const Tick* tick,
                                       const ContractMeta& meta,
                                       const SpotLookup& spot,
                                       std::optional<std::int64_t> ts_micros) const {
    SnapshotRow row;

    if (ts_micros) row.ts = *ts_micros;
    else if (tick && tick->exchange_ts) row.ts = to_utc_micros(*tick->exchange_ts);
    else row.ts = now_micros();

    row.venue = venue_label_;
    row.underlying_symbol = meta.underlying;
    if (spot) row.underlying_spot = spot(meta.underlying);
    row.instrument_id = meta.instrument_id;
    row.option_symbol = meta.tradingsymbol;
    row.expiry_date = meta.expiry_date;
    row.strike = meta.strike;
    row.option_type = to_short_code(meta.option_type);

    if (!tick) return row;

    row.bids = extract_depth(tick->buy);
    row.asks = extract_depth(tick->sell);

    row.best_bid_px = row.bids[0].px;
    row.best_bid_sz = row.bids[0].sz;
    row.best_ask_px = row.asks[0].px;
    row.best_ask_sz = row.asks[0].sz;

    if (row.best_bid_px && row.best_ask_px) {
        row.mid_px = (*row.best_bid_px + *row.best_ask_px) / 2;
        row.spread = *row.best_ask_px - *row.best_bid_px;
    }

    if (tick->last_price && std::isfinite(*tick->last_price)) row.last_trade_px = tick->last_price;
    row.last_trade_sz = tick->last_quantity;
    return row;
}

std::vector<SnapshotRow> SnapshotBuilder::build_snapshot(const TickMap& ticks,
                                                         const Universe& universe,
                                                         const SpotLookup& spot,
                                                         std::optional<std::int64_t> ts_micros) const {
    const std::int64_t ts = ts_micros ? *ts_micros : now_micros();

    std::vector<SnapshotRow> rows;
    rows.reserve(universe.size());
    for (const auto& [token, meta] : universe) {
        auto it = ticks.find(token);
        rows.push_back(build_row(it == ticks.end() ? nullptr : &it->second, meta, spot, ts));
    }
    return rows;
}
