#pragma once
#include <array>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "md/contract_meta.hpp"
#include "md/tick.hpp"
#include "snapshot_row.hpp"
#include "spot_book.hpp"
#include "util/clock.hpp"
#include "util/tz.hpp"

// Maps (tick, contract, spot, timestamp) to a SnapshotRow. Holds no mutable
// state, so concurrent calls are safe.
//
// Depth levels are normalized before use: a level whose price is 0 (the feed's
// "no quote" marker), non-finite, or whose quantity is negative becomes
// (null, null). A missing tick produces a row with metadata only.
class SnapshotBuilder {
public:
    SnapshotBuilder(std::string venue_label,
                    TzConverter tz,
                    const IClock& clock = SystemClock::instance());

    // ts_micros: cycle timestamp. Without it the tick's exchange timestamp is
    // used, and without that the wall clock.
    SnapshotRow build_row(const Tick* tick,
                          const ContractMeta& meta,
                          const SpotLookup& spot,
                          std::optional<std::int64_t> ts_micros = std::nullopt) const;

    // Exactly one row per universe entry, in universe order.
    std::vector<SnapshotRow> build_snapshot(const TickMap& ticks,
                                            const Universe& universe,
                                            const SpotLookup& spot,
                                            std::optional<std::int64_t> ts_micros = std::nullopt) const;

    std::int64_t now_micros() const { return clock_.utc_micros(); }
    std::int64_t to_utc_micros(const ExchangeTimestamp& ts) const;

    const std::string& venue_label() const noexcept { return venue_label_; }

    static std::array<RowLevel, SNAPSHOT_DEPTH> extract_depth(const std::vector<DepthLevel>& side);

private:
    std::string venue_label_;
    TzConverter tz_;
    const IClock& clock_;
};
