#pragma once
//
// Alternative chart representations built from the normalized series.
//

#include <epoch_ta/core/bar.h>

namespace epoch_ta::transform {

constexpr size_t kMaxRenkoBricks = 10000;

// Heikin-Ashi candles, one per input bar.  Strictly sequential: each open
// depends on the previous Heikin-Ashi candle.
[[nodiscard]] BarList HeikinAshi(BarList const &bars);

// max((ATR14, or 1% of the last close without enough history) * 0.8,
//     0.25% of the last close).  Zero for an empty series.
[[nodiscard]] double DefaultRenkoBrickSize(BarList const &bars);

/**
 * Renko bricks.
 *
 * Walks the closes and emits a brick each time price has moved at least one
 * brick size away from the last brick boundary, moving the boundary by
 * exactly one brick.  A single bar may produce several bricks.  When nothing
 * moves far enough the last input bar is returned on its own, so the result
 * is only empty for an empty input.  A missing or non-positive `brickSize`
 * uses DefaultRenkoBrickSize.  A brick size small enough to lay more than
 * kMaxRenkoBricks bricks is coarsened to total close travel / kMaxRenkoBricks.
 */
[[nodiscard]] BarList Renko(BarList const &bars,
                            std::optional<double> brickSize = std::nullopt);

} // namespace epoch_ta::transform
