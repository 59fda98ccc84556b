#pragma once
//
// Series normalization
//
// Turns provider rows into the canonical series every component consumes:
// invalid rows dropped, missing OHLC filled from close, sorted ascending by
// date with duplicate dates collapsed (last row wins).
//

#include <epoch_ta/core/bar.h>

namespace epoch_ta::data {

[[nodiscard]] BarList NormalizeHistory(std::vector<RawBar> const &history);

} // namespace epoch_ta::data
