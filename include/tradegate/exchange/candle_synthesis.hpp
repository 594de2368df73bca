#pragma once

#include "../market/market_data.hpp"

#include <optional>
#include <span>
#include <string>
#include <vector>

namespace tradegate {
namespace exchange {

/**
 * Timeframe text ("1m", "5m", "1h", "1d", "1w") to milliseconds
 */
std::optional<int64_t> timeframe_to_ms(const std::string& timeframe);

/**
 * Bucket trades into OHLCV candles for exchanges without a candle endpoint.
 *
 * Buckets are aligned to multiples of timeframe_ms. Trades need not be
 * sorted; empty buckets produce no candle. Output is ordered by ts.
 */
std::vector<market::Candle> synthesize_candles(std::span<const market::MarketTrade> trades, int64_t timeframe_ms);

}  // namespace exchange
}  // namespace tradegate
