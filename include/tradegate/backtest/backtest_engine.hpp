#pragma once

#include "../config/settings.hpp"
#include "../logging/async_logger.hpp"
#include "../market/market_data.hpp"
#include "../news/news_features.hpp"
#include "../report/metrics.hpp"
#include "../risk/risk_engine.hpp"
#include "../strategy/istrategy.hpp"

#include <optional>
#include <string>
#include <vector>

namespace tradegate {
namespace backtest {

/**
 * Inclusive time range in ms
 */
struct BacktestRange {
    Timestamp start = 0;
    Timestamp end = 0;

    bool contains(Timestamp ts) const { return ts >= start && ts <= end; }

    /**
     * Whole UTC days: start at 00:00:00 of start_day, end at 23:59:59 of end_day.
     *
     * @throws std::invalid_argument if either date does not parse
     */
    static BacktestRange from_dates(const std::string& start_day, const std::string& end_day);
};

struct BacktestResult {
    report::Metrics metrics;
    std::vector<double> equity;
    std::vector<report::TradeRecord> trades;
    std::vector<news::FeatureRow> feature_rows;  // one per candle
    size_t candles_used = 0;
    double final_position = 0;
};

/**
 * BacktestEngine - replays the decision pipeline over historical candles
 *
 * For each candle in time order:
 *   1. features from news available at the candle time (point-in-time)
 *   2. strategy plan from candles [0..i]
 *   3. risk state reset on UTC day change, unrealized PnL marked at the close
 *   4. the live RiskEngine, with closes i-1 and i feeding the cooldown bypass
 *   5. fill at the close with slippage and maker/taker fees
 *
 * No randomness and no wall clock: the same inputs give the same output.
 *
 * Usage:
 *   BacktestEngine engine(settings);
 *   auto result = engine.run("BTC/USDT", candles, news, *strategy, range);
 */
class BacktestEngine {
public:
    explicit BacktestEngine(const config::Settings& settings);

    /**
     * @throws std::runtime_error if no candle falls in the range
     */
    BacktestResult run(const std::string& symbol, const std::vector<market::Candle>& candles,
                       const std::vector<news::NewsFeature>& news, strategy::IStrategy& strategy,
                       std::optional<BacktestRange> range = std::nullopt);

    void set_logger(logging::AsyncLogger* logger) { logger_ = logger; }

    double fee_rate() const;
    double slippage_rate() const { return settings_.backtest.slippage_bps / 10000.0; }

private:
    config::Settings settings_;
    risk::RiskEngine risk_;
    logging::AsyncLogger* logger_ = nullptr;
};

}  // namespace backtest
}  // namespace tradegate
