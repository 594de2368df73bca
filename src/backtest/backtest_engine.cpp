#include "../../include/tradegate/backtest/backtest_engine.hpp"
#include "../../include/tradegate/util/time_utils.hpp"

#include <algorithm>
#include <span>
#include <stdexcept>

namespace tradegate {
namespace backtest {

BacktestRange BacktestRange::from_dates(const std::string& start_day, const std::string& end_day) {
    auto start = util::parse_iso8601(start_day);
    auto end = util::parse_iso8601(end_day);
    if (!start || !end) {
        throw std::invalid_argument("invalid backtest dates: " + start_day + " .. " + end_day);
    }
    BacktestRange range;
    range.start = util::utc_day_start(*start);
    range.end = util::utc_day_start(*end) + util::MS_PER_DAY - util::MS_PER_SECOND;
    return range;
}

BacktestEngine::BacktestEngine(const config::Settings& settings)
    : settings_(settings), risk_(settings.risk, settings.trading) {}

double BacktestEngine::fee_rate() const {
    const auto& bt = settings_.backtest;
    return (bt.assume_taker ? bt.taker_fee_bps : bt.maker_fee_bps) / 10000.0;
}

BacktestResult BacktestEngine::run(const std::string& symbol, const std::vector<market::Candle>& candles,
                                   const std::vector<news::NewsFeature>& news, strategy::IStrategy& strategy,
                                   std::optional<BacktestRange> range) {
    std::vector<market::Candle> series;
    series.reserve(candles.size());
    for (const auto& c : candles) {
        if (!range || range->contains(c.ts))
            series.push_back(c);
    }
    std::stable_sort(series.begin(), series.end(),
                     [](const market::Candle& a, const market::Candle& b) { return a.ts < b.ts; });
    if (series.empty()) {
        throw std::runtime_error("no candles in range");
    }

    news::NewsTimeline timeline(news, settings_.news.news_latency_seconds, settings_.news.sentiment_lookback_hours);
    const double fee_rate_value = fee_rate();
    const double slippage = slippage_rate();

    BacktestResult result;
    result.feature_rows.reserve(series.size());

    double position = 0;
    double avg_cost = 0;
    risk::RiskState state;

    for (size_t i = 0; i < series.size(); ++i) {
        const market::Candle& candle = series[i];
        const Timestamp now = candle.ts;

        news::FeatureRow row;
        row.symbol = symbol;
        row.ts = now;
        row.features_ref = news::make_features_ref(symbol, now);
        row.features = timeline.features_at(now);
        result.feature_rows.push_back(row);

        std::span<const market::Candle> history(series.data(), i + 1);
        strategy::TradePlan plan = strategy.generate_plan(symbol, history, row.features);

        std::string day = util::utc_day(now);
        if (state.day != day) {
            state = risk::RiskState::fresh_for_day(day);
        }

        const double price = candle.close;
        state.unrealized_pnl = position > 0 ? (price - avg_cost) * position : 0.0;

        risk::RiskContext ctx;
        ctx.position = position;
        ctx.state = state;
        ctx.now = now;
        if (i > 0)
            ctx.prev_close = series[i - 1].close;
        ctx.last_close = price;

        risk::RiskDecision decision = risk_.evaluate(plan, ctx);
        if (!decision.approved || !decision.plan)
            continue;
        const strategy::TradePlan& approved = *decision.plan;

        report::TradeRecord trade;
        trade.symbol = symbol;
        trade.side = approved.side;
        trade.mode = TradingMode::Paper;
        trade.created_at = now;

        if (approved.side == Side::Buy) {
            double size = approved.size;
            double exec_price = price * (1 + slippage);
            double fee = exec_price * size * fee_rate_value;
            avg_cost = (avg_cost * position + exec_price * size + fee) / (position + size);
            position += size;

            trade.size = size;
            trade.price = exec_price;
            trade.fee = fee;
            trade.notional = exec_price * size;
            trade.pnl = 0;
        } else if (approved.side == Side::Sell && position > 0) {
            double size = std::min(approved.size, position);
            double exec_price = price * (1 - slippage);
            double fee = exec_price * size * fee_rate_value;
            double pnl = (exec_price - avg_cost) * size - fee;
            position -= size;
            if (position <= SIZE_EPSILON) {
                position = 0;
                avg_cost = 0;
            }
            state.realized_pnl += pnl;

            trade.size = size;
            trade.price = exec_price;
            trade.fee = fee;
            trade.notional = exec_price * size;
            trade.pnl = pnl;
        } else {
            continue;
        }

        state.executions_today += 1;
        state.last_execution_at = now;
        result.trades.push_back(trade);

        TG_LOGF_DEBUG(logger_, Backtest, "backtest.fill %s %s size=%.8f price=%.2f pnl=%.2f",
                      util::format_iso8601(now).c_str(), side_to_string(trade.side), trade.size, trade.price,
                      trade.pnl);
    }

    std::optional<Timestamp> start = range ? std::optional<Timestamp>(range->start) : std::nullopt;
    std::optional<Timestamp> end = range ? std::optional<Timestamp>(range->end) : std::nullopt;
    report::MetricsResult metrics = report::compute_metrics(result.trades, settings_.risk.capital, start, end);
    result.metrics = metrics.metrics;
    result.equity = std::move(metrics.equity);
    result.candles_used = series.size();
    result.final_position = position;

    TG_LOGF_INFO(logger_, Backtest,
                 "backtest.done strategy=%s candles=%zu trades=%zu pnl=%.2f", strategy.name(), series.size(),
                 result.trades.size(), result.metrics.total_pnl);
    return result;
}

}  // namespace backtest
}  // namespace tradegate
