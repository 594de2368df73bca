#include "../../include/tradegate/strategy/baseline_strategy.hpp"
#include "../../include/tradegate/strategy/strategy_factory.hpp"

#include <algorithm>
#include <cstdio>
#include <stdexcept>

namespace tradegate {
namespace strategy {

namespace {

std::string format2(const char* fmt, double a, double b) {
    char buf[128];
    std::snprintf(buf, sizeof(buf), fmt, a, b);
    return buf;
}

}  // namespace

// =============================================================================
// BaselineStrategy
// =============================================================================

TradePlan BaselineStrategy::generate_plan(const std::string& symbol, std::span<const market::Candle> candles,
                                          const news::FeatureVector& /*features*/) {
    size_t sma_period = static_cast<size_t>(std::max(config_.sma_period, 1));
    size_t lookback = static_cast<size_t>(std::max(config_.momentum_lookback, 1));
    if (candles.size() < std::max(sma_period, lookback) + 1) {
        return TradePlan::hold(symbol, name(), "insufficient data");
    }

    double sum = 0;
    for (size_t i = candles.size() - sma_period; i < candles.size(); ++i)
        sum += candles[i].close;
    double sma = sum / static_cast<double>(sma_period);
    double current = candles.back().close;
    double momentum = current - candles[candles.size() - 1 - lookback].close;

    double size = current > 0 ? capital_ * config_.base_position_pct / current : 0.0;

    TradePlan plan;
    plan.symbol = symbol;
    plan.size = size;
    plan.price = current;
    plan.confidence = CONFIDENCE;
    plan.strategy = name();

    if (current > sma && momentum > 0) {
        plan.side = Side::Buy;
        plan.rationale = format2("price>%.2f, momentum=%.2f", sma, momentum);
        return plan;
    }
    if (current < sma && momentum < 0) {
        plan.side = Side::Sell;
        plan.rationale = format2("price<%.2f, momentum=%.2f", sma, momentum);
        return plan;
    }
    return TradePlan::hold(symbol, name(), format2("no signal (price=%.2f, sma=%.2f)", current, sma));
}

// =============================================================================
// NewsOverlayStrategy
// =============================================================================

TradePlan NewsOverlayStrategy::generate_plan(const std::string& symbol, std::span<const market::Candle> candles,
                                             const news::FeatureVector& features) {
    TradePlan plan = baseline_.generate_plan(symbol, candles, features);
    if (plan.is_hold())
        return plan;

    double sentiment = features.sentiment_weighted;
    char note[64];
    if (sentiment >= overlay_.sentiment_boost_threshold) {
        plan.size *= overlay_.boost_multiplier;
        plan.confidence = std::min(0.95, plan.confidence + 0.1);
        std::snprintf(note, sizeof(note), "; sentiment boost %.2f", sentiment);
        plan.rationale += note;
    } else if (sentiment <= overlay_.sentiment_cut_threshold) {
        plan.size *= overlay_.cut_multiplier;
        plan.confidence = std::max(0.1, plan.confidence - 0.1);
        std::snprintf(note, sizeof(note), "; sentiment cut %.2f", sentiment);
        plan.rationale += note;
    }
    plan.strategy = name();
    return plan;
}

// =============================================================================
// StrategyFactory
// =============================================================================

std::unique_ptr<IStrategy> StrategyFactory::create(const std::string& name, const config::Settings& settings) {
    if (name == "baseline") {
        return std::make_unique<BaselineStrategy>(settings.strategies.baseline, settings.risk.capital);
    }
    if (name == "news_overlay") {
        return std::make_unique<NewsOverlayStrategy>(settings.strategies.baseline, settings.strategies.news_overlay,
                                                     settings.risk.capital);
    }
    throw std::invalid_argument("Unknown strategy: " + name);
}

const std::vector<std::string>& StrategyFactory::names() {
    static const std::vector<std::string> all = {"baseline", "news_overlay"};
    return all;
}

}  // namespace strategy
}  // namespace tradegate
