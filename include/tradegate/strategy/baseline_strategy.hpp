#pragma once

#include "../config/settings.hpp"
#include "istrategy.hpp"

namespace tradegate {
namespace strategy {

/**
 * SMA + momentum baseline
 *
 * Buy when the close is above its SMA and momentum is positive, sell on the
 * mirror condition, hold otherwise. Size is a fixed share of capital.
 */
class BaselineStrategy : public IStrategy {
public:
    static constexpr double CONFIDENCE = config::strategy::BASELINE_CONFIDENCE;

    BaselineStrategy(const config::BaselineStrategyConfig& config, double capital)
        : config_(config), capital_(capital) {}

    TradePlan generate_plan(const std::string& symbol, std::span<const market::Candle> candles,
                            const news::FeatureVector& features) override;

    const char* name() const override { return "baseline"; }

private:
    config::BaselineStrategyConfig config_;
    double capital_;
};

/**
 * Baseline signal scaled by aggregate news sentiment
 */
class NewsOverlayStrategy : public IStrategy {
public:
    NewsOverlayStrategy(const config::BaselineStrategyConfig& baseline, const config::NewsOverlayConfig& overlay,
                        double capital)
        : baseline_(baseline, capital), overlay_(overlay) {}

    TradePlan generate_plan(const std::string& symbol, std::span<const market::Candle> candles,
                            const news::FeatureVector& features) override;

    const char* name() const override { return "news_overlay"; }

private:
    BaselineStrategy baseline_;
    config::NewsOverlayConfig overlay_;
};

}  // namespace strategy
}  // namespace tradegate
