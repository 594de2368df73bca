#pragma once

#include "../market/market_data.hpp"
#include "../news/news_features.hpp"
#include "trade_plan.hpp"

#include <span>
#include <string>

namespace tradegate {
namespace strategy {

/**
 * Strategy Interface
 *
 * Turns a candle history (oldest first, last element = current candle) and the
 * point-in-time news features into a TradePlan. Implementations must not look
 * past the last candle they are given.
 */
class IStrategy {
public:
    virtual ~IStrategy() = default;

    virtual TradePlan generate_plan(const std::string& symbol, std::span<const market::Candle> candles,
                                    const news::FeatureVector& features) = 0;

    virtual const char* name() const = 0;
};

}  // namespace strategy
}  // namespace tradegate
