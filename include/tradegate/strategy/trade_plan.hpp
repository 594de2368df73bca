#pragma once

#include "../types.hpp"

#include <string>

namespace tradegate {
namespace strategy {

/**
 * A strategy's desired trade, before risk checks
 *
 * hold plans carry size = price = confidence = 0.
 */
struct TradePlan {
    std::string symbol;
    Side side = Side::Hold;
    double size = 0;
    double price = 0;
    double confidence = 0;
    std::string rationale;
    std::string strategy;

    bool is_hold() const { return side == Side::Hold; }
    double notional() const { return size * price; }

    static TradePlan hold(std::string symbol, std::string strategy, std::string rationale) {
        TradePlan plan;
        plan.symbol = std::move(symbol);
        plan.strategy = std::move(strategy);
        plan.rationale = std::move(rationale);
        return plan;
    }
};

}  // namespace strategy
}  // namespace tradegate
