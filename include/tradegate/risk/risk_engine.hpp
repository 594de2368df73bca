#pragma once

#include "../config/settings.hpp"
#include "../strategy/trade_plan.hpp"
#include "risk_state.hpp"

#include <optional>
#include <string>

namespace tradegate {
namespace risk {

/**
 * Per-evaluation inputs besides the plan
 */
struct RiskContext {
    double position = 0;  // base units held for the plan's symbol
    RiskState state;
    Timestamp now = 0;
    // Two most recent closes on the primary timeframe (for the volatility bypass)
    std::optional<double> prev_close;
    std::optional<double> last_close;
};

struct RiskDecision {
    bool approved = false;
    std::string reason;
    std::optional<strategy::TradePlan> plan;

    static RiskDecision reject(std::string reason) { return RiskDecision{false, std::move(reason), std::nullopt}; }
};

/**
 * RiskEngine - ordered pre-trade gate
 *
 * Pure: the same plan and context always give the same decision. Checks run in
 * a fixed order and the first failure wins. Size adjustments only ever shrink
 * the plan.
 *
 * Usage:
 *   RiskEngine engine(settings.risk, settings.trading);
 *   auto decision = engine.evaluate(plan, ctx);
 *   if (decision.approved) submit(*decision.plan);
 */
class RiskEngine {
public:
    RiskEngine(const config::RiskConfig& limits, const config::TradingConfig& trading)
        : limits_(limits), trading_(trading) {}

    RiskDecision evaluate(const strategy::TradePlan& plan, const RiskContext& ctx) const;

    /**
     * True when the last candle moved at least bypass_pct against the previous
     * close. A non-positive bypass_pct disables the bypass.
     */
    static bool volatility_bypass(std::optional<double> prev_close, std::optional<double> last_close,
                                  double bypass_pct);

    const config::RiskConfig& limits() const { return limits_; }
    const config::TradingConfig& trading() const { return trading_; }

private:
    config::RiskConfig limits_;
    config::TradingConfig trading_;
};

}  // namespace risk
}  // namespace tradegate
