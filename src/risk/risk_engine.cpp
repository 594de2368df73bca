#include "../../include/tradegate/risk/risk_engine.hpp"
#include "../../include/tradegate/util/time_utils.hpp"

#include <algorithm>
#include <cmath>

namespace tradegate {
namespace risk {

bool RiskEngine::volatility_bypass(std::optional<double> prev_close, std::optional<double> last_close,
                                   double bypass_pct) {
    if (bypass_pct <= 0 || !prev_close || !last_close || *prev_close <= 0)
        return false;
    return std::abs(*last_close - *prev_close) / *prev_close >= bypass_pct;
}

RiskDecision RiskEngine::evaluate(const strategy::TradePlan& plan, const RiskContext& ctx) const {
    if (plan.is_hold()) {
        return RiskDecision{false, "no trade", plan};
    }
    if (trading_.kill_switch) {
        return RiskDecision::reject("kill switch enabled");
    }
    if (!trading_.is_whitelisted(plan.symbol)) {
        return RiskDecision::reject("symbol not whitelisted");
    }
    if (!(plan.size > 0) || !(plan.price > 0)) {
        return RiskDecision::reject("invalid size or price");
    }

    if (ctx.state.daily_loss_basis() <= -std::abs(limits_.max_loss_per_day)) {
        return RiskDecision::reject("daily loss limit reached");
    }
    if (ctx.state.executions_today >= limits_.max_orders_per_day) {
        return RiskDecision::reject("max orders per day reached");
    }

    if (ctx.state.last_execution_at) {
        Timestamp cooldown_end = *ctx.state.last_execution_at +
                                 static_cast<Timestamp>(limits_.cooldown_minutes) * util::MS_PER_MINUTE;
        if (ctx.now < cooldown_end &&
            !volatility_bypass(ctx.prev_close, ctx.last_close, limits_.cooldown_bypass_pct)) {
            return RiskDecision::reject("cooldown active");
        }
    }

    if (plan.side == Side::Sell && ctx.position <= 0) {
        if (trading_.long_only) {
            return RiskDecision{false, "long-only: no position to sell",
                                strategy::TradePlan::hold(plan.symbol, plan.strategy,
                                                          "long-only: no position to sell")};
        }
        return RiskDecision::reject("no position to sell");
    }

    strategy::TradePlan adjusted = plan;

    double max_position_size = limits_.capital * limits_.max_position_pct / plan.price;
    if (adjusted.side == Side::Buy && ctx.position + adjusted.size > max_position_size) {
        adjusted.size = std::max(max_position_size - ctx.position, 0.0);
    }

    double notional_cap = std::min(limits_.max_order_notional, limits_.max_loss_per_trade);
    if (adjusted.size * adjusted.price > notional_cap) {
        adjusted.size = notional_cap / adjusted.price;
    }

    // Truncation never grows the order
    adjusted.size = std::min(adjusted.size, plan.size);

    if (adjusted.size <= 0) {
        return RiskDecision::reject("size reduced to zero");
    }

    return RiskDecision{true, "ok", adjusted};
}

}  // namespace risk
}  // namespace tradegate
