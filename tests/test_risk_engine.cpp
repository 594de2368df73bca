/**
 * Risk Engine Test Suite
 *
 * Check order, size truncation, cooldown with volatility bypass,
 * long-only handling and daily limits.
 *
 * Run with: ./test_risk_engine
 */

#include <cassert>
#include <cmath>
#include <iostream>
#include <string>

#include "../include/tradegate/risk/risk_engine.hpp"
#include "../include/tradegate/util/time_utils.hpp"

using namespace tradegate;
using namespace tradegate::risk;
using tradegate::strategy::TradePlan;

#define TEST(name) void test_##name()
#define RUN_TEST(name) do { \
    std::cout << "  Running " #name "... "; \
    test_##name(); \
    std::cout << "PASSED\n"; \
} while(0)

#define ASSERT_DOUBLE_NEAR(a, b, tol) do { \
    if (std::abs((a) - (b)) > (tol)) { \
        std::cerr << "\nFAILED: " << #a << " != " << #b \
                  << " (" << (a) << " != " << (b) << ")\n"; \
        assert(false); \
    } \
} while(0)

#define ASSERT_REASON(decision, text) do { \
    if ((decision).reason != (text)) { \
        std::cerr << "\nFAILED: reason \"" << (decision).reason << "\" != \"" << (text) << "\"\n"; \
        assert(false); \
    } \
} while(0)

static const Timestamp NOON = 1704067200000 + 12 * util::MS_PER_HOUR;

config::RiskConfig test_limits() {
    config::RiskConfig limits;
    limits.capital = 100000;
    limits.max_position_pct = 0.5;
    limits.max_order_notional = 4000;
    limits.max_loss_per_trade = 5000;
    limits.max_loss_per_day = 2000;
    limits.max_orders_per_day = 3;
    limits.cooldown_minutes = 5;
    limits.cooldown_bypass_pct = 0.02;
    return limits;
}

config::TradingConfig test_trading() {
    config::TradingConfig trading;
    trading.symbol_whitelist = {"BTC/USDT"};
    trading.long_only = true;
    return trading;
}

TradePlan buy(double size, double price) {
    TradePlan plan;
    plan.symbol = "BTC/USDT";
    plan.side = Side::Buy;
    plan.size = size;
    plan.price = price;
    plan.confidence = 0.55;
    plan.strategy = "baseline";
    return plan;
}

TradePlan sell(double size, double price) {
    TradePlan plan = buy(size, price);
    plan.side = Side::Sell;
    return plan;
}

RiskContext clean_context() {
    RiskContext ctx;
    ctx.state = RiskState::fresh_for_day(util::utc_day(NOON));
    ctx.now = NOON;
    return ctx;
}

// ============================================================================
// Basic gates
// ============================================================================

TEST(hold_is_no_trade) {
    RiskEngine engine(test_limits(), test_trading());
    auto decision = engine.evaluate(TradePlan::hold("BTC/USDT", "baseline", "flat"), clean_context());
    assert(!decision.approved);
    ASSERT_REASON(decision, "no trade");
    assert(decision.plan.has_value());
    assert(decision.plan->is_hold());
}

TEST(kill_switch_blocks_everything) {
    auto trading = test_trading();
    trading.kill_switch = true;
    RiskEngine engine(test_limits(), trading);
    auto decision = engine.evaluate(buy(0.01, 1000), clean_context());
    assert(!decision.approved);
    ASSERT_REASON(decision, "kill switch enabled");
    assert(!decision.plan.has_value());
}

TEST(symbol_not_whitelisted) {
    RiskEngine engine(test_limits(), test_trading());
    TradePlan plan = buy(0.01, 1000);
    plan.symbol = "ETH/USDT";
    ASSERT_REASON(engine.evaluate(plan, clean_context()), "symbol not whitelisted");
}

TEST(invalid_size_or_price) {
    RiskEngine engine(test_limits(), test_trading());
    ASSERT_REASON(engine.evaluate(buy(0, 1000), clean_context()), "invalid size or price");
    ASSERT_REASON(engine.evaluate(buy(1, 0), clean_context()), "invalid size or price");
    ASSERT_REASON(engine.evaluate(buy(-1, 1000), clean_context()), "invalid size or price");
}

TEST(kill_switch_checked_before_whitelist) {
    auto trading = test_trading();
    trading.kill_switch = true;
    RiskEngine engine(test_limits(), trading);
    TradePlan plan = buy(0, 0);
    plan.symbol = "DOGE/USDT";
    ASSERT_REASON(engine.evaluate(plan, clean_context()), "kill switch enabled");
}

// ============================================================================
// Sizing
// ============================================================================

TEST(notional_cap_truncates_size) {
    RiskEngine engine(test_limits(), test_trading());
    auto decision = engine.evaluate(buy(10, 1000), clean_context());
    assert(decision.approved);
    ASSERT_REASON(decision, "ok");
    ASSERT_DOUBLE_NEAR(decision.plan->size, 4.0, 1e-12);
    ASSERT_DOUBLE_NEAR(decision.plan->price, 1000.0, 1e-12);
}

TEST(notional_cap_uses_smaller_of_two_limits) {
    auto limits = test_limits();
    limits.max_order_notional = 50000;
    limits.max_loss_per_trade = 2500;
    RiskEngine engine(limits, test_trading());
    auto decision = engine.evaluate(buy(10, 1000), clean_context());
    assert(decision.approved);
    ASSERT_DOUBLE_NEAR(decision.plan->size, 2.5, 1e-12);
}

TEST(position_cap_limits_buy) {
    auto limits = test_limits();
    limits.max_order_notional = 1e9;
    limits.max_loss_per_trade = 1e9;
    RiskEngine engine(limits, test_trading());

    RiskContext ctx = clean_context();
    ctx.position = 45;  // cap = 100000 * 0.5 / 1000 = 50
    auto decision = engine.evaluate(buy(10, 1000), ctx);
    assert(decision.approved);
    ASSERT_DOUBLE_NEAR(decision.plan->size, 5.0, 1e-9);
}

TEST(position_at_cap_reduces_to_zero) {
    auto limits = test_limits();
    limits.max_order_notional = 1e9;
    limits.max_loss_per_trade = 1e9;
    RiskEngine engine(limits, test_trading());

    RiskContext ctx = clean_context();
    ctx.position = 50;
    auto decision = engine.evaluate(buy(1, 1000), ctx);
    assert(!decision.approved);
    ASSERT_REASON(decision, "size reduced to zero");
}

TEST(size_never_grows) {
    RiskEngine engine(test_limits(), test_trading());
    double sizes[] = {0.001, 0.5, 3.9, 4.0, 4.1, 100.0};
    for (double size : sizes) {
        auto decision = engine.evaluate(buy(size, 1000), clean_context());
        assert(decision.approved);
        assert(decision.plan->size <= size + 1e-12);
    }
}

TEST(evaluate_is_deterministic) {
    RiskEngine engine(test_limits(), test_trading());
    RiskContext ctx = clean_context();
    auto a = engine.evaluate(buy(10, 1000), ctx);
    auto b = engine.evaluate(buy(10, 1000), ctx);
    assert(a.approved == b.approved);
    assert(a.reason == b.reason);
    assert(a.plan->size == b.plan->size);
}

// ============================================================================
// Daily limits
// ============================================================================

TEST(daily_loss_limit_reached) {
    RiskEngine engine(test_limits(), test_trading());
    RiskContext ctx = clean_context();
    ctx.state.realized_pnl = -1500;
    ctx.state.unrealized_pnl = -500;
    ASSERT_REASON(engine.evaluate(buy(1, 1000), ctx), "daily loss limit reached");
}

TEST(unrealized_gain_does_not_offset_loss) {
    RiskEngine engine(test_limits(), test_trading());
    RiskContext ctx = clean_context();
    ctx.state.realized_pnl = -2000;
    ctx.state.unrealized_pnl = 5000;
    ASSERT_REASON(engine.evaluate(buy(1, 1000), ctx), "daily loss limit reached");
}

TEST(max_orders_per_day) {
    RiskEngine engine(test_limits(), test_trading());
    RiskContext ctx = clean_context();
    ctx.state.executions_today = 3;
    ASSERT_REASON(engine.evaluate(buy(1, 1000), ctx), "max orders per day reached");
}

TEST(state_from_storage_marks_open_position) {
    RiskSnapshot snap;
    snap.position = 2;
    snap.avg_cost = 1000;
    snap.realized_pnl = -100;
    snap.executions_today = 1;
    RiskState state = RiskState::from_storage_snapshot(snap, 900, "2024-01-01");
    ASSERT_DOUBLE_NEAR(state.unrealized_pnl, -200.0, 1e-12);
    ASSERT_DOUBLE_NEAR(state.daily_loss_basis(), -300.0, 1e-12);
    assert(state.executions_today == 1);
}

// ============================================================================
// Cooldown
// ============================================================================

TEST(cooldown_blocks_recent_execution) {
    RiskEngine engine(test_limits(), test_trading());
    RiskContext ctx = clean_context();
    ctx.state.last_execution_at = NOON - 2 * util::MS_PER_MINUTE;
    ctx.prev_close = 1000;
    ctx.last_close = 1010;  // 1% move, below bypass
    ASSERT_REASON(engine.evaluate(buy(1, 1000), ctx), "cooldown active");
}

TEST(cooldown_bypassed_by_large_move) {
    RiskEngine engine(test_limits(), test_trading());
    RiskContext ctx = clean_context();
    ctx.state.last_execution_at = NOON - 2 * util::MS_PER_MINUTE;
    ctx.prev_close = 1000;
    ctx.last_close = 975;  // 2.5% drop
    auto decision = engine.evaluate(buy(1, 1000), ctx);
    assert(decision.approved);
}

TEST(cooldown_expires) {
    RiskEngine engine(test_limits(), test_trading());
    RiskContext ctx = clean_context();
    ctx.state.last_execution_at = NOON - 5 * util::MS_PER_MINUTE;
    assert(engine.evaluate(buy(1, 1000), ctx).approved);
}

TEST(no_previous_execution_no_cooldown) {
    RiskEngine engine(test_limits(), test_trading());
    RiskContext ctx = clean_context();
    ctx.prev_close = 1000;
    ctx.last_close = 1000;
    assert(engine.evaluate(buy(1, 1000), ctx).approved);
}

TEST(volatility_bypass_edges) {
    assert(RiskEngine::volatility_bypass(100.0, 102.0, 0.02));
    assert(!RiskEngine::volatility_bypass(100.0, 101.9, 0.02));
    assert(!RiskEngine::volatility_bypass(std::nullopt, 102.0, 0.02));
    assert(!RiskEngine::volatility_bypass(100.0, 150.0, 0.0));
    assert(!RiskEngine::volatility_bypass(0.0, 150.0, 0.02));
}

// ============================================================================
// Long-only
// ============================================================================

TEST(long_only_sell_without_position_becomes_hold) {
    RiskEngine engine(test_limits(), test_trading());
    auto decision = engine.evaluate(sell(1, 1000), clean_context());
    assert(!decision.approved);
    ASSERT_REASON(decision, "long-only: no position to sell");
    assert(decision.plan.has_value());
    assert(decision.plan->is_hold());
    assert(decision.plan->size == 0);
}

TEST(short_allowed_still_rejects_naked_sell) {
    auto trading = test_trading();
    trading.long_only = false;
    RiskEngine engine(test_limits(), trading);
    auto decision = engine.evaluate(sell(1, 1000), clean_context());
    assert(!decision.approved);
    ASSERT_REASON(decision, "no position to sell");
    assert(!decision.plan.has_value());
}

TEST(sell_with_position_is_capped_by_notional) {
    RiskEngine engine(test_limits(), test_trading());
    RiskContext ctx = clean_context();
    ctx.position = 10;
    auto decision = engine.evaluate(sell(10, 1000), ctx);
    assert(decision.approved);
    ASSERT_DOUBLE_NEAR(decision.plan->size, 4.0, 1e-12);
}

int main() {
    std::cout << "\n=== Risk Engine Tests ===\n\n";

    std::cout << "Basic Gates:\n";
    RUN_TEST(hold_is_no_trade);
    RUN_TEST(kill_switch_blocks_everything);
    RUN_TEST(symbol_not_whitelisted);
    RUN_TEST(invalid_size_or_price);
    RUN_TEST(kill_switch_checked_before_whitelist);

    std::cout << "\nSizing:\n";
    RUN_TEST(notional_cap_truncates_size);
    RUN_TEST(notional_cap_uses_smaller_of_two_limits);
    RUN_TEST(position_cap_limits_buy);
    RUN_TEST(position_at_cap_reduces_to_zero);
    RUN_TEST(size_never_grows);
    RUN_TEST(evaluate_is_deterministic);

    std::cout << "\nDaily Limits:\n";
    RUN_TEST(daily_loss_limit_reached);
    RUN_TEST(unrealized_gain_does_not_offset_loss);
    RUN_TEST(max_orders_per_day);
    RUN_TEST(state_from_storage_marks_open_position);

    std::cout << "\nCooldown:\n";
    RUN_TEST(cooldown_blocks_recent_execution);
    RUN_TEST(cooldown_bypassed_by_large_move);
    RUN_TEST(cooldown_expires);
    RUN_TEST(no_previous_execution_no_cooldown);
    RUN_TEST(volatility_bypass_edges);

    std::cout << "\nLong-only:\n";
    RUN_TEST(long_only_sell_without_position_becomes_hold);
    RUN_TEST(short_allowed_still_rejects_naked_sell);
    RUN_TEST(sell_with_position_is_capped_by_notional);

    std::cout << "\n=== All tests PASSED! ===\n\n";
    return 0;
}
