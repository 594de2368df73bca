#pragma once

#include "../config/settings.hpp"
#include "../intent/order_intent.hpp"
#include "../market/market_data.hpp"

#include <random>
#include <string>

namespace tradegate {
namespace execution {

/**
 * Outcome of one simulated fill attempt
 */
struct PaperFill {
    bool filled = false;
    double price = 0;
    double size = 0;
    double fee = 0;
    IntentStatus status = IntentStatus::Open;
    std::string message;
};

/**
 * Synthetic top of book: last price +/- half the spread
 */
market::OrderbookTop estimate_orderbook_from_price(double price, double spread_bps, Timestamp ts);

/**
 * PaperFillModel - limit order fill simulation
 *
 * A marketable limit fills immediately at the touch plus slippage, capped at
 * the limit. A resting limit fills at its own price with probability
 * fill_probability. The generator is seeded once and advances across calls,
 * so one model gives a reproducible sequence for a given seed.
 */
class PaperFillModel {
public:
    explicit PaperFillModel(const config::PaperConfig& config) : config_(config), rng_(config.seed) {}

    PaperFill simulate(const intent::OrderIntent& intent, const market::OrderbookTop& book);

    const config::PaperConfig& config() const { return config_; }

private:
    config::PaperConfig config_;
    std::mt19937_64 rng_;
    std::uniform_real_distribution<double> uniform_{0.0, 1.0};
};

}  // namespace execution
}  // namespace tradegate
