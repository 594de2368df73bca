#pragma once

#include <cstdint>

/**
 * Centralized configuration defaults.
 *
 * Values are organized by config section and use consistent naming:
 * - _PCT suffix: percentage as decimal (0.02 = 2%)
 * - _BPS suffix: basis points (100 bps = 1%)
 * - _SECONDS / _MINUTES / _HOURS: durations
 */

namespace tradegate::config {

// =============================================================================
// App
// =============================================================================
namespace app {
constexpr const char* NAME = "tradegate";
constexpr const char* DATA_DIR = "data";
constexpr const char* STORE_FILE = "tradegate_store.json";
constexpr const char* RUNNER_STATE_FILE = "runner_state.json";
constexpr const char* LOG_LEVEL = "info";
} // namespace app

// =============================================================================
// Exchange
// =============================================================================
namespace exchange {
constexpr const char* NAME = "binance";
constexpr const char* API_KEY_ENV = "EXCHANGE_API_KEY";
constexpr const char* API_SECRET_ENV = "EXCHANGE_API_SECRET";
} // namespace exchange

// =============================================================================
// Trading rules
// =============================================================================
namespace trading {
constexpr const char* APPROVAL_PHRASE = "I APPROVE";
constexpr const char* BASE_CURRENCY = "USDT";
constexpr const char* DEFAULT_SYMBOL = "BTC/USDT";
constexpr const char* DEFAULT_TIMEFRAME = "1m";
constexpr int CANDLE_LIMIT = 500;
constexpr int ORDER_TIMEOUT_SECONDS = 30;
constexpr int INTENT_EXPIRY_SECONDS = 900;
constexpr double MAKER_BUFFER_BPS = 0.1;
} // namespace trading

// =============================================================================
// Risk limits (quote currency)
// =============================================================================
namespace risk {
constexpr double CAPITAL = 500000.0;
constexpr double MAX_POSITION_PCT = 0.2;
constexpr double MAX_ORDER_NOTIONAL = 50000.0;
constexpr double MAX_LOSS_PER_TRADE = 5000.0;
constexpr double MAX_LOSS_PER_DAY = 15000.0;
constexpr int MAX_ORDERS_PER_DAY = 5;
constexpr int COOLDOWN_MINUTES = 5;
constexpr double COOLDOWN_BYPASS_PCT = 0.02;
} // namespace risk

// =============================================================================
// News features
// =============================================================================
namespace news {
constexpr int SENTIMENT_LOOKBACK_HOURS = 12;
constexpr int NEWS_LATENCY_SECONDS = 600;
constexpr double DEFAULT_SOURCE_WEIGHT = 1.0;
} // namespace news

// =============================================================================
// Reference strategies
// =============================================================================
namespace strategy {
constexpr int SMA_PERIOD = 20;
constexpr int MOMENTUM_LOOKBACK = 10;
constexpr double BASE_POSITION_PCT = 0.1;
constexpr double BASELINE_CONFIDENCE = 0.55;

constexpr double SENTIMENT_BOOST_THRESHOLD = 0.2;
constexpr double SENTIMENT_CUT_THRESHOLD = -0.2;
constexpr double BOOST_MULTIPLIER = 1.3;
constexpr double CUT_MULTIPLIER = 0.5;
} // namespace strategy

// =============================================================================
// Paper fills
// =============================================================================
namespace paper {
constexpr uint64_t SEED = 42;
constexpr double SLIPPAGE_BPS = 5.0;
constexpr double FEE_BPS = 10.0;
constexpr double FILL_PROBABILITY = 0.7;
constexpr double SPREAD_BPS = 2.0;
} // namespace paper

// =============================================================================
// Backtest costs
// =============================================================================
namespace backtest {
constexpr double MAKER_FEE_BPS = 5.0;
constexpr double TAKER_FEE_BPS = 10.0;
constexpr double SLIPPAGE_BPS = 5.0;
} // namespace backtest

// =============================================================================
// Autopilot (approval bypass for small, confident orders)
// =============================================================================
namespace autopilot {
constexpr double MAX_ORDER_NOTIONAL = 10000.0;
constexpr double MAX_LOSS_PER_TRADE = 2000.0;
constexpr double MIN_CONFIDENCE = 0.6;
} // namespace autopilot

// =============================================================================
// Runner schedules
// =============================================================================
namespace runner {
constexpr int MARKET_POLL_SECONDS = 30;
constexpr int NEWS_POLL_SECONDS = 120;
constexpr int PROPOSE_POLL_SECONDS = 60;
constexpr int PROPOSE_COOLDOWN_SECONDS = 300;
constexpr int JITTER_SECONDS = 2;
constexpr int MAX_BACKOFF_SECONDS = 300;
} // namespace runner

} // namespace tradegate::config
