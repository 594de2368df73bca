#pragma once

#include "../types.hpp"
#include "defaults.hpp"

#include <nlohmann/json.hpp>

#include <map>
#include <stdexcept>
#include <string>
#include <vector>

namespace tradegate {
namespace config {

using json = nlohmann::json;

// =============================================================================
// Sections
// =============================================================================

struct AppConfig {
    std::string name = app::NAME;
    std::string data_dir = app::DATA_DIR;
    std::string store_path;  // empty = <data_dir>/tradegate_store.json
    std::string log_level = app::LOG_LEVEL;
};

struct ExchangeConfig {
    std::string name = exchange::NAME;
    std::string api_key_env = exchange::API_KEY_ENV;
    std::string api_secret_env = exchange::API_SECRET_ENV;
    std::string base_url;  // empty = client default
    bool use_testnet = false;
};

struct MakerEmulationConfig {
    double buffer_bps = trading::MAKER_BUFFER_BPS;
    bool use_tick = true;
};

struct TradingConfig {
    TradingMode mode = TradingMode::Paper;
    bool dry_run = true;
    bool require_approval = true;
    std::string approval_phrase = trading::APPROVAL_PHRASE;
    std::string approval_phrase_hash;  // overrides approval_phrase when set
    bool kill_switch = false;
    bool i_understand_live_trading = false;
    bool long_only = true;
    std::vector<std::string> symbol_whitelist{trading::DEFAULT_SYMBOL};
    std::string base_currency = trading::BASE_CURRENCY;
    std::vector<std::string> timeframes{trading::DEFAULT_TIMEFRAME};
    int candle_limit = trading::CANDLE_LIMIT;
    int order_timeout_seconds = trading::ORDER_TIMEOUT_SECONDS;
    bool post_only = true;
    int intent_expiry_seconds = trading::INTENT_EXPIRY_SECONDS;
    MakerEmulationConfig maker_emulation;

    bool is_whitelisted(const std::string& symbol) const;
    const std::string& primary_timeframe() const;
};

struct RiskConfig {
    double capital = risk::CAPITAL;
    double max_position_pct = risk::MAX_POSITION_PCT;
    double max_order_notional = risk::MAX_ORDER_NOTIONAL;
    double max_loss_per_trade = risk::MAX_LOSS_PER_TRADE;
    double max_loss_per_day = risk::MAX_LOSS_PER_DAY;
    int max_orders_per_day = risk::MAX_ORDERS_PER_DAY;
    int cooldown_minutes = risk::COOLDOWN_MINUTES;
    double cooldown_bypass_pct = risk::COOLDOWN_BYPASS_PCT;
};

struct NewsConfig {
    int sentiment_lookback_hours = news::SENTIMENT_LOOKBACK_HOURS;
    int news_latency_seconds = news::NEWS_LATENCY_SECONDS;
    std::map<std::string, double> source_weights;

    double weight_for(const std::string& source) const;
};

struct BaselineStrategyConfig {
    int sma_period = strategy::SMA_PERIOD;
    int momentum_lookback = strategy::MOMENTUM_LOOKBACK;
    double base_position_pct = strategy::BASE_POSITION_PCT;
};

struct NewsOverlayConfig {
    double sentiment_boost_threshold = strategy::SENTIMENT_BOOST_THRESHOLD;
    double sentiment_cut_threshold = strategy::SENTIMENT_CUT_THRESHOLD;
    double boost_multiplier = strategy::BOOST_MULTIPLIER;
    double cut_multiplier = strategy::CUT_MULTIPLIER;
};

struct StrategiesConfig {
    BaselineStrategyConfig baseline;
    NewsOverlayConfig news_overlay;
};

struct PaperConfig {
    uint64_t seed = paper::SEED;
    double slippage_bps = paper::SLIPPAGE_BPS;
    double fee_bps = paper::FEE_BPS;
    double fill_probability = paper::FILL_PROBABILITY;
    double spread_bps = paper::SPREAD_BPS;
};

struct BacktestConfig {
    double maker_fee_bps = backtest::MAKER_FEE_BPS;
    double taker_fee_bps = backtest::TAKER_FEE_BPS;
    double slippage_bps = backtest::SLIPPAGE_BPS;
    bool assume_taker = true;
};

struct AutopilotConfig {
    bool enabled = false;
    double max_order_notional = autopilot::MAX_ORDER_NOTIONAL;
    double max_loss_per_trade = autopilot::MAX_LOSS_PER_TRADE;
    double min_confidence = autopilot::MIN_CONFIDENCE;
    std::vector<std::string> symbol_whitelist{trading::DEFAULT_SYMBOL};
};

struct RunnerConfig {
    int market_poll_seconds = runner::MARKET_POLL_SECONDS;
    int news_poll_seconds = runner::NEWS_POLL_SECONDS;
    int propose_poll_seconds = runner::PROPOSE_POLL_SECONDS;
    int propose_cooldown_seconds = runner::PROPOSE_COOLDOWN_SECONDS;
    bool orderbook = false;
    int jitter_seconds = runner::JITTER_SECONDS;
    int max_backoff_seconds = runner::MAX_BACKOFF_SECONDS;
    bool auto_execute = false;
};

/**
 * Full application settings
 */
struct Settings {
    AppConfig app;
    ExchangeConfig exchange;
    TradingConfig trading;
    RiskConfig risk;
    NewsConfig news;
    StrategiesConfig strategies;
    PaperConfig paper;
    BacktestConfig backtest;
    AutopilotConfig autopilot;
    RunnerConfig runner;

    // SHA-256 the approval gate compares against
    std::string approval_phrase_hash() const;
    std::string store_path() const;
    std::string runner_state_path() const;
};

// =============================================================================
// Validation
// =============================================================================

struct ConfigError {
    std::string field;
    std::string message;
    std::string suggestion;

    std::string to_string() const;
};

class ConfigValidationException : public std::runtime_error {
public:
    explicit ConfigValidationException(std::vector<ConfigError> errors);

    const std::vector<ConfigError>& errors() const { return errors_; }

private:
    std::vector<ConfigError> errors_;
};

// Exchange names make_market_client can build
const std::vector<std::string>& supported_exchanges();

std::vector<ConfigError> validate_settings(const Settings& settings);

// =============================================================================
// Loading
// =============================================================================

/**
 * Merge a JSON document over the compiled defaults. Absent keys keep their
 * defaults; a present key with the wrong type throws std::runtime_error naming it.
 */
Settings settings_from_json(const json& doc);

json settings_to_json(const Settings& settings);

/**
 * Load, merge and validate a config file.
 *
 * @throws std::runtime_error if the file cannot be read or parsed
 * @throws ConfigValidationException if validation fails
 */
Settings load_settings(const std::string& path);

}  // namespace config
}  // namespace tradegate
