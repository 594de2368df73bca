#include "../../include/tradegate/config/settings.hpp"
#include "../../include/tradegate/util/crypto.hpp"

#include <algorithm>
#include <fstream>
#include <sstream>

namespace tradegate {
namespace config {

namespace {

template <typename T>
void read(const json& section, const std::string& section_name, const char* key, T& out) {
    if (!section.is_object() || !section.contains(key) || section[key].is_null())
        return;
    try {
        out = section[key].get<T>();
    } catch (const json::exception& e) {
        throw std::runtime_error("config: " + section_name + "." + key + ": " + e.what());
    }
}

const json& section_of(const json& doc, const char* name) {
    static const json empty = json::object();
    if (doc.is_object() && doc.contains(name)) {
        const json& s = doc[name];
        if (!s.is_object())
            throw std::runtime_error(std::string("config: section '") + name + "' must be an object");
        return s;
    }
    return empty;
}

bool is_symbol_pair(const std::string& symbol) {
    auto slash = symbol.find('/');
    return slash != std::string::npos && slash > 0 && slash + 1 < symbol.size() &&
           symbol.find('/', slash + 1) == std::string::npos;
}

}  // namespace

// =============================================================================
// Section helpers
// =============================================================================

bool TradingConfig::is_whitelisted(const std::string& symbol) const {
    return std::find(symbol_whitelist.begin(), symbol_whitelist.end(), symbol) != symbol_whitelist.end();
}

const std::string& TradingConfig::primary_timeframe() const {
    static const std::string fallback = trading::DEFAULT_TIMEFRAME;
    return timeframes.empty() ? fallback : timeframes.front();
}

double NewsConfig::weight_for(const std::string& source) const {
    auto it = source_weights.find(source);
    return it == source_weights.end() ? news::DEFAULT_SOURCE_WEIGHT : it->second;
}

std::string Settings::approval_phrase_hash() const {
    if (!trading.approval_phrase_hash.empty())
        return trading.approval_phrase_hash;
    return util::sha256_hex(trading.approval_phrase);
}

std::string Settings::store_path() const {
    if (!app.store_path.empty())
        return app.store_path;
    return app.data_dir + "/" + app::STORE_FILE;
}

std::string Settings::runner_state_path() const {
    return app.data_dir + "/" + app::RUNNER_STATE_FILE;
}

// =============================================================================
// Validation
// =============================================================================

std::string ConfigError::to_string() const {
    std::string out = field + ": " + message;
    if (!suggestion.empty())
        out += " (" + suggestion + ")";
    return out;
}

namespace {

std::string join_errors(const std::vector<ConfigError>& errors) {
    std::ostringstream ss;
    ss << "invalid configuration:";
    for (const auto& e : errors)
        ss << "\n  - " << e.to_string();
    return ss.str();
}

}  // namespace

ConfigValidationException::ConfigValidationException(std::vector<ConfigError> errors)
    : std::runtime_error(join_errors(errors)), errors_(std::move(errors)) {}

const std::vector<std::string>& supported_exchanges() {
    static const std::vector<std::string> names = {"binance"};
    return names;
}

std::vector<ConfigError> validate_settings(const Settings& s) {
    std::vector<ConfigError> errors;
    auto add = [&errors](std::string field, std::string message, std::string suggestion = "") {
        errors.push_back(ConfigError{std::move(field), std::move(message), std::move(suggestion)});
    };

    const auto& names = supported_exchanges();
    if (s.exchange.name.empty()) {
        add("exchange.name", "exchange name is required", "set exchange.name to \"binance\"");
    } else if (std::find(names.begin(), names.end(), s.exchange.name) == names.end()) {
        add("exchange.name", "unsupported exchange '" + s.exchange.name + "'", "supported: binance");
    }

    if (s.trading.symbol_whitelist.empty())
        add("trading.symbol_whitelist", "at least one symbol is required", "e.g. [\"BTC/USDT\"]");
    for (const auto& symbol : s.trading.symbol_whitelist) {
        if (!is_symbol_pair(symbol))
            add("trading.symbol_whitelist", "symbol '" + symbol + "' is not in BASE/QUOTE form", "e.g. BTC/USDT");
    }
    for (const auto& symbol : s.autopilot.symbol_whitelist) {
        if (!is_symbol_pair(symbol))
            add("autopilot.symbol_whitelist", "symbol '" + symbol + "' is not in BASE/QUOTE form", "e.g. BTC/USDT");
    }
    if (s.trading.timeframes.empty())
        add("trading.timeframes", "at least one timeframe is required", "e.g. [\"1m\"]");
    if (s.trading.candle_limit <= 0)
        add("trading.candle_limit", "must be positive");
    if (s.trading.order_timeout_seconds <= 0)
        add("trading.order_timeout_seconds", "must be positive");
    if (s.trading.intent_expiry_seconds <= 0)
        add("trading.intent_expiry_seconds", "must be positive");
    if (s.trading.approval_phrase.empty() && s.trading.approval_phrase_hash.empty())
        add("trading.approval_phrase", "an approval phrase or phrase hash is required");

    if (s.risk.capital <= 0)
        add("risk.capital", "must be positive");
    if (s.risk.max_order_notional > s.risk.capital)
        add("risk.max_order_notional", "exceeds risk.capital", "lower max_order_notional or raise capital");
    if (s.risk.max_position_pct < 0 || s.risk.max_position_pct > 1)
        add("risk.max_position_pct", "must be within [0, 1]");
    if (s.risk.max_orders_per_day < 0)
        add("risk.max_orders_per_day", "must not be negative");
    if (s.risk.cooldown_minutes < 0)
        add("risk.cooldown_minutes", "must not be negative");

    if (s.paper.fill_probability < 0 || s.paper.fill_probability > 1)
        add("paper.fill_probability", "must be within [0, 1]");
    if (s.autopilot.min_confidence < 0 || s.autopilot.min_confidence > 1)
        add("autopilot.min_confidence", "must be within [0, 1]");

    if (s.runner.market_poll_seconds <= 0)
        add("runner.market_poll_seconds", "must be positive");
    if (s.runner.news_poll_seconds <= 0)
        add("runner.news_poll_seconds", "must be positive");
    if (s.runner.propose_poll_seconds <= 0)
        add("runner.propose_poll_seconds", "must be positive");
    if (s.runner.jitter_seconds < 0)
        add("runner.jitter_seconds", "must not be negative");
    if (s.runner.max_backoff_seconds < 1)
        add("runner.max_backoff_seconds", "must be at least 1");

    return errors;
}

// =============================================================================
// JSON mapping
// =============================================================================

Settings settings_from_json(const json& doc) {
    if (!doc.is_object())
        throw std::runtime_error("config: top-level value must be an object");

    Settings s;

    const json& a = section_of(doc, "app");
    read(a, "app", "name", s.app.name);
    read(a, "app", "data_dir", s.app.data_dir);
    read(a, "app", "store_path", s.app.store_path);
    read(a, "app", "log_level", s.app.log_level);

    const json& e = section_of(doc, "exchange");
    read(e, "exchange", "name", s.exchange.name);
    read(e, "exchange", "api_key_env", s.exchange.api_key_env);
    read(e, "exchange", "api_secret_env", s.exchange.api_secret_env);
    read(e, "exchange", "base_url", s.exchange.base_url);
    read(e, "exchange", "use_testnet", s.exchange.use_testnet);

    const json& t = section_of(doc, "trading");
    std::string mode = mode_to_string(s.trading.mode);
    read(t, "trading", "mode", mode);
    auto parsed_mode = parse_mode(mode);
    if (!parsed_mode)
        throw ConfigValidationException({ConfigError{"trading.mode", "unknown mode '" + mode + "'", "paper or live"}});
    s.trading.mode = *parsed_mode;
    read(t, "trading", "dry_run", s.trading.dry_run);
    read(t, "trading", "require_approval", s.trading.require_approval);
    read(t, "trading", "approval_phrase", s.trading.approval_phrase);
    read(t, "trading", "approval_phrase_hash", s.trading.approval_phrase_hash);
    read(t, "trading", "kill_switch", s.trading.kill_switch);
    read(t, "trading", "i_understand_live_trading", s.trading.i_understand_live_trading);
    read(t, "trading", "long_only", s.trading.long_only);
    read(t, "trading", "symbol_whitelist", s.trading.symbol_whitelist);
    read(t, "trading", "base_currency", s.trading.base_currency);
    read(t, "trading", "timeframes", s.trading.timeframes);
    read(t, "trading", "candle_limit", s.trading.candle_limit);
    read(t, "trading", "order_timeout_seconds", s.trading.order_timeout_seconds);
    read(t, "trading", "post_only", s.trading.post_only);
    read(t, "trading", "intent_expiry_seconds", s.trading.intent_expiry_seconds);
    if (t.contains("maker_emulation")) {
        const json& m = t["maker_emulation"];
        read(m, "trading.maker_emulation", "buffer_bps", s.trading.maker_emulation.buffer_bps);
        read(m, "trading.maker_emulation", "use_tick", s.trading.maker_emulation.use_tick);
    }

    const json& r = section_of(doc, "risk");
    read(r, "risk", "capital", s.risk.capital);
    read(r, "risk", "max_position_pct", s.risk.max_position_pct);
    read(r, "risk", "max_order_notional", s.risk.max_order_notional);
    read(r, "risk", "max_loss_per_trade", s.risk.max_loss_per_trade);
    read(r, "risk", "max_loss_per_day", s.risk.max_loss_per_day);
    read(r, "risk", "max_orders_per_day", s.risk.max_orders_per_day);
    read(r, "risk", "cooldown_minutes", s.risk.cooldown_minutes);
    read(r, "risk", "cooldown_bypass_pct", s.risk.cooldown_bypass_pct);

    const json& n = section_of(doc, "news");
    read(n, "news", "sentiment_lookback_hours", s.news.sentiment_lookback_hours);
    read(n, "news", "news_latency_seconds", s.news.news_latency_seconds);
    read(n, "news", "source_weights", s.news.source_weights);

    const json& st = section_of(doc, "strategies");
    if (st.contains("baseline")) {
        const json& b = st["baseline"];
        read(b, "strategies.baseline", "sma_period", s.strategies.baseline.sma_period);
        read(b, "strategies.baseline", "momentum_lookback", s.strategies.baseline.momentum_lookback);
        read(b, "strategies.baseline", "base_position_pct", s.strategies.baseline.base_position_pct);
    }
    if (st.contains("news_overlay")) {
        const json& o = st["news_overlay"];
        read(o, "strategies.news_overlay", "sentiment_boost_threshold",
             s.strategies.news_overlay.sentiment_boost_threshold);
        read(o, "strategies.news_overlay", "sentiment_cut_threshold",
             s.strategies.news_overlay.sentiment_cut_threshold);
        read(o, "strategies.news_overlay", "boost_multiplier", s.strategies.news_overlay.boost_multiplier);
        read(o, "strategies.news_overlay", "cut_multiplier", s.strategies.news_overlay.cut_multiplier);
    }

    const json& p = section_of(doc, "paper");
    read(p, "paper", "seed", s.paper.seed);
    read(p, "paper", "slippage_bps", s.paper.slippage_bps);
    read(p, "paper", "fee_bps", s.paper.fee_bps);
    read(p, "paper", "fill_probability", s.paper.fill_probability);
    read(p, "paper", "spread_bps", s.paper.spread_bps);

    const json& bt = section_of(doc, "backtest");
    read(bt, "backtest", "maker_fee_bps", s.backtest.maker_fee_bps);
    read(bt, "backtest", "taker_fee_bps", s.backtest.taker_fee_bps);
    read(bt, "backtest", "slippage_bps", s.backtest.slippage_bps);
    read(bt, "backtest", "assume_taker", s.backtest.assume_taker);

    const json& ap = section_of(doc, "autopilot");
    read(ap, "autopilot", "enabled", s.autopilot.enabled);
    read(ap, "autopilot", "max_order_notional", s.autopilot.max_order_notional);
    read(ap, "autopilot", "max_loss_per_trade", s.autopilot.max_loss_per_trade);
    read(ap, "autopilot", "min_confidence", s.autopilot.min_confidence);
    read(ap, "autopilot", "symbol_whitelist", s.autopilot.symbol_whitelist);

    const json& rn = section_of(doc, "runner");
    read(rn, "runner", "market_poll_seconds", s.runner.market_poll_seconds);
    read(rn, "runner", "news_poll_seconds", s.runner.news_poll_seconds);
    read(rn, "runner", "propose_poll_seconds", s.runner.propose_poll_seconds);
    read(rn, "runner", "propose_cooldown_seconds", s.runner.propose_cooldown_seconds);
    read(rn, "runner", "orderbook", s.runner.orderbook);
    read(rn, "runner", "jitter_seconds", s.runner.jitter_seconds);
    read(rn, "runner", "max_backoff_seconds", s.runner.max_backoff_seconds);
    read(rn, "runner", "auto_execute", s.runner.auto_execute);

    return s;
}

json settings_to_json(const Settings& s) {
    json doc;
    doc["app"] = {{"name", s.app.name},
                  {"data_dir", s.app.data_dir},
                  {"store_path", s.app.store_path},
                  {"log_level", s.app.log_level}};
    doc["exchange"] = {{"name", s.exchange.name},
                       {"api_key_env", s.exchange.api_key_env},
                       {"api_secret_env", s.exchange.api_secret_env},
                       {"base_url", s.exchange.base_url},
                       {"use_testnet", s.exchange.use_testnet}};
    doc["trading"] = {{"mode", mode_to_string(s.trading.mode)},
                      {"dry_run", s.trading.dry_run},
                      {"require_approval", s.trading.require_approval},
                      {"approval_phrase", s.trading.approval_phrase},
                      {"approval_phrase_hash", s.trading.approval_phrase_hash},
                      {"kill_switch", s.trading.kill_switch},
                      {"i_understand_live_trading", s.trading.i_understand_live_trading},
                      {"long_only", s.trading.long_only},
                      {"symbol_whitelist", s.trading.symbol_whitelist},
                      {"base_currency", s.trading.base_currency},
                      {"timeframes", s.trading.timeframes},
                      {"candle_limit", s.trading.candle_limit},
                      {"order_timeout_seconds", s.trading.order_timeout_seconds},
                      {"post_only", s.trading.post_only},
                      {"intent_expiry_seconds", s.trading.intent_expiry_seconds},
                      {"maker_emulation",
                       {{"buffer_bps", s.trading.maker_emulation.buffer_bps},
                        {"use_tick", s.trading.maker_emulation.use_tick}}}};
    doc["risk"] = {{"capital", s.risk.capital},
                   {"max_position_pct", s.risk.max_position_pct},
                   {"max_order_notional", s.risk.max_order_notional},
                   {"max_loss_per_trade", s.risk.max_loss_per_trade},
                   {"max_loss_per_day", s.risk.max_loss_per_day},
                   {"max_orders_per_day", s.risk.max_orders_per_day},
                   {"cooldown_minutes", s.risk.cooldown_minutes},
                   {"cooldown_bypass_pct", s.risk.cooldown_bypass_pct}};
    doc["news"] = {{"sentiment_lookback_hours", s.news.sentiment_lookback_hours},
                   {"news_latency_seconds", s.news.news_latency_seconds},
                   {"source_weights", s.news.source_weights}};
    doc["strategies"] = {
        {"baseline",
         {{"sma_period", s.strategies.baseline.sma_period},
          {"momentum_lookback", s.strategies.baseline.momentum_lookback},
          {"base_position_pct", s.strategies.baseline.base_position_pct}}},
        {"news_overlay",
         {{"sentiment_boost_threshold", s.strategies.news_overlay.sentiment_boost_threshold},
          {"sentiment_cut_threshold", s.strategies.news_overlay.sentiment_cut_threshold},
          {"boost_multiplier", s.strategies.news_overlay.boost_multiplier},
          {"cut_multiplier", s.strategies.news_overlay.cut_multiplier}}}};
    doc["paper"] = {{"seed", s.paper.seed},
                    {"slippage_bps", s.paper.slippage_bps},
                    {"fee_bps", s.paper.fee_bps},
                    {"fill_probability", s.paper.fill_probability},
                    {"spread_bps", s.paper.spread_bps}};
    doc["backtest"] = {{"maker_fee_bps", s.backtest.maker_fee_bps},
                       {"taker_fee_bps", s.backtest.taker_fee_bps},
                       {"slippage_bps", s.backtest.slippage_bps},
                       {"assume_taker", s.backtest.assume_taker}};
    doc["autopilot"] = {{"enabled", s.autopilot.enabled},
                        {"max_order_notional", s.autopilot.max_order_notional},
                        {"max_loss_per_trade", s.autopilot.max_loss_per_trade},
                        {"min_confidence", s.autopilot.min_confidence},
                        {"symbol_whitelist", s.autopilot.symbol_whitelist}};
    doc["runner"] = {{"market_poll_seconds", s.runner.market_poll_seconds},
                     {"news_poll_seconds", s.runner.news_poll_seconds},
                     {"propose_poll_seconds", s.runner.propose_poll_seconds},
                     {"propose_cooldown_seconds", s.runner.propose_cooldown_seconds},
                     {"orderbook", s.runner.orderbook},
                     {"jitter_seconds", s.runner.jitter_seconds},
                     {"max_backoff_seconds", s.runner.max_backoff_seconds},
                     {"auto_execute", s.runner.auto_execute}};
    return doc;
}

Settings load_settings(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw std::runtime_error("Cannot open config file: " + path);
    }

    json doc;
    try {
        file >> doc;
    } catch (const json::parse_error& e) {
        throw std::runtime_error("Cannot parse config file " + path + ": " + e.what());
    }

    Settings settings = settings_from_json(doc);
    auto errors = validate_settings(settings);
    if (!errors.empty()) {
        throw ConfigValidationException(std::move(errors));
    }
    return settings;
}

}  // namespace config
}  // namespace tradegate
