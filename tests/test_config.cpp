/**
 * Settings and Validation Test Suite
 *
 * Run with: ./test_config
 */

#include <cassert>
#include <cmath>
#include <cstdio>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

#include "../include/tradegate/config/settings.hpp"
#include "../include/tradegate/util/crypto.hpp"

using namespace tradegate;
using namespace tradegate::config;

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

#define ASSERT_HAS_ERROR(errors, f, msg) do { \
    if (!has_error(errors, f, msg)) { \
        std::cerr << "\nFAILED: missing error " << f << ": " << msg << "\n"; \
        for (const auto& e : errors) std::cerr << "  got " << e.to_string() << "\n"; \
        assert(false); \
    } \
} while(0)

static const char* CONFIG_PATH = "/tmp/tradegate_test_config.json";

bool has_error(const std::vector<ConfigError>& errors, const std::string& field, const std::string& message) {
    for (const auto& e : errors) {
        if (e.field == field && e.message == message)
            return true;
    }
    return false;
}

void write_file(const std::string& path, const std::string& content) {
    std::ofstream out(path);
    out << content;
}

// ============================================================================
// Defaults
// ============================================================================

TEST(defaults_validate_clean) {
    Settings s;
    auto errors = validate_settings(s);
    assert(errors.empty());
}

TEST(default_values) {
    Settings s;
    assert(s.trading.mode == TradingMode::Paper);
    assert(s.trading.dry_run);
    assert(s.trading.require_approval);
    assert(!s.trading.kill_switch);
    assert(s.trading.approval_phrase == "I APPROVE");
    assert(s.trading.symbol_whitelist.size() == 1);
    assert(s.trading.symbol_whitelist[0] == "BTC/USDT");
    assert(s.trading.primary_timeframe() == "1m");
    assert(s.exchange.name == "binance");
    assert(s.exchange.api_key_env == "EXCHANGE_API_KEY");
    ASSERT_DOUBLE_NEAR(s.risk.capital, 500000.0, 1e-9);
    ASSERT_DOUBLE_NEAR(s.risk.max_loss_per_trade, 5000.0, 1e-9);
    assert(s.risk.max_orders_per_day == 5);
    assert(s.paper.seed == 42);
    ASSERT_DOUBLE_NEAR(s.paper.fill_probability, 0.7, 1e-12);
    assert(s.runner.market_poll_seconds == 30);
    assert(s.runner.news_poll_seconds == 120);
    assert(s.runner.propose_poll_seconds == 60);
    assert(!s.runner.auto_execute);
}

TEST(phrase_hash_and_paths) {
    Settings s;
    assert(s.approval_phrase_hash() == util::sha256_hex("I APPROVE"));
    s.trading.approval_phrase_hash = "deadbeef";
    assert(s.approval_phrase_hash() == "deadbeef");

    s.app.data_dir = "/var/tg";
    assert(s.store_path() == "/var/tg/tradegate_store.json");
    assert(s.runner_state_path() == "/var/tg/runner_state.json");
    s.app.store_path = "/elsewhere/store.json";
    assert(s.store_path() == "/elsewhere/store.json");
    assert(s.runner_state_path() == "/var/tg/runner_state.json");
}

TEST(source_weight_lookup) {
    Settings s;
    s.news.source_weights["coindesk"] = 1.5;
    ASSERT_DOUBLE_NEAR(s.news.weight_for("coindesk"), 1.5, 1e-12);
    ASSERT_DOUBLE_NEAR(s.news.weight_for("unknown"), 1.0, 1e-12);
}

// ============================================================================
// Validation
// ============================================================================

TEST(exchange_errors) {
    Settings s;
    s.exchange.name = "";
    ASSERT_HAS_ERROR(validate_settings(s), "exchange.name", "exchange name is required");
    s.exchange.name = "kraken";
    ASSERT_HAS_ERROR(validate_settings(s), "exchange.name", "unsupported exchange 'kraken'");
    assert(supported_exchanges().size() == 1);
}

TEST(symbol_errors) {
    Settings s;
    s.trading.symbol_whitelist.clear();
    ASSERT_HAS_ERROR(validate_settings(s), "trading.symbol_whitelist", "at least one symbol is required");

    s.trading.symbol_whitelist = {"BTCUSDT", "ETH/USDT", "/USDT", "BTC/"};
    auto errors = validate_settings(s);
    ASSERT_HAS_ERROR(errors, "trading.symbol_whitelist", "symbol 'BTCUSDT' is not in BASE/QUOTE form");
    ASSERT_HAS_ERROR(errors, "trading.symbol_whitelist", "symbol '/USDT' is not in BASE/QUOTE form");
    ASSERT_HAS_ERROR(errors, "trading.symbol_whitelist", "symbol 'BTC/' is not in BASE/QUOTE form");
    assert(!has_error(errors, "trading.symbol_whitelist", "symbol 'ETH/USDT' is not in BASE/QUOTE form"));

    Settings a;
    a.autopilot.symbol_whitelist = {"ETH-USDT"};
    ASSERT_HAS_ERROR(validate_settings(a), "autopilot.symbol_whitelist",
                     "symbol 'ETH-USDT' is not in BASE/QUOTE form");
}

TEST(trading_errors) {
    Settings s;
    s.trading.timeframes.clear();
    s.trading.candle_limit = 0;
    s.trading.order_timeout_seconds = -1;
    s.trading.intent_expiry_seconds = 0;
    s.trading.approval_phrase = "";
    auto errors = validate_settings(s);
    ASSERT_HAS_ERROR(errors, "trading.timeframes", "at least one timeframe is required");
    ASSERT_HAS_ERROR(errors, "trading.candle_limit", "must be positive");
    ASSERT_HAS_ERROR(errors, "trading.order_timeout_seconds", "must be positive");
    ASSERT_HAS_ERROR(errors, "trading.intent_expiry_seconds", "must be positive");
    ASSERT_HAS_ERROR(errors, "trading.approval_phrase", "an approval phrase or phrase hash is required");

    s.trading.approval_phrase_hash = util::sha256_hex("secret");
    assert(!has_error(validate_settings(s), "trading.approval_phrase",
                      "an approval phrase or phrase hash is required"));
}

TEST(risk_errors) {
    Settings s;
    s.risk.capital = 0;
    s.risk.max_position_pct = 1.5;
    s.risk.max_orders_per_day = -1;
    s.risk.cooldown_minutes = -5;
    auto errors = validate_settings(s);
    ASSERT_HAS_ERROR(errors, "risk.capital", "must be positive");
    ASSERT_HAS_ERROR(errors, "risk.max_order_notional", "exceeds risk.capital");
    ASSERT_HAS_ERROR(errors, "risk.max_position_pct", "must be within [0, 1]");
    ASSERT_HAS_ERROR(errors, "risk.max_orders_per_day", "must not be negative");
    ASSERT_HAS_ERROR(errors, "risk.cooldown_minutes", "must not be negative");
}

TEST(probability_errors) {
    Settings s;
    s.paper.fill_probability = 1.01;
    s.autopilot.min_confidence = -0.1;
    auto errors = validate_settings(s);
    ASSERT_HAS_ERROR(errors, "paper.fill_probability", "must be within [0, 1]");
    ASSERT_HAS_ERROR(errors, "autopilot.min_confidence", "must be within [0, 1]");
}

TEST(runner_errors) {
    Settings s;
    s.runner.market_poll_seconds = 0;
    s.runner.news_poll_seconds = -1;
    s.runner.propose_poll_seconds = 0;
    s.runner.jitter_seconds = -1;
    s.runner.max_backoff_seconds = 0;
    auto errors = validate_settings(s);
    ASSERT_HAS_ERROR(errors, "runner.market_poll_seconds", "must be positive");
    ASSERT_HAS_ERROR(errors, "runner.news_poll_seconds", "must be positive");
    ASSERT_HAS_ERROR(errors, "runner.propose_poll_seconds", "must be positive");
    ASSERT_HAS_ERROR(errors, "runner.jitter_seconds", "must not be negative");
    ASSERT_HAS_ERROR(errors, "runner.max_backoff_seconds", "must be at least 1");
    assert(errors.size() == 5);
}

TEST(error_formatting) {
    ConfigError e{"risk.capital", "must be positive", ""};
    assert(e.to_string() == "risk.capital: must be positive");
    ConfigError with{"exchange.name", "unsupported exchange 'x'", "supported: binance"};
    assert(with.to_string() == "exchange.name: unsupported exchange 'x' (supported: binance)");

    ConfigValidationException ex({e, with});
    assert(ex.errors().size() == 2);
    std::string what = ex.what();
    assert(what.find("risk.capital: must be positive") != std::string::npos);
    assert(what.find("supported: binance") != std::string::npos);
}

// ============================================================================
// JSON mapping
// ============================================================================

TEST(partial_document_merges_over_defaults) {
    json doc = {
        {"trading", {{"mode", "live"}, {"symbol_whitelist", {"ETH/USDT"}},
                     {"maker_emulation", {{"buffer_bps", 2.5}}}}},
        {"risk", {{"capital", 1000.0}, {"max_order_notional", 500.0}}},
        {"news", {{"source_weights", {{"reuters", 2.0}}}}},
        {"runner", {{"auto_execute", true}}},
    };
    Settings s = settings_from_json(doc);
    assert(s.trading.mode == TradingMode::Live);
    assert(s.trading.symbol_whitelist.size() == 1);
    assert(s.trading.symbol_whitelist[0] == "ETH/USDT");
    ASSERT_DOUBLE_NEAR(s.trading.maker_emulation.buffer_bps, 2.5, 1e-12);
    assert(s.trading.maker_emulation.use_tick);
    ASSERT_DOUBLE_NEAR(s.risk.capital, 1000.0, 1e-12);
    ASSERT_DOUBLE_NEAR(s.risk.max_position_pct, 0.2, 1e-12);
    ASSERT_DOUBLE_NEAR(s.news.weight_for("reuters"), 2.0, 1e-12);
    assert(s.runner.auto_execute);
    assert(s.runner.market_poll_seconds == 30);
    assert(s.trading.dry_run);
}

TEST(null_values_keep_defaults) {
    json doc = {{"risk", {{"capital", nullptr}}}};
    Settings s = settings_from_json(doc);
    ASSERT_DOUBLE_NEAR(s.risk.capital, 500000.0, 1e-9);
}

TEST(wrong_types_throw) {
    bool threw = false;
    try {
        settings_from_json(json::array());
    } catch (const std::runtime_error&) {
        threw = true;
    }
    assert(threw);

    threw = false;
    try {
        settings_from_json(json{{"risk", {{"capital", "lots"}}}});
    } catch (const std::runtime_error& e) {
        threw = std::string(e.what()).find("risk.capital") != std::string::npos;
    }
    assert(threw);

    threw = false;
    try {
        settings_from_json(json{{"runner", 5}});
    } catch (const std::runtime_error& e) {
        threw = std::string(e.what()).find("runner") != std::string::npos;
    }
    assert(threw);
}

TEST(unknown_mode_rejected) {
    bool threw = false;
    try {
        settings_from_json(json{{"trading", {{"mode", "sim"}}}});
    } catch (const ConfigValidationException& e) {
        threw = e.errors().size() == 1 && e.errors()[0].field == "trading.mode";
    }
    assert(threw);
}

TEST(serialized_settings_reload_identically) {
    Settings s;
    s.risk.capital = 12345;
    s.trading.kill_switch = true;
    s.paper.seed = 7;
    Settings back = settings_from_json(settings_to_json(s));
    assert(settings_to_json(back) == settings_to_json(s));
    assert(back.paper.seed == 7);
    assert(back.trading.kill_switch);
}

// ============================================================================
// File loading
// ============================================================================

TEST(load_missing_file_throws) {
    std::remove(CONFIG_PATH);
    bool threw = false;
    try {
        load_settings(CONFIG_PATH);
    } catch (const std::runtime_error& e) {
        threw = std::string(e.what()).find("Cannot open config file") != std::string::npos;
    }
    assert(threw);
}

TEST(load_malformed_file_throws) {
    write_file(CONFIG_PATH, "{ \"risk\": ");
    bool threw = false;
    try {
        load_settings(CONFIG_PATH);
    } catch (const std::runtime_error& e) {
        threw = std::string(e.what()).find("Cannot parse config file") != std::string::npos;
    }
    assert(threw);
    std::remove(CONFIG_PATH);
}

TEST(load_invalid_values_reports_every_error) {
    write_file(CONFIG_PATH, R"({"exchange": {"name": "ftx"}, "risk": {"capital": -1}})");
    bool threw = false;
    try {
        load_settings(CONFIG_PATH);
    } catch (const ConfigValidationException& e) {
        threw = true;
        ASSERT_HAS_ERROR(e.errors(), "exchange.name", "unsupported exchange 'ftx'");
        ASSERT_HAS_ERROR(e.errors(), "risk.capital", "must be positive");
    }
    assert(threw);
    std::remove(CONFIG_PATH);
}

TEST(load_valid_file) {
    write_file(CONFIG_PATH, R"({"app": {"data_dir": "/tmp/tg"}, "paper": {"seed": 99}})");
    Settings s = load_settings(CONFIG_PATH);
    assert(s.paper.seed == 99);
    assert(s.store_path() == "/tmp/tg/tradegate_store.json");
    std::remove(CONFIG_PATH);
}

int main() {
    std::cout << "\n=== Config Tests ===\n\n";

    std::cout << "Defaults:\n";
    RUN_TEST(defaults_validate_clean);
    RUN_TEST(default_values);
    RUN_TEST(phrase_hash_and_paths);
    RUN_TEST(source_weight_lookup);

    std::cout << "\nValidation:\n";
    RUN_TEST(exchange_errors);
    RUN_TEST(symbol_errors);
    RUN_TEST(trading_errors);
    RUN_TEST(risk_errors);
    RUN_TEST(probability_errors);
    RUN_TEST(runner_errors);
    RUN_TEST(error_formatting);

    std::cout << "\nJSON Mapping:\n";
    RUN_TEST(partial_document_merges_over_defaults);
    RUN_TEST(null_values_keep_defaults);
    RUN_TEST(wrong_types_throw);
    RUN_TEST(unknown_mode_rejected);
    RUN_TEST(serialized_settings_reload_identically);

    std::cout << "\nFile Loading:\n";
    RUN_TEST(load_missing_file_throws);
    RUN_TEST(load_malformed_file_throws);
    RUN_TEST(load_invalid_values_reports_every_error);
    RUN_TEST(load_valid_file);

    std::cout << "\n=== All tests PASSED! ===\n\n";
    return 0;
}
