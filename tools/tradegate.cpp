/**
 * tradegate - command-line front end
 *
 * Wires config, store, exchange client, services, execution engine and
 * Runner together. User-facing results go to stdout with [TAG] prefixes;
 * diagnostics go through the async logger to stderr.
 *
 * Usage:
 *   tradegate --help
 */

#include "../include/tradegate/backtest/backtest_engine.hpp"
#include "../include/tradegate/config/settings.hpp"
#include "../include/tradegate/exchange/market_client.hpp"
#include "../include/tradegate/execution/execution_engine.hpp"
#include "../include/tradegate/intent/approval_gate.hpp"
#include "../include/tradegate/logging/async_logger.hpp"
#include "../include/tradegate/news/news_features.hpp"
#include "../include/tradegate/report/metrics.hpp"
#include "../include/tradegate/runner/runner.hpp"
#include "../include/tradegate/services/ingest.hpp"
#include "../include/tradegate/services/propose.hpp"
#include "../include/tradegate/store/json_store.hpp"
#include "../include/tradegate/strategy/strategy_factory.hpp"
#include "../include/tradegate/util/cli.hpp"
#include "../include/tradegate/util/system.hpp"
#include "../include/tradegate/util/time_utils.hpp"

#include <atomic>
#include <cstdint>
#include <filesystem>
#include <iomanip>
#include <iostream>
#include <map>
#include <memory>

using namespace tradegate;

namespace {

constexpr const char* DEFAULT_CONFIG_PATH = "config.json";

config::Settings load_config(const util::CLIArgs& args) {
    if (!args.config_path.empty())
        return config::load_settings(args.config_path);
    if (std::filesystem::exists(DEFAULT_CONFIG_PATH))
        return config::load_settings(DEFAULT_CONFIG_PATH);

    config::Settings settings;
    auto errors = config::validate_settings(settings);
    if (!errors.empty())
        throw config::ConfigValidationException(errors);
    return settings;
}

TradingMode resolve_mode(const util::CLIArgs& args, const config::Settings& settings) {
    if (args.mode.empty())
        return settings.trading.mode;
    auto mode = parse_mode(args.mode);
    if (!mode)
        throw std::invalid_argument("invalid mode: " + args.mode + " (expected paper or live)");
    return *mode;
}

/**
 * Config, store and exchange client shared by every command
 */
struct App {
    config::Settings settings;
    logging::AsyncLogger* logger;
    std::unique_ptr<store::JsonStore> store;
    std::unique_ptr<exchange::IMarketClient> market;

    App(config::Settings s, logging::AsyncLogger* log) : settings(std::move(s)), logger(log) {
        store = std::make_unique<store::JsonStore>(settings.store_path());
        // Unsupported names fail here, before any command runs
        market = exchange::make_market_client(settings.exchange);
    }
};

void print_intent(const intent::IntentRecord& record) {
    const auto& i = record.intent;
    std::cout << "  " << i.intent_id << "  " << std::setw(8) << status_to_string(record.status) << "  "
              << side_to_string(i.side) << " " << std::fixed << std::setprecision(8) << i.size << " " << i.symbol
              << " @ " << std::setprecision(2) << i.price << "  [" << mode_to_string(i.mode) << ", "
              << i.strategy << "]  expires " << util::format_iso8601(i.expires_at) << "\n";
}

void print_metrics(const report::Metrics& m, const std::string& currency) {
    std::cout << report::format_summary(m, currency);
}

// =============================================================================
// Commands
// =============================================================================

int cmd_ingest(App& app, const util::CLIArgs& args) {
    std::unique_ptr<news::INewsSource> news;
    if (!args.news_csv.empty())
        news = std::make_unique<news::CsvNewsSource>(args.news_csv, app.settings.news);

    services::IngestService ingest(app.settings, *app.store, app.market.get(), news.get());
    ingest.set_logger(app.logger);

    services::IngestParams params;
    params.symbol = args.symbol;
    params.orderbook = args.orderbook;

    Timestamp now = util::wall_clock_ms();
    auto market = ingest.ingest_market(params, now);
    auto news_result = ingest.ingest_news(params, now);

    std::cout << "[INGEST] candles=" << market.candles << " news_inserted=" << news_result.news_inserted
              << " features=" << news_result.features_added << "\n";
    for (const auto& e : market.errors)
        std::cout << "[ERROR] " << e << "\n";
    for (const auto& e : news_result.errors)
        std::cout << "[ERROR] " << e << "\n";
    return market.ok() && news_result.ok() ? 0 : 1;
}

int cmd_propose(App& app, const util::CLIArgs& args) {
    services::ProposalService proposals(app.settings, *app.store, app.market.get());
    proposals.set_logger(app.logger);

    services::ProposeParams params;
    params.symbol = args.symbol;
    params.strategy = args.strategy;
    params.mode = resolve_mode(args, app.settings);
    params.refresh = args.refresh;

    services::ProposalOutcome outcome = proposals.propose(params, util::wall_clock_ms());
    switch (outcome.status) {
    case services::ProposalStatus::Proposed:
        std::cout << "[PROPOSED] intent " << outcome.intent->intent_id << "\n";
        std::cout << "  " << side_to_string(outcome.intent->side) << " " << std::fixed << std::setprecision(8)
                  << outcome.intent->size << " " << outcome.intent->symbol << " @ " << std::setprecision(2)
                  << outcome.intent->price << "\n";
        std::cout << "  hash:      " << outcome.intent_hash << "\n";
        std::cout << "  rationale: " << outcome.rationale << "\n";
        std::cout << "  expires:   " << util::format_iso8601(outcome.intent->expires_at) << "\n";
        return 0;
    case services::ProposalStatus::Hold:
        std::cout << "[HOLD] " << outcome.reason << " (" << outcome.rationale << ")\n";
        return 0;
    case services::ProposalStatus::Rejected:
        std::cout << "[REJECTED] " << outcome.reason << "\n";
        return 0;
    }
    return 0;
}

int cmd_approve(App& app, const util::CLIArgs& args) {
    if (args.intent_id.empty()) {
        std::cerr << "approve requires --intent ID\n";
        return 2;
    }
    std::string phrase;
    if (args.phrase) {
        phrase = *args.phrase;
    } else {
        std::cout << "Type the approval phrase to approve " << args.intent_id << ": " << std::flush;
        std::getline(std::cin, phrase);
    }

    intent::ApprovalGate gate(*app.store, app.settings.approval_phrase_hash());
    gate.set_logger(app.logger);
    try {
        auto result = gate.approve(args.intent_id, phrase, args.approved_by, util::wall_clock_ms());
        std::cout << "[APPROVED] intent " << result.intent_id << " hash " << result.intent_hash << "\n";
        return 0;
    } catch (const intent::ApprovalError& e) {
        std::cout << "[DENIED] " << e.what() << "\n";
        return 1;
    }
}

int cmd_execute(App& app, const util::CLIArgs& args) {
    if (args.intent_id.empty()) {
        std::cerr << "execute requires --intent ID\n";
        return 2;
    }
    execution::ExecutionEngine engine(app.settings, *app.store, app.market.get());
    engine.set_logger(app.logger);

    auto result = engine.execute(args.intent_id, resolve_mode(args, app.settings));
    std::cout << "[" << status_to_string(result.status) << "] " << result.message;
    if (result.exec_id)
        std::cout << " (exec " << *result.exec_id << ")";
    std::cout << "\n";
    return result.status == IntentStatus::Error ? 1 : 0;
}

int cmd_backtest(App& app, const util::CLIArgs& args) {
    if (args.start_date.empty() || args.end_date.empty()) {
        std::cerr << "backtest requires --start and --end\n";
        return 2;
    }
    const auto range = backtest::BacktestRange::from_dates(args.start_date, args.end_date);
    const std::string symbol = args.symbol.empty() ? app.settings.trading.symbol_whitelist.front() : args.symbol;
    const std::string& timeframe = app.settings.trading.primary_timeframe();

    std::vector<market::Candle> candles;
    if (!args.candles_csv.empty()) {
        std::cout << "Loading candles from " << args.candles_csv << "...\n";
        candles = market::load_candles_csv(args.candles_csv);
    } else {
        candles = app.store->recent_candles(symbol, timeframe, SIZE_MAX);
    }

    std::vector<news::NewsFeature> news_items;
    if (!args.news_csv.empty()) {
        news_items = news::load_news_csv(args.news_csv, app.settings.news);
    } else {
        Timestamp lookback = static_cast<Timestamp>(app.settings.news.sentiment_lookback_hours) * util::MS_PER_HOUR;
        news_items = app.store->news_published_between(range.start - lookback, range.end);
    }
    std::cout << "Loaded " << candles.size() << " candles, " << news_items.size() << " news items\n";

    auto strategy = strategy::StrategyFactory::create(args.strategy, app.settings);
    backtest::BacktestEngine engine(app.settings);
    engine.set_logger(app.logger);
    auto result = engine.run(symbol, candles, news_items, *strategy, range);

    app.store->transaction([&] {
        for (const auto& row : result.feature_rows)
            app.store->save_feature_row(row);
    });

    std::string prefix = std::string("backtest_") + strategy->name();
    auto paths = report::save_report(result.metrics, result.equity, args.output_dir, prefix,
                                     app.settings.trading.base_currency);
    auto trades_path = report::save_trades_csv(result.trades, args.output_dir, prefix);

    std::cout << "\n=== Backtest: " << strategy->name() << " " << symbol << " " << args.start_date << " .. "
              << args.end_date << " ===\n";
    std::cout << "Candles: " << result.candles_used << "\n";
    print_metrics(result.metrics, app.settings.trading.base_currency);
    std::cout << "[REPORT] " << paths.json << "\n";
    std::cout << "[REPORT] " << paths.csv << "\n";
    std::cout << "[REPORT] " << paths.summary << "\n";
    std::cout << "[REPORT] " << trades_path << "\n";
    return 0;
}

int cmd_report(App& app, const util::CLIArgs& args) {
    std::optional<TradingMode> mode;
    if (!args.mode.empty())
        mode = resolve_mode(args, app.settings);

    auto trades = report::load_trades(*app.store, mode);
    auto result = report::compute_metrics(trades, app.settings.risk.capital);

    std::string prefix = std::string("report_") + (mode ? mode_to_string(*mode) : "all");
    auto paths = report::save_report(result.metrics, result.equity, args.output_dir, prefix,
                                     app.settings.trading.base_currency);
    auto trades_path = report::save_trades_csv(trades, args.output_dir, prefix);

    print_metrics(result.metrics, app.settings.trading.base_currency);
    std::cout << "[REPORT] " << paths.json << "\n";
    std::cout << "[REPORT] " << paths.summary << "\n";
    std::cout << "[REPORT] " << trades_path << "\n";
    return 0;
}

int cmd_status(App& app) {
    const auto& s = app.settings;
    Timestamp now = util::wall_clock_ms();
    std::string day = util::utc_day(now);

    std::cout << "\n=== tradegate status ===\n";
    std::cout << "Mode: " << mode_to_string(s.trading.mode) << (s.trading.dry_run ? " (dry run)" : "")
              << "  Exchange: " << s.exchange.name << "  Store: " << s.store_path() << "\n";
    if (s.trading.kill_switch)
        std::cout << "[WARN] kill switch enabled\n";

    std::map<IntentStatus, int> counts;
    auto intents = app.store->list_intents(std::nullopt);
    for (const auto& r : intents)
        counts[r.status]++;
    std::cout << "\n--- Intents (" << intents.size() << ") ---\n";
    for (const auto& [status, n] : counts)
        std::cout << "  " << status_to_string(status) << ": " << n << "\n";
    if (auto latest = app.store->latest_intent(std::nullopt)) {
        std::cout << "Latest:\n";
        print_intent(*latest);
    }

    std::cout << "\n--- Positions ---\n";
    for (const auto& symbol : s.trading.symbol_whitelist) {
        auto pos = app.store->position_state(symbol);
        std::cout << "  " << symbol << ": " << std::fixed << std::setprecision(8) << pos.size << " @ avg "
                  << std::setprecision(2) << pos.avg_cost << "\n";
    }

    std::cout << "\n--- Today (" << day << ") ---\n";
    std::cout << "Realized PnL: " << std::fixed << std::setprecision(2) << app.store->daily_realized_pnl(day) << " "
              << s.trading.base_currency << "\n";
    std::cout << "Executions:   " << app.store->daily_execution_count(day) << " / " << s.risk.max_orders_per_day
              << "\n";
    if (auto last = app.store->last_execution_time())
        std::cout << "Last exec:    " << util::format_iso8601(*last) << "\n";

    std::cout << "\n--- Exchange ---\n";
    try {
        Timestamp server = app.market->server_time();
        std::cout << "  " << app.market->name() << " server time " << util::format_iso8601(server) << " (skew "
                  << (server - util::wall_clock_ms()) << " ms)\n";
    } catch (const std::exception& e) {
        std::cout << "[WARN] server time unavailable: " << e.what() << "\n";
    }

    runner::RunnerStateStore state_store(s.runner_state_path());
    runner::RunnerState state;
    std::cout << "\n--- Runner ---\n";
    if (state_store.restore(state)) {
        std::cout << state.to_json().dump(2) << "\n";
    } else {
        std::cout << "  no runner state at " << state_store.path() << "\n";
    }
    return 0;
}

int cmd_run(App& app, const util::CLIArgs& args) {
    config::RunnerConfig runner_config = app.settings.runner;
    if (args.orderbook)
        runner_config.orderbook = true;
    if (args.auto_execute)
        runner_config.auto_execute = true;

    std::unique_ptr<news::INewsSource> news;
    if (!args.news_csv.empty())
        news = std::make_unique<news::CsvNewsSource>(args.news_csv, app.settings.news);

    services::IngestService ingest(app.settings, *app.store, app.market.get(), news.get());
    services::ProposalService proposals(app.settings, *app.store, app.market.get());
    execution::ExecutionEngine executor(app.settings, *app.store, app.market.get());
    ingest.set_logger(app.logger);
    proposals.set_logger(app.logger);
    executor.set_logger(app.logger);

    services::ProposeParams propose_params;
    propose_params.symbol = args.symbol;
    propose_params.strategy = args.strategy;
    propose_params.mode = resolve_mode(args, app.settings);
    // Fail on a bad strategy name now rather than on every cycle
    strategy::StrategyFactory::create(propose_params.strategy, app.settings);

    services::IngestParams ingest_params;
    ingest_params.symbol = args.symbol;

    runner::RunnerHooks hooks;
    hooks.ingest_market = [&](bool orderbook) {
        services::IngestParams p = ingest_params;
        p.orderbook = orderbook;
        return ingest.ingest_market(p, util::wall_clock_ms());
    };
    hooks.ingest_news = [&] { return ingest.ingest_news(ingest_params, util::wall_clock_ms()); };
    hooks.prepare = [&] { return proposals.prepare(propose_params, util::wall_clock_ms()); };
    hooks.finalize = [&](const services::ProposalCandidate& candidate) {
        return proposals.finalize(candidate, propose_params, util::wall_clock_ms());
    };
    hooks.execute = [&](const std::string& intent_id) { return executor.execute(intent_id, propose_params.mode); };

    std::atomic<bool> running{true};
    util::install_shutdown_handler(running);

    runner::Runner loop(runner_config, propose_params.mode, app.settings.runner_state_path(), hooks, running);
    loop.set_logger(app.logger);

    std::cout << "[RUN] " << (args.once ? "single cycle" : "loop") << ", mode " << mode_to_string(propose_params.mode)
              << ", strategy " << propose_params.strategy << (runner_config.auto_execute ? ", auto-execute" : "")
              << "\n";
    int cycles = loop.run(args.once, args.max_cycles);

    if (int sig = util::last_shutdown_signal())
        std::cout << "\n[SHUTDOWN] Received signal " << sig << ", stopped after the current cycle\n";
    std::cout << "[RUN] " << cycles << " cycle(s), iteration " << loop.state().iteration << "\n";
    return 0;
}

int dispatch(App& app, const util::CLIArgs& args) {
    if (args.command == "ingest")
        return cmd_ingest(app, args);
    if (args.command == "propose")
        return cmd_propose(app, args);
    if (args.command == "approve")
        return cmd_approve(app, args);
    if (args.command == "execute")
        return cmd_execute(app, args);
    if (args.command == "backtest")
        return cmd_backtest(app, args);
    if (args.command == "report")
        return cmd_report(app, args);
    if (args.command == "run")
        return cmd_run(app, args);
    if (args.command == "status")
        return cmd_status(app);
    std::cerr << "Unknown command: " << args.command << "\n";
    return 2;
}

}  // namespace

int main(int argc, char* argv[]) {
    util::CLIArgs args;
    if (!util::parse_args(argc, argv, args))
        return 2;
    if (args.help || args.command.empty()) {
        util::print_help();
        return args.help ? 0 : 2;
    }

    config::Settings settings;
    try {
        settings = load_config(args);
    } catch (const config::ConfigValidationException& e) {
        std::cerr << "[CONFIG] invalid configuration:\n";
        for (const auto& err : e.errors())
            std::cerr << "  " << err.to_string() << "\n";
        return 2;
    } catch (const std::exception& e) {
        std::cerr << "[CONFIG] " << e.what() << "\n";
        return 2;
    }

    logging::AsyncLogger logger;
    logger.set_min_level(logging::parse_level(args.log_level.empty() ? settings.app.log_level : args.log_level));
    logger.start();

    int rc = 0;
    try {
        App app(settings, &logger);
        rc = dispatch(app, args);
    } catch (const std::exception& e) {
        logging::AsyncLogger* log = &logger;
        TG_LOGF_ERROR(log, System, "%s failed: %s", args.command.c_str(), e.what());
        std::cerr << "[ERROR] " << e.what() << "\n";
        rc = 1;
    }

    logger.stop();
    return rc;
}
