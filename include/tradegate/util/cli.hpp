#pragma once

/**
 * CLI utilities for the tradegate command-line program
 *
 * Parses "tradegate [global options] <command> [command options]".
 */

#include <iostream>
#include <optional>
#include <string>
#include <vector>

namespace tradegate {
namespace util {

/**
 * Command-line arguments. Which fields a command reads is listed in print_help().
 */
struct CLIArgs {
    std::string command;
    bool help = false;

    // Global
    std::string config_path;  // empty = config.json if present, else defaults
    std::string log_level;    // empty = app.log_level from config

    // Shared by several commands
    std::string symbol;
    std::string strategy = "baseline";
    std::string mode;  // empty = trading.mode from config
    std::string intent_id;
    std::string output_dir = "reports";

    // approve
    std::optional<std::string> phrase;
    std::string approved_by = "cli";

    // propose
    bool refresh = false;

    // ingest / run
    bool orderbook = false;
    std::string news_csv;

    // backtest
    std::string candles_csv;
    std::string start_date;
    std::string end_date;

    // run
    bool once = false;
    std::optional<int> max_cycles;
    bool auto_execute = false;
};

inline const std::vector<std::string>& commands() {
    static const std::vector<std::string> names = {"propose", "approve", "execute", "ingest", "backtest",
                                                   "report",  "run",     "status"};
    return names;
}

inline void print_help() {
    std::cout << R"(
tradegate - gated trade proposal and execution
==============================================

Usage: tradegate [--config PATH] [--log-level LEVEL] <command> [options]

Commands:
  ingest     Pull candles (and news) into the store
               [--symbol SYM] [--orderbook] [--news-csv FILE]
  propose    Run a strategy and store a risk-checked order intent
               [--symbol SYM] [--strategy NAME] [--mode paper|live] [--refresh]
  approve    Bind the approval phrase to an intent's hash
               --intent ID [--phrase TEXT] [--by NAME]
  execute    Execute an approved intent
               --intent ID [--mode paper|live]
  backtest   Replay a strategy over historical candles
               --start YYYY-MM-DD --end YYYY-MM-DD [--candles-csv FILE]
               [--news-csv FILE] [--symbol SYM] [--strategy NAME] [--out DIR]
  report     Metrics over recorded trades
               [--mode paper|live] [--out DIR]
  run        Scheduled ingest / propose loop
               [--once] [--max-cycles N] [--symbol SYM] [--strategy NAME]
               [--mode paper|live] [--orderbook] [--news-csv FILE] [--auto-execute]
  status     Intents, positions and runner state

Strategies: baseline, news_overlay

Examples:
  tradegate --config config.json propose --strategy news_overlay
  tradegate approve --intent 7f0c...
  tradegate execute --intent 7f0c... --mode paper
  tradegate backtest --candles-csv examples/btc_usdt_1m.csv --news-csv examples/news.csv \
      --start 2024-01-01 --end 2024-01-02
  tradegate run --max-cycles 10

Live trading additionally needs trading.mode=live, dry_run=false,
i_understand_live_trading=true and I_UNDERSTAND_LIVE_TRADING=true.
)";
}

/**
 * Parse command-line arguments into CLIArgs.
 *
 * @return true if parsing succeeded, false on error (message printed)
 */
inline bool parse_args(int argc, char* argv[], CLIArgs& args) {
    auto need_value = [&](int i, const std::string& flag) {
        if (i + 1 >= argc) {
            std::cerr << "Missing value for " << flag << "\n";
            return false;
        }
        return true;
    };

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        if (arg == "--help" || arg == "-h") {
            args.help = true;
        }
        else if (arg == "--config" || arg == "-c") {
            if (!need_value(i, arg))
                return false;
            args.config_path = argv[++i];
        }
        else if (arg == "--log-level") {
            if (!need_value(i, arg))
                return false;
            args.log_level = argv[++i];
        }
        else if (arg == "--symbol" || arg == "-s") {
            if (!need_value(i, arg))
                return false;
            args.symbol = argv[++i];
        }
        else if (arg == "--strategy") {
            if (!need_value(i, arg))
                return false;
            args.strategy = argv[++i];
        }
        else if (arg == "--mode" || arg == "-m") {
            if (!need_value(i, arg))
                return false;
            args.mode = argv[++i];
        }
        else if (arg == "--intent" || arg == "-i") {
            if (!need_value(i, arg))
                return false;
            args.intent_id = argv[++i];
        }
        else if (arg == "--out" || arg == "-o") {
            if (!need_value(i, arg))
                return false;
            args.output_dir = argv[++i];
        }
        else if (arg == "--phrase") {
            if (!need_value(i, arg))
                return false;
            args.phrase = argv[++i];
        }
        else if (arg == "--by") {
            if (!need_value(i, arg))
                return false;
            args.approved_by = argv[++i];
        }
        else if (arg == "--refresh") {
            args.refresh = true;
        }
        else if (arg == "--orderbook") {
            args.orderbook = true;
        }
        else if (arg == "--news-csv") {
            if (!need_value(i, arg))
                return false;
            args.news_csv = argv[++i];
        }
        else if (arg == "--candles-csv") {
            if (!need_value(i, arg))
                return false;
            args.candles_csv = argv[++i];
        }
        else if (arg == "--start") {
            if (!need_value(i, arg))
                return false;
            args.start_date = argv[++i];
        }
        else if (arg == "--end") {
            if (!need_value(i, arg))
                return false;
            args.end_date = argv[++i];
        }
        else if (arg == "--once") {
            args.once = true;
        }
        else if (arg == "--max-cycles") {
            if (!need_value(i, arg))
                return false;
            try {
                args.max_cycles = std::stoi(argv[++i]);
            } catch (const std::exception&) {
                std::cerr << "Invalid value for --max-cycles: " << argv[i] << "\n";
                return false;
            }
        }
        else if (arg == "--auto-execute") {
            args.auto_execute = true;
        }
        else if (!arg.empty() && arg[0] != '-' && args.command.empty()) {
            args.command = arg;
        }
        else {
            std::cerr << "Unknown option: " << arg << "\n";
            std::cerr << "Use --help for usage information.\n";
            return false;
        }
    }

    if (!args.help && !args.command.empty()) {
        bool known = false;
        for (const auto& name : commands())
            known = known || name == args.command;
        if (!known) {
            std::cerr << "Unknown command: " << args.command << "\n";
            std::cerr << "Use --help for usage information.\n";
            return false;
        }
    }
    return true;
}

}  // namespace util
}  // namespace tradegate
