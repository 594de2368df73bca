#pragma once

#include "../store/store.hpp"
#include "../types.hpp"

#include <nlohmann/json.hpp>

#include <optional>
#include <string>
#include <vector>

namespace tradegate {
namespace report {

using json = nlohmann::json;

/**
 * One realized trade, as produced by a backtest or read back from the store
 */
struct TradeRecord {
    std::string intent_id;  // empty for backtest trades
    std::string symbol;
    Side side = Side::Buy;
    TradingMode mode = TradingMode::Paper;
    double size = 0;
    double price = 0;
    double pnl = 0;  // 0 for buys
    double notional = 0;
    double fee = 0;
    Timestamp created_at = 0;

    json to_json() const;
};

/**
 * Trade-based performance summary
 *
 * max_drawdown is absolute (currency), measured on the cumulative PnL curve.
 * sharpe is mean/stdev of per-trade returns scaled by sqrt(trade count).
 */
struct Metrics {
    double total_pnl = 0;
    double total_return = 0;
    double cagr = 0;
    double sharpe = 0;
    double max_drawdown = 0;
    double win_rate = 0;
    double profit_factor = 0;
    double turnover = 0;
    double fees = 0;
    int trade_count = 0;

    json to_json() const;
};

struct MetricsResult {
    Metrics metrics;
    std::vector<double> equity;  // cumulative PnL after each trade
};

struct ReportPaths {
    std::string json;
    std::string csv;
    std::string summary;
};

/**
 * Compute metrics over trades in time order.
 *
 * start/end widen the period used for CAGR beyond the first and last trade.
 * A non-positive capital disables return, CAGR and Sharpe.
 */
MetricsResult compute_metrics(const std::vector<TradeRecord>& trades, double capital,
                              std::optional<Timestamp> start = std::nullopt,
                              std::optional<Timestamp> end = std::nullopt);

double max_drawdown(const std::vector<double>& equity);

std::string format_summary(const Metrics& metrics, const std::string& currency);

/**
 * Write <prefix>_report.json, <prefix>_equity.csv and <prefix>_summary.txt
 * into output_dir (created if missing).
 *
 * @throws std::runtime_error if a file cannot be written
 */
ReportPaths save_report(const Metrics& metrics, const std::vector<double>& equity, const std::string& output_dir,
                        const std::string& prefix, const std::string& currency);

// <prefix>_trades.csv; returns the path
std::string save_trades_csv(const std::vector<TradeRecord>& trades, const std::string& output_dir,
                            const std::string& prefix);

/**
 * Realized trades recorded by the execution engine, oldest first.
 * size, price, notional and fee come from the trade result's meta.
 */
std::vector<TradeRecord> load_trades(const store::IStore& store, std::optional<TradingMode> mode);

}  // namespace report
}  // namespace tradegate
