#include "../../include/tradegate/report/metrics.hpp"
#include "../../include/tradegate/util/time_utils.hpp"

#include <algorithm>
#include <cmath>
#include <cstdio>
#include <filesystem>
#include <fstream>
#include <stdexcept>

namespace tradegate {
namespace report {

namespace {

constexpr double SECONDS_PER_YEAR = 365.25 * 24 * 3600;

std::string format_percent(double ratio) {
    char buf[64];
    std::snprintf(buf, sizeof(buf), "%.2f%%", ratio * 100.0);
    return buf;
}

std::ofstream open_output(const std::filesystem::path& path) {
    std::ofstream out(path);
    if (!out.is_open()) {
        throw std::runtime_error("Cannot create file: " + path.string());
    }
    return out;
}

}  // namespace

json TradeRecord::to_json() const {
    return json{{"intent_id", intent_id},
                {"symbol", symbol},
                {"side", side_to_string(side)},
                {"mode", mode_to_string(mode)},
                {"size", size},
                {"price", price},
                {"pnl", pnl},
                {"notional", notional},
                {"fee", fee},
                {"created_at", util::format_iso8601(created_at)}};
}

json Metrics::to_json() const {
    return json{{"total_pnl", total_pnl},
                {"total_return", total_return},
                {"cagr", cagr},
                {"sharpe", sharpe},
                {"max_drawdown", max_drawdown},
                {"win_rate", win_rate},
                {"profit_factor", profit_factor},
                {"turnover", turnover},
                {"fees", fees},
                {"trade_count", trade_count}};
}

double max_drawdown(const std::vector<double>& equity) {
    if (equity.empty())
        return 0.0;
    double peak = equity.front();
    double worst = 0.0;
    for (double value : equity) {
        peak = std::max(peak, value);
        worst = std::max(worst, peak - value);
    }
    return worst;
}

MetricsResult compute_metrics(const std::vector<TradeRecord>& trades, double capital, std::optional<Timestamp> start,
                              std::optional<Timestamp> end) {
    MetricsResult result;
    Metrics& m = result.metrics;

    double running = 0;
    double gross_profit = 0;
    double gross_loss = 0;
    int wins = 0;
    for (const auto& t : trades) {
        running += t.pnl;
        result.equity.push_back(running);
        if (t.pnl > 0) {
            ++wins;
            gross_profit += t.pnl;
        } else if (t.pnl < 0) {
            gross_loss += -t.pnl;
        }
        m.turnover += t.notional;
        m.fees += t.fee;
    }

    m.trade_count = static_cast<int>(trades.size());
    m.total_pnl = running;
    m.win_rate = m.trade_count > 0 ? static_cast<double>(wins) / m.trade_count : 0.0;
    m.profit_factor = gross_loss > 0 ? gross_profit / gross_loss : 0.0;
    m.max_drawdown = max_drawdown(result.equity);

    if (capital <= 0)
        return result;

    m.total_return = m.total_pnl / capital;

    // Period spans every trade plus the requested range
    std::vector<Timestamp> stamps;
    for (const auto& t : trades)
        stamps.push_back(t.created_at);
    if (start)
        stamps.push_back(*start);
    if (end)
        stamps.push_back(*end);
    if (!stamps.empty()) {
        auto [lo, hi] = std::minmax_element(stamps.begin(), stamps.end());
        double years = static_cast<double>(*hi - *lo) / 1000.0 / SECONDS_PER_YEAR;
        if (years > 0 && m.total_return > -1.0) {
            m.cagr = std::pow(1.0 + m.total_return, 1.0 / years) - 1.0;
        }
    }

    if (trades.size() >= 2) {
        double n = static_cast<double>(trades.size());
        double mean = 0;
        for (const auto& t : trades)
            mean += t.pnl / capital;
        mean /= n;
        double var = 0;
        for (const auto& t : trades) {
            double d = t.pnl / capital - mean;
            var += d * d;
        }
        double stdev = std::sqrt(var / (n - 1));  // sample stdev
        if (stdev > 0) {
            m.sharpe = mean / stdev * std::sqrt(n);
        }
    }
    return result;
}

std::string format_summary(const Metrics& m, const std::string& currency) {
    char buf[1024];
    std::snprintf(buf, sizeof(buf),
                  "Total PnL: %.2f %s\n"
                  "Total Return: %s\n"
                  "CAGR: %s\n"
                  "Sharpe (trade-based): %.2f\n"
                  "Max Drawdown: %.2f\n"
                  "Win Rate: %s\n"
                  "Profit Factor: %.2f\n"
                  "Turnover: %.2f\n"
                  "Fees: %.2f\n"
                  "Trades: %d\n",
                  m.total_pnl, currency.c_str(), format_percent(m.total_return).c_str(),
                  format_percent(m.cagr).c_str(), m.sharpe, m.max_drawdown, format_percent(m.win_rate).c_str(),
                  m.profit_factor, m.turnover, m.fees, m.trade_count);
    return buf;
}

ReportPaths save_report(const Metrics& metrics, const std::vector<double>& equity, const std::string& output_dir,
                        const std::string& prefix, const std::string& currency) {
    std::filesystem::path dir(output_dir);
    std::filesystem::create_directories(dir);

    ReportPaths paths;
    paths.json = (dir / (prefix + "_report.json")).string();
    paths.csv = (dir / (prefix + "_equity.csv")).string();
    paths.summary = (dir / (prefix + "_summary.txt")).string();

    {
        auto out = open_output(paths.json);
        out << metrics.to_json().dump(2) << "\n";
    }
    {
        auto out = open_output(paths.csv);
        out << "step,equity\n";
        char buf[64];
        for (size_t i = 0; i < equity.size(); ++i) {
            std::snprintf(buf, sizeof(buf), "%.10g", equity[i]);
            out << (i + 1) << "," << buf << "\n";
        }
    }
    {
        auto out = open_output(paths.summary);
        out << format_summary(metrics, currency);
    }
    return paths;
}

std::string save_trades_csv(const std::vector<TradeRecord>& trades, const std::string& output_dir,
                            const std::string& prefix) {
    std::filesystem::path dir(output_dir);
    std::filesystem::create_directories(dir);
    std::filesystem::path path = dir / (prefix + "_trades.csv");

    auto out = open_output(path);
    out << "created_at,intent_id,mode,symbol,side,size,price,fee,pnl\n";
    char buf[256];
    for (const auto& t : trades) {
        std::snprintf(buf, sizeof(buf), "%.10g,%.10g,%.10g,%.10g", t.size, t.price, t.fee, t.pnl);
        out << util::format_iso8601(t.created_at) << "," << t.intent_id << "," << mode_to_string(t.mode) << ","
            << t.symbol << "," << side_to_string(t.side) << "," << buf << "\n";
    }
    return path.string();
}

std::vector<TradeRecord> load_trades(const store::IStore& store, std::optional<TradingMode> mode) {
    std::vector<TradeRecord> out;
    for (const auto& r : store.trade_results(mode)) {
        TradeRecord t;
        t.intent_id = r.intent_id;
        t.symbol = r.symbol;
        t.side = r.side;
        t.mode = r.mode;
        t.pnl = r.pnl;
        t.created_at = r.created_at;
        t.size = r.meta.value("size", 0.0);
        t.price = r.meta.value("fill_price", 0.0);
        t.notional = r.meta.value("notional", t.size * t.price);
        t.fee = r.meta.value("fee", 0.0);
        out.push_back(t);
    }
    return out;
}

}  // namespace report
}  // namespace tradegate
