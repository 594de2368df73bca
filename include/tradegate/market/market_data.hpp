#pragma once

#include "../types.hpp"

#include <fstream>
#include <iomanip>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

namespace tradegate {
namespace market {

/**
 * OHLCV candle, keyed by open time (ms)
 */
struct Candle {
    Timestamp ts = 0;
    double open = 0;
    double high = 0;
    double low = 0;
    double close = 0;
    double volume = 0;

    bool is_bullish() const { return close > open; }
    bool is_bearish() const { return close < open; }
};

/**
 * Top of book snapshot
 */
struct OrderbookTop {
    Timestamp ts = 0;
    double bid = 0;
    double ask = 0;
    double bid_size = 0;
    double ask_size = 0;

    double mid() const { return (bid + ask) / 2; }
    bool valid() const { return bid > 0 && ask > 0 && ask >= bid; }
};

/**
 * Market trade tick
 */
struct MarketTrade {
    Timestamp ts = 0;
    double price = 0;
    double quantity = 0;
};

namespace detail {

inline std::vector<std::string> split_csv_line(const std::string& line) {
    std::stringstream ss(line);
    std::string token;
    std::vector<std::string> tokens;
    while (std::getline(ss, token, ',')) {
        if (!token.empty() && token.back() == '\r')
            token.pop_back();
        tokens.push_back(token);
    }
    return tokens;
}

} // namespace detail

/**
 * Load candles from CSV file
 *
 * Expected format (Binance kline dump, extra columns ignored):
 * open_time,open,high,low,close,volume[,...]
 */
inline std::vector<Candle> load_candles_csv(const std::string& filename) {
    std::vector<Candle> candles;
    std::ifstream file(filename);

    if (!file.is_open()) {
        throw std::runtime_error("Cannot open file: " + filename);
    }

    std::string line;
    bool first_line = true;
    size_t line_no = 0;

    while (std::getline(file, line)) {
        ++line_no;
        // Skip header if present
        if (first_line && (line.find("open_time") != std::string::npos || line.find("ts") == 0)) {
            first_line = false;
            continue;
        }
        first_line = false;

        if (line.empty() || line == "\r")
            continue;

        auto tokens = detail::split_csv_line(line);
        if (tokens.size() < 6) {
            throw std::runtime_error(filename + ":" + std::to_string(line_no) + ": expected 6 columns");
        }

        Candle c;
        try {
            c.ts = std::stoll(tokens[0]);
            c.open = std::stod(tokens[1]);
            c.high = std::stod(tokens[2]);
            c.low = std::stod(tokens[3]);
            c.close = std::stod(tokens[4]);
            c.volume = std::stod(tokens[5]);
        } catch (const std::logic_error&) {
            throw std::runtime_error(filename + ":" + std::to_string(line_no) + ": malformed number");
        }
        candles.push_back(c);
    }

    return candles;
}

/**
 * Save candles to CSV file
 */
inline void save_candles_csv(const std::string& filename, const std::vector<Candle>& candles) {
    std::ofstream file(filename);

    if (!file.is_open()) {
        throw std::runtime_error("Cannot create file: " + filename);
    }

    file << "open_time,open,high,low,close,volume\n";
    file << std::setprecision(12);
    for (const auto& c : candles) {
        file << c.ts << "," << c.open << "," << c.high << "," << c.low << "," << c.close << "," << c.volume << "\n";
    }
}

}  // namespace market
}  // namespace tradegate
