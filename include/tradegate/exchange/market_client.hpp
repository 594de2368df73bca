#pragma once

#include "../config/settings.hpp"
#include "../market/market_data.hpp"
#include "../types.hpp"

#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace tradegate {
namespace exchange {

/**
 * Acknowledgement of a placed order
 */
struct OrderAck {
    std::string order_id;
    std::string status;
};

/**
 * Order state as polled from the exchange
 *
 * status is normalized to "open", "closed" (fully filled) or "canceled".
 */
struct OrderInfo {
    std::string order_id;
    std::string status = "open";
    double filled = 0;
    double average = 0;  // 0 when unknown
    double price = 0;
};

/**
 * Exchange binding used by ingest and live execution
 *
 * All calls may throw std::runtime_error on transport or API failure.
 */
class IMarketClient {
public:
    virtual ~IMarketClient() = default;

    virtual const char* name() const = 0;
    virtual bool has_post_only() const = 0;
    virtual bool has_ohlcv() const = 0;

    virtual std::vector<market::Candle> fetch_candles(const std::string& symbol, const std::string& timeframe,
                                                      int limit) = 0;
    virtual std::vector<market::MarketTrade> fetch_trades(const std::string& symbol, int limit) = 0;
    virtual market::OrderbookTop fetch_orderbook(const std::string& symbol) = 0;

    // Minimum price increment, if the exchange reports one
    virtual std::optional<double> price_tick(const std::string& symbol) = 0;

    virtual OrderAck create_limit_order(const std::string& symbol, Side side, double amount, double price,
                                        bool post_only) = 0;
    virtual OrderInfo fetch_order(const std::string& order_id, const std::string& symbol) = 0;
    virtual void cancel_order(const std::string& order_id, const std::string& symbol) = 0;

    virtual Timestamp server_time() = 0;
};

/**
 * Build the client named in config.
 *
 * @throws std::invalid_argument for an unsupported exchange name
 */
std::unique_ptr<IMarketClient> make_market_client(const config::ExchangeConfig& config);

// Credentials present in the configured environment variables
bool has_credentials(const config::ExchangeConfig& config);

}  // namespace exchange
}  // namespace tradegate
