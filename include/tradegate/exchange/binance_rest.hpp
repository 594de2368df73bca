#pragma once

#include "market_client.hpp"

#include <curl/curl.h>
#include <nlohmann/json.hpp>

#include <map>
#include <string>

namespace tradegate {
namespace exchange {

using json = nlohmann::json;

/**
 * Binance spot REST client
 *
 * Uses libcurl for HTTP requests. Signed endpoints append timestamp and an
 * HMAC-SHA256 signature of the query string, with the API key in the
 * X-MBX-APIKEY header.
 *
 * Symbols are taken in "BASE/QUOTE" form and sent as "BASEQUOTE".
 */
class BinanceRestClient : public IMarketClient {
public:
    // API base URLs
    static constexpr const char* MAINNET = "https://api.binance.com";
    static constexpr const char* TESTNET = "https://testnet.binance.vision";

    static constexpr long HTTP_TIMEOUT_SECONDS = 30;
    static constexpr int RECV_WINDOW_MS = 5000;

    /**
     * @param base_url Override (empty = mainnet or testnet)
     * @param api_key / api_secret Empty for public endpoints only
     */
    BinanceRestClient(std::string base_url, bool use_testnet, std::string api_key, std::string api_secret);
    ~BinanceRestClient() override;

    BinanceRestClient(const BinanceRestClient&) = delete;
    BinanceRestClient& operator=(const BinanceRestClient&) = delete;

    const char* name() const override { return "binance"; }
    bool has_post_only() const override { return true; }  // LIMIT_MAKER
    bool has_ohlcv() const override { return true; }

    std::vector<market::Candle> fetch_candles(const std::string& symbol, const std::string& timeframe,
                                              int limit) override;
    std::vector<market::MarketTrade> fetch_trades(const std::string& symbol, int limit) override;
    market::OrderbookTop fetch_orderbook(const std::string& symbol) override;
    std::optional<double> price_tick(const std::string& symbol) override;

    OrderAck create_limit_order(const std::string& symbol, Side side, double amount, double price,
                                bool post_only) override;
    OrderInfo fetch_order(const std::string& order_id, const std::string& symbol) override;
    void cancel_order(const std::string& order_id, const std::string& symbol) override;

    Timestamp server_time() override;

    // "BTC/USDT" -> "BTCUSDT"
    static std::string to_exchange_symbol(const std::string& symbol);

    // Binance order status -> "open" / "closed" / "canceled"
    static std::string normalize_status(const std::string& status);

    static OrderInfo parse_order(const json& data);

private:
    std::string base_url_;
    std::string api_key_;
    std::string api_secret_;
    CURL* curl_;
    std::map<std::string, double> tick_cache_;

    static size_t write_callback(void* contents, size_t size, size_t nmemb, std::string* output);

    std::string http_request(const std::string& method, const std::string& url, bool with_key);
    std::string http_get(const std::string& path_and_query);
    std::string signed_request(const std::string& method, const std::string& path, const std::string& query);
};

}  // namespace exchange
}  // namespace tradegate
