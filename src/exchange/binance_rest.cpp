#include "../../include/tradegate/exchange/binance_rest.hpp"
#include "../../include/tradegate/util/crypto.hpp"
#include "../../include/tradegate/util/time_utils.hpp"

#include <cctype>
#include <cstdlib>
#include <iomanip>
#include <sstream>
#include <stdexcept>

namespace tradegate {
namespace exchange {

namespace {

std::string format_decimal(double value) {
    std::ostringstream ss;
    ss << std::fixed << std::setprecision(8) << value;
    std::string s = ss.str();
    // Trim trailing zeros, keep at least one digit after the point
    auto dot = s.find('.');
    if (dot != std::string::npos) {
        while (s.size() > dot + 2 && s.back() == '0')
            s.pop_back();
    }
    return s;
}

double as_double(const json& j) {
    if (j.is_string())
        return std::stod(j.get<std::string>());
    return j.get<double>();
}

std::string env_or_empty(const std::string& name) {
    const char* value = name.empty() ? nullptr : std::getenv(name.c_str());
    return value ? value : "";
}

}  // namespace

// =============================================================================
// Factory
// =============================================================================

bool has_credentials(const config::ExchangeConfig& config) {
    return !env_or_empty(config.api_key_env).empty() && !env_or_empty(config.api_secret_env).empty();
}

std::unique_ptr<IMarketClient> make_market_client(const config::ExchangeConfig& config) {
    if (config.name == "binance") {
        return std::make_unique<BinanceRestClient>(config.base_url, config.use_testnet,
                                                   env_or_empty(config.api_key_env),
                                                   env_or_empty(config.api_secret_env));
    }
    throw std::invalid_argument("Unsupported exchange: " + config.name);
}

// =============================================================================
// BinanceRestClient
// =============================================================================

BinanceRestClient::BinanceRestClient(std::string base_url, bool use_testnet, std::string api_key,
                                     std::string api_secret)
    : base_url_(base_url.empty() ? (use_testnet ? TESTNET : MAINNET) : std::move(base_url)),
      api_key_(std::move(api_key)), api_secret_(std::move(api_secret)), curl_(nullptr) {
    curl_global_init(CURL_GLOBAL_DEFAULT);
    curl_ = curl_easy_init();
    if (!curl_) {
        curl_global_cleanup();
        throw std::runtime_error("Failed to initialize CURL");
    }
}

BinanceRestClient::~BinanceRestClient() {
    if (curl_) {
        curl_easy_cleanup(curl_);
    }
    curl_global_cleanup();
}

std::string BinanceRestClient::to_exchange_symbol(const std::string& symbol) {
    std::string out;
    out.reserve(symbol.size());
    for (char c : symbol) {
        if (c != '/')
            out.push_back(static_cast<char>(std::toupper(static_cast<unsigned char>(c))));
    }
    return out;
}

std::string BinanceRestClient::normalize_status(const std::string& status) {
    if (status == "FILLED")
        return "closed";
    if (status == "CANCELED" || status == "EXPIRED" || status == "REJECTED" || status == "EXPIRED_IN_MATCH")
        return "canceled";
    return "open";  // NEW, PARTIALLY_FILLED, PENDING_CANCEL
}

OrderInfo BinanceRestClient::parse_order(const json& data) {
    OrderInfo info;
    if (data.contains("orderId"))
        info.order_id = std::to_string(data["orderId"].get<int64_t>());
    info.status = normalize_status(data.value("status", std::string("NEW")));
    if (data.contains("executedQty"))
        info.filled = as_double(data["executedQty"]);
    if (data.contains("price"))
        info.price = as_double(data["price"]);
    if (info.filled > 0 && data.contains("cummulativeQuoteQty")) {
        double quote = as_double(data["cummulativeQuoteQty"]);
        info.average = quote / info.filled;
    }
    return info;
}

size_t BinanceRestClient::write_callback(void* contents, size_t size, size_t nmemb, std::string* output) {
    size_t total_size = size * nmemb;
    output->append(static_cast<char*>(contents), total_size);
    return total_size;
}

std::string BinanceRestClient::http_request(const std::string& method, const std::string& url, bool with_key) {
    std::string response;

    curl_easy_reset(curl_);
    curl_easy_setopt(curl_, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl_, CURLOPT_WRITEFUNCTION, write_callback);
    curl_easy_setopt(curl_, CURLOPT_WRITEDATA, &response);
    curl_easy_setopt(curl_, CURLOPT_TIMEOUT, HTTP_TIMEOUT_SECONDS);
    curl_easy_setopt(curl_, CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(curl_, CURLOPT_SSL_VERIFYPEER, 1L);
    curl_easy_setopt(curl_, CURLOPT_SSL_VERIFYHOST, 2L);
    if (method != "GET")
        curl_easy_setopt(curl_, CURLOPT_CUSTOMREQUEST, method.c_str());

    struct curl_slist* headers = nullptr;
    if (with_key) {
        headers = curl_slist_append(headers, ("X-MBX-APIKEY: " + api_key_).c_str());
        curl_easy_setopt(curl_, CURLOPT_HTTPHEADER, headers);
    }

    CURLcode res = curl_easy_perform(curl_);
    long http_code = 0;
    curl_easy_getinfo(curl_, CURLINFO_RESPONSE_CODE, &http_code);
    if (headers)
        curl_slist_free_all(headers);

    if (res != CURLE_OK) {
        throw std::runtime_error(std::string("CURL error: ") + curl_easy_strerror(res));
    }
    if (http_code != 200) {
        throw std::runtime_error("HTTP error " + std::to_string(http_code) + ": " + response);
    }
    return response;
}

std::string BinanceRestClient::http_get(const std::string& path_and_query) {
    return http_request("GET", base_url_ + path_and_query, false);
}

std::string BinanceRestClient::signed_request(const std::string& method, const std::string& path,
                                              const std::string& query) {
    if (api_key_.empty() || api_secret_.empty()) {
        throw std::runtime_error("missing API credentials");
    }
    std::string full = query;
    if (!full.empty())
        full += "&";
    full += "recvWindow=" + std::to_string(RECV_WINDOW_MS) + "&timestamp=" + std::to_string(util::wall_clock_ms());
    full += "&signature=" + util::hmac_sha256_hex(api_secret_, full);
    return http_request(method, base_url_ + path + "?" + full, true);
}

// =============================================================================
// Market data
// =============================================================================

std::vector<market::Candle> BinanceRestClient::fetch_candles(const std::string& symbol, const std::string& timeframe,
                                                             int limit) {
    std::stringstream url;
    url << "/api/v3/klines?symbol=" << to_exchange_symbol(symbol) << "&interval=" << timeframe
        << "&limit=" << limit;

    json data = json::parse(http_get(url.str()));
    std::vector<market::Candle> candles;
    for (const auto& arr : data) {
        if (!arr.is_array() || arr.size() < 6)
            continue;
        market::Candle c;
        c.ts = arr[0].get<Timestamp>();
        c.open = as_double(arr[1]);
        c.high = as_double(arr[2]);
        c.low = as_double(arr[3]);
        c.close = as_double(arr[4]);
        c.volume = as_double(arr[5]);
        candles.push_back(c);
    }
    return candles;
}

std::vector<market::MarketTrade> BinanceRestClient::fetch_trades(const std::string& symbol, int limit) {
    std::string path = "/api/v3/trades?symbol=" + to_exchange_symbol(symbol) + "&limit=" + std::to_string(limit);
    json data = json::parse(http_get(path));

    std::vector<market::MarketTrade> trades;
    for (const auto& t : data) {
        market::MarketTrade trade;
        trade.ts = t.at("time").get<Timestamp>();
        trade.price = as_double(t.at("price"));
        trade.quantity = as_double(t.at("qty"));
        trades.push_back(trade);
    }
    return trades;
}

market::OrderbookTop BinanceRestClient::fetch_orderbook(const std::string& symbol) {
    std::string path = "/api/v3/depth?symbol=" + to_exchange_symbol(symbol) + "&limit=5";
    json data = json::parse(http_get(path));

    market::OrderbookTop top;
    top.ts = util::wall_clock_ms();
    if (data.contains("bids") && !data["bids"].empty()) {
        top.bid = as_double(data["bids"][0][0]);
        top.bid_size = as_double(data["bids"][0][1]);
    }
    if (data.contains("asks") && !data["asks"].empty()) {
        top.ask = as_double(data["asks"][0][0]);
        top.ask_size = as_double(data["asks"][0][1]);
    }
    return top;
}

std::optional<double> BinanceRestClient::price_tick(const std::string& symbol) {
    std::string ex_symbol = to_exchange_symbol(symbol);
    auto cached = tick_cache_.find(ex_symbol);
    if (cached != tick_cache_.end())
        return cached->second;

    json info = json::parse(http_get("/api/v3/exchangeInfo?symbol=" + ex_symbol));
    if (!info.contains("symbols") || info["symbols"].empty())
        return std::nullopt;

    for (const auto& filter : info["symbols"][0].value("filters", json::array())) {
        if (filter.value("filterType", std::string()) == "PRICE_FILTER" && filter.contains("tickSize")) {
            double tick = as_double(filter["tickSize"]);
            if (tick > 0) {
                tick_cache_[ex_symbol] = tick;
                return tick;
            }
        }
    }
    return std::nullopt;
}

Timestamp BinanceRestClient::server_time() {
    json data = json::parse(http_get("/api/v3/time"));
    if (!data.contains("serverTime")) {
        throw std::runtime_error("Invalid server time response");
    }
    return data["serverTime"].get<Timestamp>();
}

// =============================================================================
// Orders
// =============================================================================

OrderAck BinanceRestClient::create_limit_order(const std::string& symbol, Side side, double amount, double price,
                                               bool post_only) {
    if (side == Side::Hold) {
        throw std::invalid_argument("cannot place a hold order");
    }

    std::string query = "symbol=" + to_exchange_symbol(symbol) + "&side=" + (side == Side::Buy ? "BUY" : "SELL") +
                        "&type=" + (post_only ? "LIMIT_MAKER" : "LIMIT") + "&quantity=" + format_decimal(amount) +
                        "&price=" + format_decimal(price);
    if (!post_only)
        query += "&timeInForce=GTC";

    json data = json::parse(signed_request("POST", "/api/v3/order", query));
    OrderInfo info = parse_order(data);
    if (info.order_id.empty()) {
        throw std::runtime_error("order response missing orderId");
    }
    return OrderAck{info.order_id, info.status};
}

OrderInfo BinanceRestClient::fetch_order(const std::string& order_id, const std::string& symbol) {
    std::string query = "symbol=" + to_exchange_symbol(symbol) + "&orderId=" + order_id;
    return parse_order(json::parse(signed_request("GET", "/api/v3/order", query)));
}

void BinanceRestClient::cancel_order(const std::string& order_id, const std::string& symbol) {
    std::string query = "symbol=" + to_exchange_symbol(symbol) + "&orderId=" + order_id;
    signed_request("DELETE", "/api/v3/order", query);
}

}  // namespace exchange
}  // namespace tradegate
