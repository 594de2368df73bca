#pragma once

#include "../config/settings.hpp"
#include "../exchange/market_client.hpp"
#include "../logging/async_logger.hpp"
#include "../news/news_features.hpp"
#include "../store/store.hpp"

#include <nlohmann/json.hpp>

#include <string>
#include <vector>

namespace tradegate {
namespace services {

using json = nlohmann::json;

struct IngestParams {
    std::string symbol;  // empty = every whitelisted symbol
    bool orderbook = false;
};

struct IngestResult {
    size_t candles = 0;
    size_t news_fetched = 0;
    size_t news_inserted = 0;
    size_t features_added = 0;
    std::vector<std::string> errors;

    bool ok() const { return errors.empty(); }
    json to_json() const;
};

/**
 * News usable at `now`: available (observed and past the latency) and
 * published within the sentiment lookback.
 */
std::vector<news::NewsFeature> point_in_time_news(const store::IStore& store, const config::NewsConfig& config,
                                                  Timestamp now);

/**
 * IngestService - pulls market data and news into the store
 *
 * Per-symbol failures are collected in IngestResult::errors rather than
 * thrown, so one bad symbol does not hide the others. Each call records an
 * "ingest" audit event.
 */
class IngestService {
public:
    IngestService(const config::Settings& settings, store::IStore& store, exchange::IMarketClient* market,
                  news::INewsSource* news)
        : settings_(settings), store_(store), market_(market), news_(news) {}

    /**
     * Candles for every (symbol, timeframe), synthesized from trades when the
     * exchange has no OHLCV endpoint; optionally the top of book.
     */
    IngestResult ingest_market(const IngestParams& params, Timestamp now);

    /**
     * New news items from the source, then one feature row per symbol at now.
     */
    IngestResult ingest_news(const IngestParams& params, Timestamp now);

    void set_logger(logging::AsyncLogger* logger) { logger_ = logger; }

    static constexpr int TRADE_FETCH_LIMIT = 1000;

private:
    const config::Settings& settings_;
    store::IStore& store_;
    exchange::IMarketClient* market_;
    news::INewsSource* news_;
    logging::AsyncLogger* logger_ = nullptr;

    std::vector<std::string> symbols_for(const IngestParams& params) const;
};

}  // namespace services
}  // namespace tradegate
