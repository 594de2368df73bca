#include "../../include/tradegate/services/ingest.hpp"
#include "../../include/tradegate/exchange/candle_synthesis.hpp"
#include "../../include/tradegate/util/time_utils.hpp"

#include <stdexcept>
#include <utility>
#include <vector>

namespace tradegate {
namespace services {

json IngestResult::to_json() const {
    return json{{"candles", candles},
                {"news_fetched", news_fetched},
                {"news_inserted", news_inserted},
                {"features_added", features_added},
                {"errors", errors}};
}

std::vector<news::NewsFeature> point_in_time_news(const store::IStore& store, const config::NewsConfig& config,
                                                  Timestamp now) {
    Timestamp start = now - static_cast<Timestamp>(config.sentiment_lookback_hours) * util::MS_PER_HOUR;
    news::NewsTimeline timeline(store.news_published_between(start, now), config.news_latency_seconds,
                                config.sentiment_lookback_hours);
    return timeline.visible_at(now);
}

std::vector<std::string> IngestService::symbols_for(const IngestParams& params) const {
    if (!params.symbol.empty())
        return {params.symbol};
    return settings_.trading.symbol_whitelist;
}

IngestResult IngestService::ingest_market(const IngestParams& params, Timestamp now) {
    IngestResult result;
    if (!market_) {
        result.errors.push_back("exchange client missing");
        store_.log_event("ingest", result.to_json(), now);
        return result;
    }

    struct Series {
        std::string symbol;
        std::string timeframe;
        std::vector<market::Candle> candles;
    };
    std::vector<Series> fetched;
    std::vector<std::pair<std::string, market::OrderbookTop>> books;

    // Network first; the store lock is only held for the writes below
    for (const auto& symbol : symbols_for(params)) {
        for (const auto& timeframe : settings_.trading.timeframes) {
            try {
                std::vector<market::Candle> candles;
                if (market_->has_ohlcv()) {
                    candles = market_->fetch_candles(symbol, timeframe, settings_.trading.candle_limit);
                } else {
                    auto frame_ms = exchange::timeframe_to_ms(timeframe);
                    if (!frame_ms) {
                        throw std::invalid_argument("unsupported timeframe " + timeframe);
                    }
                    auto trades = market_->fetch_trades(symbol, TRADE_FETCH_LIMIT);
                    candles = exchange::synthesize_candles(trades, *frame_ms);
                }
                fetched.push_back(Series{symbol, timeframe, std::move(candles)});
            } catch (const std::exception& e) {
                result.errors.push_back(symbol + " " + timeframe + ": " + e.what());
                TG_LOGF_WARN(logger_, Market, "candle ingest %s %s failed: %s", symbol.c_str(), timeframe.c_str(),
                             e.what());
            }
        }

        if (params.orderbook) {
            try {
                market::OrderbookTop top = market_->fetch_orderbook(symbol);
                if (top.ts == 0)
                    top.ts = now;
                books.emplace_back(symbol, top);
            } catch (const std::exception& e) {
                result.errors.push_back(symbol + " orderbook: " + e.what());
                TG_LOGF_WARN(logger_, Market, "orderbook ingest %s failed: %s", symbol.c_str(), e.what());
            }
        }
    }

    store_.transaction([&] {
        for (const auto& series : fetched)
            result.candles += store_.upsert_candles(series.symbol, series.timeframe, series.candles);
        for (const auto& [symbol, top] : books)
            store_.save_orderbook(symbol, top);
        store_.log_event("ingest", result.to_json(), now);
    });
    return result;
}

IngestResult IngestService::ingest_news(const IngestParams& params, Timestamp now) {
    IngestResult result;

    std::vector<news::NewsFeature> items;
    if (news_) {
        try {
            items = news_->fetch(now);
            result.news_fetched = items.size();
        } catch (const std::exception& e) {
            result.errors.push_back(std::string("news source ") + news_->name() + ": " + e.what());
            TG_LOGF_WARN(logger_, Market, "news fetch from %s failed: %s", news_->name(), e.what());
        }
    }

    store_.transaction([&] {
        for (const auto& item : items) {
            if (store_.insert_news(item))
                ++result.news_inserted;
        }

        auto visible = point_in_time_news(store_, settings_.news, now);
        news::FeatureVector features = news::aggregate_features(visible);
        for (const auto& symbol : symbols_for(params)) {
            news::FeatureRow row;
            row.symbol = symbol;
            row.ts = now;
            row.features_ref = news::make_features_ref(symbol, now);
            row.features = features;
            store_.save_feature_row(row);
            ++result.features_added;
        }

        store_.log_event("ingest", result.to_json(), now);
    });
    return result;
}

}  // namespace services
}  // namespace tradegate
