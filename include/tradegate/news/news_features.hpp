#pragma once

#include "../config/settings.hpp"
#include "../types.hpp"

#include <span>
#include <string>
#include <vector>

namespace tradegate {
namespace news {

/**
 * A news item with its extracted sentiment
 *
 * published_at: when the source says it was published
 * observed_at:  when this system first saw it
 */
struct NewsFeature {
    std::string id;
    std::string source;
    std::string title;
    double sentiment = 0;      // [-1, 1]
    double source_weight = 1.0;
    Timestamp published_at = 0;
    Timestamp observed_at = 0;
};

/**
 * Aggregate sentiment over a window of news
 */
struct FeatureVector {
    double sentiment_weighted = 0;
    int news_count = 0;
    int positive_count = 0;
    int negative_count = 0;
    double avg_source_weight = 0;
};

/**
 * Persisted feature snapshot used for a proposal or a backtest step
 */
struct FeatureRow {
    std::string symbol;
    Timestamp ts = 0;
    std::string features_ref;
    FeatureVector features;
};

// Earliest instant the item may influence a decision
inline Timestamp available_at(const NewsFeature& item, int latency_seconds) {
    Timestamp delayed = item.published_at + static_cast<Timestamp>(latency_seconds) * 1000;
    return item.observed_at > delayed ? item.observed_at : delayed;
}

// "<symbol>:<ts_ms>:news_v1"
std::string make_features_ref(const std::string& symbol, Timestamp ts);

FeatureVector aggregate_features(std::span<const NewsFeature> items);

/**
 * Point-in-time view over a news set.
 *
 * Items are ordered by availability once at construction; visible_at(T)
 * returns only items available at T whose published_at lies in
 * [T - lookback, T]. Nothing published after T, or observed after T, leaks in.
 */
class NewsTimeline {
public:
    NewsTimeline(std::vector<NewsFeature> items, int latency_seconds, int lookback_hours);

    std::vector<NewsFeature> visible_at(Timestamp t) const;
    FeatureVector features_at(Timestamp t) const;

    size_t size() const { return items_.size(); }

private:
    struct Entry {
        Timestamp available_at;
        NewsFeature item;
    };

    std::vector<Entry> items_;
    Timestamp lookback_ms_;
};

/**
 * Load news items from CSV
 *
 * Format: id,source,published_at,observed_at,sentiment[,source_weight[,title...]]
 * Timestamps are ISO-8601 or integer milliseconds. A missing source_weight
 * takes the configured weight for the source.
 */
std::vector<NewsFeature> load_news_csv(const std::string& filename, const config::NewsConfig& config);

/**
 * News collaborator: returns items with sentiment already extracted
 */
class INewsSource {
public:
    virtual ~INewsSource() = default;

    virtual std::vector<NewsFeature> fetch(Timestamp now) = 0;
    virtual const char* name() const = 0;
};

/**
 * Reads a CSV file on each fetch; items observed after now are withheld
 */
class CsvNewsSource : public INewsSource {
public:
    CsvNewsSource(std::string path, config::NewsConfig config)
        : path_(std::move(path)), config_(std::move(config)) {}

    std::vector<NewsFeature> fetch(Timestamp now) override;
    const char* name() const override { return "csv"; }

private:
    std::string path_;
    config::NewsConfig config_;
};

}  // namespace news
}  // namespace tradegate
