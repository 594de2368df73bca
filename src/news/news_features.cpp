#include "../../include/tradegate/news/news_features.hpp"
#include "../../include/tradegate/util/time_utils.hpp"

#include <algorithm>
#include <cmath>
#include <fstream>
#include <sstream>
#include <stdexcept>

namespace tradegate {
namespace news {

std::string make_features_ref(const std::string& symbol, Timestamp ts) {
    return symbol + ":" + std::to_string(ts) + ":news_v1";
}

FeatureVector aggregate_features(std::span<const NewsFeature> items) {
    FeatureVector fv;
    double weighted = 0;
    double weight_abs = 0;
    double weight_sum = 0;

    for (const auto& item : items) {
        weighted += item.sentiment * item.source_weight;
        weight_abs += std::abs(item.source_weight);
        weight_sum += item.source_weight;
        if (item.sentiment > 0)
            ++fv.positive_count;
        else if (item.sentiment < 0)
            ++fv.negative_count;
    }

    fv.news_count = static_cast<int>(items.size());
    fv.sentiment_weighted = weighted / std::max(weight_abs, 1.0);
    fv.avg_source_weight = items.empty() ? 0.0 : weight_sum / static_cast<double>(items.size());
    return fv;
}

// =============================================================================
// NewsTimeline
// =============================================================================

NewsTimeline::NewsTimeline(std::vector<NewsFeature> items, int latency_seconds, int lookback_hours)
    : lookback_ms_(static_cast<Timestamp>(lookback_hours) * util::MS_PER_HOUR) {
    items_.reserve(items.size());
    for (auto& item : items) {
        Timestamp avail = available_at(item, latency_seconds);
        items_.push_back(Entry{avail, std::move(item)});
    }
    std::stable_sort(items_.begin(), items_.end(), [](const Entry& a, const Entry& b) {
        if (a.available_at != b.available_at)
            return a.available_at < b.available_at;
        return a.item.id < b.item.id;
    });
}

std::vector<NewsFeature> NewsTimeline::visible_at(Timestamp t) const {
    std::vector<NewsFeature> out;
    Timestamp start = t - lookback_ms_;
    for (const auto& e : items_) {
        if (e.available_at > t)
            break;
        if (e.item.published_at >= start && e.item.published_at <= t)
            out.push_back(e.item);
    }
    return out;
}

FeatureVector NewsTimeline::features_at(Timestamp t) const {
    auto visible = visible_at(t);
    return aggregate_features(visible);
}

// =============================================================================
// CSV
// =============================================================================

namespace {

Timestamp parse_time_field(const std::string& text, const std::string& where) {
    if (!text.empty() && std::all_of(text.begin(), text.end(), [](char c) { return c >= '0' && c <= '9'; })) {
        return std::stoll(text);
    }
    auto ts = util::parse_iso8601(text);
    if (!ts)
        throw std::runtime_error(where + ": bad timestamp '" + text + "'");
    return *ts;
}

}  // namespace

std::vector<NewsFeature> load_news_csv(const std::string& filename, const config::NewsConfig& config) {
    std::vector<NewsFeature> items;
    std::ifstream file(filename);

    if (!file.is_open()) {
        throw std::runtime_error("Cannot open file: " + filename);
    }

    std::string line;
    size_t line_no = 0;
    while (std::getline(file, line)) {
        ++line_no;
        if (!line.empty() && line.back() == '\r')
            line.pop_back();
        if (line.empty())
            continue;
        if (line_no == 1 && line.rfind("id,", 0) == 0)
            continue;

        std::vector<std::string> tokens;
        std::stringstream ss(line);
        std::string token;
        while (std::getline(ss, token, ','))
            tokens.push_back(token);

        std::string where = filename + ":" + std::to_string(line_no);
        if (tokens.size() < 5)
            throw std::runtime_error(where + ": expected at least 5 columns");

        NewsFeature item;
        item.id = tokens[0];
        item.source = tokens[1];
        item.published_at = parse_time_field(tokens[2], where);
        item.observed_at = parse_time_field(tokens[3], where);
        try {
            item.sentiment = std::stod(tokens[4]);
            item.source_weight = (tokens.size() > 5 && !tokens[5].empty()) ? std::stod(tokens[5])
                                                                            : config.weight_for(item.source);
        } catch (const std::logic_error&) {
            throw std::runtime_error(where + ": malformed number");
        }
        for (size_t i = 6; i < tokens.size(); ++i) {
            if (i > 6)
                item.title += ",";
            item.title += tokens[i];
        }
        items.push_back(std::move(item));
    }
    return items;
}

std::vector<NewsFeature> CsvNewsSource::fetch(Timestamp now) {
    auto all = load_news_csv(path_, config_);
    std::vector<NewsFeature> out;
    for (auto& item : all) {
        if (item.observed_at <= now)
            out.push_back(std::move(item));
    }
    return out;
}

}  // namespace news
}  // namespace tradegate
