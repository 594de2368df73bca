#include "../../include/tradegate/exchange/candle_synthesis.hpp"
#include "../../include/tradegate/util/time_utils.hpp"

#include <algorithm>
#include <map>

namespace tradegate {
namespace exchange {

std::optional<int64_t> timeframe_to_ms(const std::string& timeframe) {
    if (timeframe.size() < 2)
        return std::nullopt;

    int64_t count = 0;
    for (size_t i = 0; i + 1 < timeframe.size(); ++i) {
        char c = timeframe[i];
        if (c < '0' || c > '9')
            return std::nullopt;
        count = count * 10 + (c - '0');
    }
    if (count <= 0)
        return std::nullopt;

    switch (timeframe.back()) {
    case 's':
        return count * util::MS_PER_SECOND;
    case 'm':
        return count * util::MS_PER_MINUTE;
    case 'h':
        return count * util::MS_PER_HOUR;
    case 'd':
        return count * util::MS_PER_DAY;
    case 'w':
        return count * 7 * util::MS_PER_DAY;
    default:
        return std::nullopt;
    }
}

std::vector<market::Candle> synthesize_candles(std::span<const market::MarketTrade> trades, int64_t timeframe_ms) {
    std::vector<market::MarketTrade> sorted(trades.begin(), trades.end());
    std::stable_sort(sorted.begin(), sorted.end(),
                     [](const market::MarketTrade& a, const market::MarketTrade& b) { return a.ts < b.ts; });

    std::map<Timestamp, market::Candle> buckets;
    for (const auto& t : sorted) {
        if (t.price <= 0)
            continue;
        Timestamp bucket = util::floor_div(t.ts, timeframe_ms) * timeframe_ms;
        auto it = buckets.find(bucket);
        if (it == buckets.end()) {
            market::Candle c;
            c.ts = bucket;
            c.open = c.high = c.low = c.close = t.price;
            c.volume = t.quantity;
            buckets.emplace(bucket, c);
        } else {
            auto& c = it->second;
            c.high = std::max(c.high, t.price);
            c.low = std::min(c.low, t.price);
            c.close = t.price;
            c.volume += t.quantity;
        }
    }

    std::vector<market::Candle> out;
    out.reserve(buckets.size());
    for (const auto& [ts, c] : buckets)
        out.push_back(c);
    return out;
}

}  // namespace exchange
}  // namespace tradegate
