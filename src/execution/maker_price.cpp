#include "../../include/tradegate/execution/maker_price.hpp"

#include <algorithm>

namespace tradegate {
namespace execution {

MakerQuote emulate_post_only_price(Side side, double limit_price, const market::OrderbookTop& book,
                                   std::optional<double> tick, const config::MakerEmulationConfig& config) {
    MakerQuote quote;
    quote.details["maker_emulation"] = true;
    quote.details["requested_price"] = limit_price;

    double bid = book.bid;
    double ask = book.ask;
    double base = bid > 0 ? bid : (ask > 0 ? ask : limit_price);
    double buffer = base * (config.buffer_bps / 10000.0);
    double pad = (config.use_tick && tick && *tick > 0) ? *tick : buffer;

    double price = limit_price;
    if (side == Side::Buy && bid > 0) {
        price = std::min(price, bid);
        if (ask > 0 && price >= ask)
            price = std::max(bid - pad, 0.0);
    } else if (side == Side::Sell && ask > 0) {
        price = std::max(price, ask);
        if (bid > 0 && price <= bid)
            price = ask + pad;
    }

    quote.price = price;
    quote.details["best_bid"] = bid;
    quote.details["best_ask"] = ask;
    quote.details["tick_size"] = tick ? nlohmann::json(*tick) : nlohmann::json(nullptr);
    quote.details["placed_price"] = price;
    return quote;
}

}  // namespace execution
}  // namespace tradegate
