#include "../../include/tradegate/execution/paper_fill.hpp"

#include <algorithm>

namespace tradegate {
namespace execution {

market::OrderbookTop estimate_orderbook_from_price(double price, double spread_bps, Timestamp ts) {
    double half_spread = price * (spread_bps / 10000.0) / 2.0;
    market::OrderbookTop top;
    top.ts = ts;
    top.bid = std::max(price - half_spread, 0.0);
    top.ask = price + half_spread;
    top.bid_size = 1.0;
    top.ask_size = 1.0;
    return top;
}

PaperFill PaperFillModel::simulate(const intent::OrderIntent& intent, const market::OrderbookTop& book) {
    double slippage = config_.slippage_bps / 10000.0;
    double fee_rate = config_.fee_bps / 10000.0;

    auto filled_at = [&](double price, const char* message) {
        PaperFill fill;
        fill.filled = true;
        fill.price = price;
        fill.size = intent.size;
        fill.fee = price * intent.size * fee_rate;
        fill.status = IntentStatus::Filled;
        fill.message = message;
        return fill;
    };
    auto resting = [](const char* message) {
        PaperFill fill;
        fill.status = IntentStatus::Open;
        fill.message = message;
        return fill;
    };

    if (intent.side == Side::Hold) {
        PaperFill fill;
        fill.status = IntentStatus::Rejected;
        fill.message = "invalid side";
        return fill;
    }

    if (intent.side == Side::Buy && intent.price >= book.ask) {
        double price = std::min(intent.price, book.ask * (1.0 + slippage));
        if (price > intent.price)
            return resting("limit too low");
        return filled_at(price, "crossed spread");
    }
    if (intent.side == Side::Sell && intent.price <= book.bid) {
        double price = std::max(intent.price, book.bid * (1.0 - slippage));
        if (price < intent.price)
            return resting("limit too high");
        return filled_at(price, "crossed spread");
    }

    if (uniform_(rng_) < config_.fill_probability) {
        return filled_at(intent.price, "probabilistic fill");
    }
    return resting("not filled");
}

}  // namespace execution
}  // namespace tradegate
