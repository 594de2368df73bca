#pragma once

#include "../config/settings.hpp"
#include "../market/market_data.hpp"

#include <nlohmann/json.hpp>

#include <optional>

namespace tradegate {
namespace execution {

struct MakerQuote {
    double price = 0;
    nlohmann::json details = nlohmann::json::object();
};

/**
 * Post-only price emulation for venues without native post-only orders.
 *
 * buy:  min(limit, bid); if that still reaches the ask, bid - pad
 * sell: max(limit, ask); if that still reaches the bid, ask + pad
 * pad = tick when known and use_tick is set, otherwise base * buffer_bps / 10000,
 * where base is the bid (or ask, or limit when the book is empty).
 *
 * A side of the book at 0 is treated as missing and leaves the limit unchanged.
 */
MakerQuote emulate_post_only_price(Side side, double limit_price, const market::OrderbookTop& book,
                                   std::optional<double> tick, const config::MakerEmulationConfig& config);

}  // namespace execution
}  // namespace tradegate
