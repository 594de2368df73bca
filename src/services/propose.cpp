#include "../../include/tradegate/services/propose.hpp"
#include "../../include/tradegate/risk/risk_engine.hpp"
#include "../../include/tradegate/services/ingest.hpp"
#include "../../include/tradegate/strategy/strategy_factory.hpp"
#include "../../include/tradegate/util/time_utils.hpp"

#include <algorithm>
#include <stdexcept>

namespace tradegate {
namespace services {

json ProposalOutcome::to_json() const {
    json j{{"status", proposal_status_to_string(status)}, {"reason", reason}, {"rationale", rationale}};
    if (intent) {
        j["intent_id"] = intent->intent_id;
        j["hash"] = intent_hash;
        j["side"] = side_to_string(intent->side);
        j["size"] = intent->size;
        j["price"] = intent->price;
        j["strategy"] = intent->strategy;
        j["confidence"] = intent->confidence;
        j["features_ref"] = intent->rationale_features_ref ? json(*intent->rationale_features_ref) : json(nullptr);
        j["expires_at"] = util::format_iso8601(intent->expires_at);
    }
    return j;
}

strategy::TradePlan ProposalService::apply_maker_hint(const strategy::TradePlan& plan) {
    if (plan.is_hold() || !settings_.trading.post_only || !client_ || client_->has_post_only())
        return plan;

    strategy::TradePlan hinted = plan;
    try {
        market::OrderbookTop top = client_->fetch_orderbook(plan.symbol);
        if (plan.side == Side::Buy && top.bid > 0) {
            hinted.price = std::min(plan.price, top.bid);
            hinted.rationale += "; maker price at bid";
        } else if (plan.side == Side::Sell && top.ask > 0) {
            hinted.price = std::max(plan.price, top.ask);
            hinted.rationale += "; maker price at ask";
        }
    } catch (const std::exception& e) {
        TG_LOGF_WARN(logger_, Market, "maker price hint for %s unavailable: %s", plan.symbol.c_str(), e.what());
        return plan;
    }
    return hinted;
}

ProposalCandidate ProposalService::prepare(const ProposeParams& params, Timestamp now) {
    auto strat = strategy::StrategyFactory::create(params.strategy, settings_);

    const std::string symbol = params.symbol.empty() ? settings_.trading.symbol_whitelist.front() : params.symbol;
    const std::string& timeframe = settings_.trading.primary_timeframe();

    if (params.refresh && client_) {
        auto fresh = client_->fetch_candles(symbol, timeframe, settings_.trading.candle_limit);
        store_.upsert_candles(symbol, timeframe, fresh);
    }

    auto candles = store_.recent_candles(symbol, timeframe, static_cast<size_t>(settings_.trading.candle_limit));
    if (candles.empty()) {
        throw std::runtime_error("no candles available; run ingest first");
    }
    const Timestamp latest_ts = candles.back().ts;

    auto visible = point_in_time_news(store_, settings_.news, now);
    news::FeatureRow row;
    row.symbol = symbol;
    row.ts = latest_ts;
    row.features_ref = news::make_features_ref(symbol, latest_ts);
    row.features = news::aggregate_features(visible);

    strategy::TradePlan plan = strat->generate_plan(symbol, candles, row.features);
    plan = apply_maker_hint(plan);

    risk::RiskDecision decision;
    store_.transaction([&] {
        store_.save_feature_row(row);

        risk::RiskContext ctx;
        risk::RiskSnapshot snap = store_.risk_snapshot(symbol, util::utc_day(now));
        ctx.position = snap.position;
        ctx.state = risk::RiskState::from_storage_snapshot(snap, candles.back().close, util::utc_day(now));
        ctx.now = now;
        if (candles.size() >= 2)
            ctx.prev_close = candles[candles.size() - 2].close;
        ctx.last_close = candles.back().close;

        risk::RiskEngine engine(settings_.risk, settings_.trading);
        decision = engine.evaluate(plan, ctx);

        store_.log_event("risk_check",
                         {{"symbol", plan.symbol},
                          {"strategy", plan.strategy},
                          {"side", side_to_string(plan.side)},
                          {"status", decision.approved ? "approved" : "rejected"},
                          {"reason", decision.reason},
                          {"original_size", plan.size},
                          {"adjusted_size", decision.plan ? decision.plan->size : 0.0}},
                         now);
    });

    ProposalCandidate candidate;
    candidate.features_ref = row.features_ref;
    candidate.reason = decision.reason;
    if (decision.approved && decision.plan) {
        candidate.status = ProposalStatus::Proposed;
        candidate.plan = decision.plan;
    } else if (decision.plan && decision.plan->is_hold()) {
        candidate.status = ProposalStatus::Hold;
        candidate.plan = decision.plan;
    } else {
        candidate.status = ProposalStatus::Rejected;
    }

    TG_LOGF_INFO(logger_, Risk, "proposal %s %s: %s (%s)", symbol.c_str(), side_to_string(plan.side),
                 proposal_status_to_string(candidate.status), decision.reason.c_str());
    return candidate;
}

ProposalOutcome ProposalService::finalize(const ProposalCandidate& candidate, const ProposeParams& params,
                                          Timestamp now) {
    ProposalOutcome outcome;
    outcome.status = candidate.status;
    outcome.reason = candidate.reason;
    if (candidate.plan)
        outcome.rationale = candidate.plan->rationale;

    if (candidate.status != ProposalStatus::Proposed || !candidate.plan)
        return outcome;

    std::optional<std::string> features_ref;
    if (!candidate.features_ref.empty())
        features_ref = candidate.features_ref;
    intent::OrderIntent created =
        intent::from_plan(*candidate.plan, params.mode, settings_.trading.intent_expiry_seconds, features_ref, now);
    intent::IntentRecord record = intent::IntentRecord::create(created);
    store_.transaction([&] {
        store_.insert_intent(record);
        store_.log_event("propose",
                         {{"intent_id", created.intent_id},
                          {"symbol", created.symbol},
                          {"side", side_to_string(created.side)}},
                         now);
    });

    outcome.intent = created;
    outcome.intent_hash = record.intent_hash;

    TG_LOGF_INFO(logger_, Intent, "intent %s proposed: %s %.8f %s @ %.8f", created.intent_id.c_str(),
                 side_to_string(created.side), created.size, created.symbol.c_str(), created.price);
    return outcome;
}

}  // namespace services
}  // namespace tradegate
