#pragma once

#include "../config/settings.hpp"
#include "../exchange/market_client.hpp"
#include "../intent/order_intent.hpp"
#include "../logging/async_logger.hpp"
#include "../store/store.hpp"
#include "../strategy/trade_plan.hpp"

#include <nlohmann/json.hpp>

#include <optional>
#include <string>

namespace tradegate {
namespace services {

using json = nlohmann::json;

struct ProposeParams {
    std::string symbol;  // empty = first whitelisted symbol
    std::string strategy = "baseline";
    TradingMode mode = TradingMode::Paper;
    bool refresh = false;  // pull fresh candles before proposing
};

enum class ProposalStatus : uint8_t { Proposed, Hold, Rejected };

inline const char* proposal_status_to_string(ProposalStatus status) {
    switch (status) {
    case ProposalStatus::Proposed:
        return "proposed";
    case ProposalStatus::Hold:
        return "hold";
    case ProposalStatus::Rejected:
        return "rejected";
    }
    return "rejected";
}

/**
 * A risk-checked plan that has not been frozen into an intent yet
 */
struct ProposalCandidate {
    ProposalStatus status = ProposalStatus::Rejected;
    std::optional<strategy::TradePlan> plan;  // set for Proposed and Hold
    std::string features_ref;
    std::string reason;
};

struct ProposalOutcome {
    ProposalStatus status = ProposalStatus::Rejected;
    std::optional<intent::OrderIntent> intent;  // set when Proposed
    std::string intent_hash;
    std::string reason;
    std::string rationale;

    json to_json() const;
};

/**
 * ProposalService - strategy plan to stored intent
 *
 * prepare(): latest candles, point-in-time news features (saved as a feature
 * row), strategy plan, maker price hint, risk check, "risk_check" audit event.
 * finalize(): freeze a proposed candidate into an intent, store it, and
 * record a "propose" audit event.
 */
class ProposalService {
public:
    ProposalService(const config::Settings& settings, store::IStore& store, exchange::IMarketClient* client = nullptr)
        : settings_(settings), store_(store), client_(client) {}

    /**
     * @throws std::invalid_argument for an unknown strategy
     * @throws std::runtime_error when no candles are stored for the symbol
     */
    ProposalCandidate prepare(const ProposeParams& params, Timestamp now);

    ProposalOutcome finalize(const ProposalCandidate& candidate, const ProposeParams& params, Timestamp now);

    ProposalOutcome propose(const ProposeParams& params, Timestamp now) {
        return finalize(prepare(params, now), params, now);
    }

    void set_logger(logging::AsyncLogger* logger) { logger_ = logger; }

private:
    const config::Settings& settings_;
    store::IStore& store_;
    exchange::IMarketClient* client_;
    logging::AsyncLogger* logger_ = nullptr;

    // Move the limit to the passive side of the book when post-only must be emulated
    strategy::TradePlan apply_maker_hint(const strategy::TradePlan& plan);
};

}  // namespace services
}  // namespace tradegate
