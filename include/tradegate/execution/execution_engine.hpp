#pragma once

#include "../config/settings.hpp"
#include "../exchange/market_client.hpp"
#include "../intent/approval_gate.hpp"
#include "../intent/order_intent.hpp"
#include "../logging/async_logger.hpp"
#include "../risk/risk_engine.hpp"
#include "../store/store.hpp"
#include "paper_fill.hpp"

#include <functional>
#include <optional>
#include <string>

namespace tradegate {
namespace execution {

struct ExecutionResult {
    IntentStatus status = IntentStatus::Error;
    std::string message;
    std::optional<std::string> exec_id;
};

/**
 * ExecutionEngine - turns an approved intent into an execution
 *
 * Preconditions are checked in a fixed order (existence, integrity,
 * terminal status, mode, expiry, approval, live gates, risk re-check) and
 * the first failure is returned as a structured result. Past the gates the
 * intent is filled by the paper model or placed on the exchange; execution,
 * fill, trade result and status move are written in one store transaction.
 *
 * Clock, sleep and environment lookup are injectable for tests.
 */
class ExecutionEngine {
public:
    using Clock = std::function<Timestamp()>;
    using Sleeper = std::function<void(double seconds)>;
    using EnvLookup = std::function<std::optional<std::string>(const std::string& name)>;

    static constexpr double POLL_INTERVAL_SECONDS = 1.0;
    static constexpr const char* LIVE_ACK_ENV = "I_UNDERSTAND_LIVE_TRADING";
    static constexpr const char* PAPER_SLIPPAGE_MODEL = "paper_v1";
    static constexpr const char* LIVE_SLIPPAGE_MODEL = "live";

    ExecutionEngine(const config::Settings& settings, store::IStore& store,
                    exchange::IMarketClient* client = nullptr);

    ExecutionResult execute(const std::string& intent_id, TradingMode mode);

    void set_clock(Clock clock) { clock_ = std::move(clock); }
    void set_sleeper(Sleeper sleeper) { sleeper_ = std::move(sleeper); }
    void set_env_lookup(EnvLookup lookup) { env_ = std::move(lookup); }
    void set_market_client(exchange::IMarketClient* client) { client_ = client; }
    void set_logger(logging::AsyncLogger* logger) {
        logger_ = logger;
        approvals_.set_logger(logger);
    }

    // Autopilot lets small, confident orders skip human approval
    bool autopilot_ok(const intent::OrderIntent& intent) const;

private:
    config::Settings settings_;
    store::IStore& store_;
    exchange::IMarketClient* client_;
    intent::ApprovalGate approvals_;
    risk::RiskEngine risk_;
    PaperFillModel paper_model_;

    Clock clock_;
    Sleeper sleeper_;
    EnvLookup env_;
    logging::AsyncLogger* logger_ = nullptr;

    std::optional<std::string> live_gate_failure() const;
    risk::RiskDecision recheck_risk(const intent::OrderIntent& intent, Timestamp now) const;

    ExecutionResult execute_paper(const intent::OrderIntent& intent, Timestamp now);
    ExecutionResult execute_live(const intent::OrderIntent& intent, Timestamp now);

    // Writes execution, optional fill + trade result, and the status move together
    void record(const intent::OrderIntent& intent, const store::Execution& execution, double fill_size,
                double fill_price, double fee, Timestamp now);

    ExecutionResult reject(const std::string& intent_id, const std::string& message, Timestamp now);
};

}  // namespace execution
}  // namespace tradegate
