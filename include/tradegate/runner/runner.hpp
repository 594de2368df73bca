#pragma once

#include "../config/settings.hpp"
#include "../execution/execution_engine.hpp"
#include "../logging/async_logger.hpp"
#include "../services/ingest.hpp"
#include "../services/propose.hpp"
#include "../strategy/trade_plan.hpp"
#include "runner_state.hpp"

#include <atomic>
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace tradegate {
namespace runner {

/**
 * Work the Runner schedules. Each hook may throw; the Runner turns the
 * exception into a failed step.
 */
struct RunnerHooks {
    std::function<services::IngestResult(bool orderbook)> ingest_market;
    std::function<services::IngestResult()> ingest_news;
    std::function<services::ProposalCandidate()> prepare;
    std::function<services::ProposalOutcome(const services::ProposalCandidate&)> finalize;
    // Only called when auto_execute is set
    std::function<execution::ExecutionResult(const std::string& intent_id)> execute;
};

/**
 * Runner - crash-recoverable ingest / propose / execute loop
 *
 * One cycle:
 *   market ingest if due, news ingest if due, propose if due or if either
 *   ingest ran (skipped when an ingest failed). A proposal equal to the last
 *   one within propose_cooldown_seconds is not finalized again.
 *
 * Next due = now + interval + uniform(0, jitter). Failures grow a backoff
 * 1, 2, 4, ... capped at max_backoff_seconds; a clean cycle resets it.
 * State is saved after every cycle. The stop flag is checked between
 * cycles only.
 *
 * Usage:
 *   std::atomic<bool> running{true};
 *   util::install_shutdown_handler(running);
 *   Runner runner(settings.runner, TradingMode::Paper, settings.runner_state_path(), hooks, running);
 *   runner.run();
 */
class Runner {
public:
    using Clock = std::function<Timestamp()>;
    using Sleeper = std::function<void(double seconds)>;
    using Jitter = std::function<double(double max_seconds)>;

    Runner(const config::RunnerConfig& config, TradingMode mode, std::string state_path, RunnerHooks hooks,
           std::atomic<bool>& running);

    /**
     * @param once run exactly one cycle and return without sleeping
     * @param max_cycles stop after this many cycles
     * @return number of cycles run
     */
    int run(bool once = false, std::optional<int> max_cycles = std::nullopt);

    void request_stop() { running_.store(false); }

    /**
     * SHA-256 of the canonical JSON of the fields that make two proposals
     * the same order (size and price rounded to 8 places).
     */
    static std::string plan_signature(const strategy::TradePlan& plan, TradingMode mode);

    const RunnerState& state() const { return state_; }
    int backoff_seconds() const { return backoff_seconds_; }
    Timestamp next_market_at() const { return next_market_at_; }
    Timestamp next_news_at() const { return next_news_at_; }
    Timestamp next_propose_at() const { return next_propose_at_; }

    // Call before run(); the constructor schedules with the wall clock
    void set_clock(Clock clock);
    void set_sleeper(Sleeper sleeper) { sleeper_ = std::move(sleeper); }
    void set_jitter(Jitter jitter) { jitter_ = std::move(jitter); }
    void set_logger(logging::AsyncLogger* logger) { logger_ = logger; }

private:
    config::RunnerConfig config_;
    TradingMode mode_;
    RunnerStateStore state_store_;
    RunnerHooks hooks_;
    std::atomic<bool>& running_;

    RunnerState state_;
    int backoff_seconds_ = 0;
    Timestamp next_market_at_ = 0;
    Timestamp next_news_at_ = 0;
    Timestamp next_propose_at_ = 0;

    Clock clock_;
    Sleeper sleeper_;
    Jitter jitter_;
    logging::AsyncLogger* logger_ = nullptr;

    void restore_schedule();
    Timestamp schedule_next(Timestamp now, int interval_seconds);
    bool within_cooldown(const std::string& signature, Timestamp now) const;

    // Each returns true when the step succeeded
    bool run_market_ingest(std::vector<std::string>& errors);
    bool run_news_ingest(std::vector<std::string>& errors);
    void run_propose(Timestamp now, std::vector<std::string>& errors);

    void record_cycle_outcome(const std::vector<std::string>& errors);
};

}  // namespace runner
}  // namespace tradegate
