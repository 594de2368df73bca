#include "../../include/tradegate/runner/runner.hpp"
#include "../../include/tradegate/util/canonical_json.hpp"
#include "../../include/tradegate/util/crypto.hpp"
#include "../../include/tradegate/util/time_utils.hpp"

#include <algorithm>
#include <chrono>
#include <random>
#include <thread>

namespace tradegate {
namespace runner {

namespace {

// Sleeps are sliced so a shutdown signal is noticed promptly
constexpr double SLEEP_SLICE_SECONDS = 0.2;

double seconds_since(uint64_t start_ns) {
    return static_cast<double>(util::now_ns() - start_ns) / 1e9;
}

}  // namespace

Runner::Runner(const config::RunnerConfig& config, TradingMode mode, std::string state_path, RunnerHooks hooks,
               std::atomic<bool>& running)
    : config_(config), mode_(mode), state_store_(std::move(state_path)), hooks_(std::move(hooks)),
      running_(running) {
    clock_ = [] { return util::wall_clock_ms(); };
    sleeper_ = [this](double seconds) {
        auto deadline = std::chrono::steady_clock::now() + std::chrono::duration<double>(seconds);
        while (running_.load() && std::chrono::steady_clock::now() < deadline) {
            auto left = std::chrono::duration<double>(deadline - std::chrono::steady_clock::now()).count();
            std::this_thread::sleep_for(std::chrono::duration<double>(std::min(left, SLEEP_SLICE_SECONDS)));
        }
    };
    jitter_ = [rng = std::mt19937_64{std::random_device{}()}](double max_seconds) mutable {
        std::uniform_real_distribution<double> dist(0.0, max_seconds);
        return dist(rng);
    };

    if (!state_store_.restore(state_))
        state_ = RunnerState{};
    restore_schedule();
}

void Runner::set_clock(Clock clock) {
    clock_ = std::move(clock);
    restore_schedule();
}

void Runner::restore_schedule() {
    Timestamp now = clock_();
    auto resume = [now](const std::optional<Timestamp>& last, int interval_seconds) {
        if (!last)
            return now;
        return *last + static_cast<Timestamp>(interval_seconds) * util::MS_PER_SECOND;
    };
    next_market_at_ = resume(state_.last_success_market_at, config_.market_poll_seconds);
    next_news_at_ = resume(state_.last_success_news_at, config_.news_poll_seconds);
    next_propose_at_ = resume(state_.last_success_propose_at, config_.propose_poll_seconds);
}

Timestamp Runner::schedule_next(Timestamp now, int interval_seconds) {
    double jitter = config_.jitter_seconds > 0 ? jitter_(static_cast<double>(config_.jitter_seconds)) : 0.0;
    return now + static_cast<Timestamp>(interval_seconds) * util::MS_PER_SECOND + util::seconds_to_ms(jitter);
}

std::string Runner::plan_signature(const strategy::TradePlan& plan, TradingMode mode) {
    util::json payload{{"symbol", plan.symbol},
                       {"side", side_to_string(plan.side)},
                       {"size", util::round_to(plan.size, 8)},
                       {"price", util::round_to(plan.price, 8)},
                       {"strategy", plan.strategy},
                       {"mode", mode_to_string(mode)},
                       {"order_type", "limit"},
                       {"time_in_force", "GTC"}};
    return util::sha256_hex(util::canonical_json(payload));
}

bool Runner::within_cooldown(const std::string& signature, Timestamp now) const {
    if (!state_.last_signature || !state_.last_signature_at)
        return false;
    if (*state_.last_signature != signature)
        return false;
    return now - *state_.last_signature_at <
           static_cast<Timestamp>(config_.propose_cooldown_seconds) * util::MS_PER_SECOND;
}

// =============================================================================
// Steps
// =============================================================================

bool Runner::run_market_ingest(std::vector<std::string>& errors) {
    if (!hooks_.ingest_market)
        return true;
    uint64_t start = util::now_ns();
    try {
        services::IngestResult result = hooks_.ingest_market(config_.orderbook);
        bool ok = result.ok();
        if (ok) {
            state_.last_success_market_at = clock_();
        } else {
            errors.push_back("market ingest errors=" + std::to_string(result.errors.size()));
        }
        TG_LOGF_INFO(logger_, Runner, "runner.market_ingest ok=%s candles=%zu duration=%.2fs", ok ? "true" : "false",
                     result.candles, seconds_since(start));
        return ok;
    } catch (const std::exception& e) {
        errors.push_back(std::string("market ingest exception=") + e.what());
        TG_LOGF_WARN(logger_, Runner, "runner.market_ingest failed: %s", e.what());
        return false;
    }
}

bool Runner::run_news_ingest(std::vector<std::string>& errors) {
    if (!hooks_.ingest_news)
        return true;
    uint64_t start = util::now_ns();
    try {
        services::IngestResult result = hooks_.ingest_news();
        bool ok = result.ok();
        if (ok) {
            state_.last_success_news_at = clock_();
        } else {
            errors.push_back("news ingest errors=" + std::to_string(result.errors.size()));
        }
        TG_LOGF_INFO(logger_, Runner, "runner.news_ingest ok=%s inserted=%zu features=%zu duration=%.2fs",
                     ok ? "true" : "false", result.news_inserted, result.features_added, seconds_since(start));
        return ok;
    } catch (const std::exception& e) {
        errors.push_back(std::string("news ingest exception=") + e.what());
        TG_LOGF_WARN(logger_, Runner, "runner.news_ingest failed: %s", e.what());
        return false;
    }
}

void Runner::run_propose(Timestamp now, std::vector<std::string>& errors) {
    if (!hooks_.prepare || !hooks_.finalize)
        return;
    try {
        services::ProposalCandidate candidate = hooks_.prepare();
        if (candidate.status != services::ProposalStatus::Proposed || !candidate.plan) {
            TG_LOGF_INFO(logger_, Runner, "runner.propose status=%s reason=%s",
                         services::proposal_status_to_string(candidate.status), candidate.reason.c_str());
            return;
        }

        std::string signature = plan_signature(*candidate.plan, mode_);
        if (within_cooldown(signature, now)) {
            TG_LOG_INFO(logger_, Runner, "runner.propose skipped (no change)");
            return;
        }

        services::ProposalOutcome outcome = hooks_.finalize(candidate);
        Timestamp done = clock_();
        state_.last_success_propose_at = done;
        state_.last_signature = signature;
        state_.last_signature_at = done;

        if (outcome.intent) {
            TG_LOGF_INFO(logger_, Runner, "runner.propose intent=%s side=%s size=%.8f price=%.8f",
                         outcome.intent->intent_id.c_str(), side_to_string(outcome.intent->side),
                         outcome.intent->size, outcome.intent->price);
        }

        if (config_.auto_execute && hooks_.execute && outcome.intent) {
            execution::ExecutionResult exec = hooks_.execute(outcome.intent->intent_id);
            TG_LOGF_INFO(logger_, Runner, "runner.execute intent=%s status=%s message=%s",
                         outcome.intent->intent_id.c_str(), status_to_string(exec.status), exec.message.c_str());
            if (exec.status == IntentStatus::Error) {
                errors.push_back("execute error=" + exec.message);
            }
        }
    } catch (const std::exception& e) {
        errors.push_back(std::string("propose exception=") + e.what());
        TG_LOGF_WARN(logger_, Runner, "runner.propose failed: %s", e.what());
    }
}

void Runner::record_cycle_outcome(const std::vector<std::string>& errors) {
    if (!errors.empty()) {
        std::string summary;
        for (size_t i = 0; i < errors.size(); ++i) {
            if (i > 0)
                summary += "; ";
            summary += errors[i];
        }
        if (summary.size() > RunnerState::MAX_ERROR_SUMMARY)
            summary.resize(RunnerState::MAX_ERROR_SUMMARY);
        state_.last_error_at = clock_();
        state_.last_error_summary = summary;
        backoff_seconds_ = backoff_seconds_ <= 0 ? 1 : std::min(backoff_seconds_ * 2, config_.max_backoff_seconds);
    } else {
        backoff_seconds_ = 0;
    }

    if (!state_store_.save(state_)) {
        TG_LOGF_WARN(logger_, Runner, "runner state not saved to %s", state_store_.path().c_str());
    }
}

// =============================================================================
// Loop
// =============================================================================

int Runner::run(bool once, std::optional<int> max_cycles) {
    int cycles = 0;
    while (running_.load()) {
        if (max_cycles && cycles >= *max_cycles)
            break;

        uint64_t cycle_start = util::now_ns();
        ++cycles;
        ++state_.iteration;
        Timestamp now = clock_();
        std::vector<std::string> errors;
        bool ingest_attempted = false;
        bool ingest_failed = false;

        if (now >= next_market_at_) {
            ingest_attempted = true;
            if (!run_market_ingest(errors))
                ingest_failed = true;
            next_market_at_ = schedule_next(now, config_.market_poll_seconds);
        }

        if (now >= next_news_at_) {
            ingest_attempted = true;
            if (!run_news_ingest(errors))
                ingest_failed = true;
            next_news_at_ = schedule_next(now, config_.news_poll_seconds);
        }

        if (now >= next_propose_at_ || ingest_attempted) {
            uint64_t start = util::now_ns();
            if (ingest_failed) {
                TG_LOG_WARN(logger_, Runner, "runner.propose skipped (ingest failed)");
            } else {
                run_propose(now, errors);
            }
            TG_LOGF_INFO(logger_, Runner, "runner.propose duration=%.2fs", seconds_since(start));
            next_propose_at_ = schedule_next(now, config_.propose_poll_seconds);
        }

        record_cycle_outcome(errors);

        if (once || !running_.load() || (max_cycles && cycles >= *max_cycles))
            break;

        Timestamp next_due = std::min({next_market_at_, next_news_at_, next_propose_at_});
        double sleep_seconds = std::max(0.0, static_cast<double>(next_due - clock_()) / 1000.0);
        if (backoff_seconds_ > 0)
            sleep_seconds = std::max(sleep_seconds, static_cast<double>(backoff_seconds_));
        TG_LOGF_INFO(logger_, Runner, "runner.cycle duration=%.2fs sleep=%.2fs", seconds_since(cycle_start),
                     sleep_seconds);
        if (sleep_seconds > 0)
            sleeper_(sleep_seconds);
    }
    return cycles;
}

}  // namespace runner
}  // namespace tradegate
