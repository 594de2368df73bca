/**
 * Runner Test Suite
 *
 * Scheduling, ingest-failure handling, duplicate suppression, backoff
 * growth and reset, and resuming from the persisted state file. The clock
 * and sleeper are injected; a sleep simply advances the fake clock.
 *
 * Run with: ./test_runner
 */

#include <atomic>
#include <cassert>
#include <cstdio>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

#include "../include/tradegate/runner/runner.hpp"
#include "../include/tradegate/util/time_utils.hpp"

using namespace tradegate;
using namespace tradegate::runner;

#define TEST(name) void test_##name()
#define RUN_TEST(name) do { \
    std::cout << "  Running " #name "... "; \
    test_##name(); \
    std::cout << "PASSED\n"; \
} while(0)

#define ASSERT_EQ(a, b) do { \
    if (!((a) == (b))) { \
        std::cerr << "\nFAILED: " << #a << " == " << #b \
                  << " (" << (a) << " vs " << (b) << ")\n"; \
        assert(false); \
    } \
} while(0)

static const char* STATE_FILE = "/tmp/tradegate_test_runner_state.json";
static const Timestamp T0 = 1704067200000;

void cleanup_state_file() {
    std::remove(STATE_FILE);
    std::remove((std::string(STATE_FILE) + ".tmp").c_str());
}

config::RunnerConfig runner_config() {
    config::RunnerConfig cfg;
    cfg.market_poll_seconds = 30;
    cfg.news_poll_seconds = 120;
    cfg.propose_poll_seconds = 60;
    cfg.propose_cooldown_seconds = 300;
    cfg.jitter_seconds = 0;
    cfg.max_backoff_seconds = 8;
    return cfg;
}

/**
 * Counting hooks over a fake clock
 */
struct Fixture {
    std::atomic<bool> running{true};
    Timestamp now = T0;
    std::vector<double> sleeps;

    int market_calls = 0;
    int news_calls = 0;
    int prepare_calls = 0;
    int finalize_calls = 0;
    int execute_calls = 0;
    int market_failures_left = 0;
    bool market_throws = false;
    double plan_size = 0.1;
    IntentStatus execute_status = IntentStatus::Filled;

    RunnerHooks hooks() {
        RunnerHooks h;
        h.ingest_market = [this](bool) {
            ++market_calls;
            if (market_throws)
                throw std::runtime_error("boom");
            services::IngestResult result;
            result.candles = 1;
            if (market_failures_left > 0) {
                --market_failures_left;
                result.errors.push_back("BTC/USDT 1m: timeout");
            }
            return result;
        };
        h.ingest_news = [this] {
            ++news_calls;
            return services::IngestResult{};
        };
        h.prepare = [this] {
            ++prepare_calls;
            services::ProposalCandidate candidate;
            candidate.status = services::ProposalStatus::Proposed;
            strategy::TradePlan plan;
            plan.symbol = "BTC/USDT";
            plan.side = Side::Buy;
            plan.size = plan_size;
            plan.price = 42000;
            plan.confidence = 0.55;
            plan.strategy = "baseline";
            candidate.plan = plan;
            candidate.reason = "ok";
            return candidate;
        };
        h.finalize = [this](const services::ProposalCandidate& candidate) {
            ++finalize_calls;
            services::ProposalOutcome outcome;
            outcome.status = candidate.status;
            intent::OrderIntent intent;
            intent.intent_id = "intent-" + std::to_string(finalize_calls);
            intent.symbol = candidate.plan->symbol;
            intent.side = candidate.plan->side;
            intent.size = candidate.plan->size;
            intent.price = candidate.plan->price;
            outcome.intent = intent;
            return outcome;
        };
        h.execute = [this](const std::string& intent_id) {
            ++execute_calls;
            execution::ExecutionResult result;
            result.status = execute_status;
            result.message = "executed " + intent_id;
            return result;
        };
        return h;
    }

    void attach(Runner& runner) {
        runner.set_clock([this] { return now; });
        runner.set_sleeper([this](double seconds) {
            sleeps.push_back(seconds);
            now += util::seconds_to_ms(seconds);
        });
        runner.set_jitter([](double) { return 0.0; });
    }
};

// ============================================================================
// Cycles
// ============================================================================

TEST(once_runs_single_cycle_without_sleeping) {
    cleanup_state_file();
    Fixture f;
    Runner runner(runner_config(), TradingMode::Paper, STATE_FILE, f.hooks(), f.running);
    f.attach(runner);

    ASSERT_EQ(runner.run(true), 1);
    ASSERT_EQ(f.market_calls, 1);
    ASSERT_EQ(f.news_calls, 1);
    ASSERT_EQ(f.prepare_calls, 1);
    ASSERT_EQ(f.finalize_calls, 1);
    assert(f.sleeps.empty());
    ASSERT_EQ(runner.state().iteration, 1);
    assert(runner.state().last_success_market_at == T0);
    assert(runner.state().last_success_propose_at == T0);
    ASSERT_EQ(runner.backoff_seconds(), 0);
    cleanup_state_file();
}

TEST(max_cycles_bounds_the_loop) {
    cleanup_state_file();
    Fixture f;
    Runner runner(runner_config(), TradingMode::Paper, STATE_FILE, f.hooks(), f.running);
    f.attach(runner);

    ASSERT_EQ(runner.run(false, 3), 3);
    ASSERT_EQ(runner.state().iteration, 3);
    // Sleeps between cycles only, each until the market schedule is due
    ASSERT_EQ(f.sleeps.size(), size_t(2));
    assert(f.sleeps[0] == 30.0);
    ASSERT_EQ(f.market_calls, 3);
    ASSERT_EQ(f.news_calls, 1);
    cleanup_state_file();
}

TEST(schedules_use_interval_plus_jitter) {
    cleanup_state_file();
    Fixture f;
    auto cfg = runner_config();
    cfg.jitter_seconds = 5;
    Runner runner(cfg, TradingMode::Paper, STATE_FILE, f.hooks(), f.running);
    f.attach(runner);
    runner.set_jitter([](double max_seconds) { return max_seconds / 2; });

    runner.run(true);
    ASSERT_EQ(runner.next_market_at(), T0 + 32500);
    ASSERT_EQ(runner.next_news_at(), T0 + 122500);
    ASSERT_EQ(runner.next_propose_at(), T0 + 62500);
    cleanup_state_file();
}

TEST(stop_flag_ends_loop) {
    cleanup_state_file();
    Fixture f;
    RunnerHooks hooks = f.hooks();
    Runner* self = nullptr;
    hooks.ingest_news = [&] {
        self->request_stop();
        return services::IngestResult{};
    };
    Runner runner(runner_config(), TradingMode::Paper, STATE_FILE, hooks, f.running);
    self = &runner;
    f.attach(runner);

    ASSERT_EQ(runner.run(false, 5), 1);
    assert(!f.running.load());
    assert(f.sleeps.empty());
    cleanup_state_file();
}

TEST(already_stopped_runs_nothing) {
    cleanup_state_file();
    Fixture f;
    f.running.store(false);
    Runner runner(runner_config(), TradingMode::Paper, STATE_FILE, f.hooks(), f.running);
    f.attach(runner);
    ASSERT_EQ(runner.run(), 0);
    ASSERT_EQ(f.market_calls, 0);
    cleanup_state_file();
}

// ============================================================================
// Failures and backoff
// ============================================================================

TEST(ingest_failure_skips_propose) {
    cleanup_state_file();
    Fixture f;
    f.market_failures_left = 1;
    Runner runner(runner_config(), TradingMode::Paper, STATE_FILE, f.hooks(), f.running);
    f.attach(runner);

    runner.run(true);
    ASSERT_EQ(f.prepare_calls, 0);
    ASSERT_EQ(f.finalize_calls, 0);
    ASSERT_EQ(runner.backoff_seconds(), 1);
    assert(!runner.state().last_success_market_at.has_value());
    assert(runner.state().last_error_at == T0);
    ASSERT_EQ(*runner.state().last_error_summary, std::string("market ingest errors=1"));
    cleanup_state_file();
}

TEST(hook_exception_becomes_failed_cycle) {
    cleanup_state_file();
    Fixture f;
    f.market_throws = true;
    Runner runner(runner_config(), TradingMode::Paper, STATE_FILE, f.hooks(), f.running);
    f.attach(runner);

    ASSERT_EQ(runner.run(true), 1);
    ASSERT_EQ(f.prepare_calls, 0);
    ASSERT_EQ(*runner.state().last_error_summary, std::string("market ingest exception=boom"));
    ASSERT_EQ(runner.backoff_seconds(), 1);
    cleanup_state_file();
}

TEST(backoff_doubles_and_caps) {
    cleanup_state_file();
    Fixture f;
    f.market_failures_left = 100;
    auto cfg = runner_config();
    cfg.market_poll_seconds = 1;
    cfg.news_poll_seconds = 1;
    cfg.propose_poll_seconds = 1;
    Runner runner(cfg, TradingMode::Paper, STATE_FILE, f.hooks(), f.running);
    f.attach(runner);

    runner.run(false, 6);
    std::vector<double> expected = {1, 2, 4, 8, 8};
    assert(f.sleeps == expected);
    ASSERT_EQ(runner.backoff_seconds(), 8);
    ASSERT_EQ(f.prepare_calls, 0);
    cleanup_state_file();
}

TEST(success_resets_backoff) {
    cleanup_state_file();
    Fixture f;
    f.market_failures_left = 3;
    auto cfg = runner_config();
    cfg.market_poll_seconds = 1;
    cfg.news_poll_seconds = 1;
    cfg.propose_poll_seconds = 1;
    Runner runner(cfg, TradingMode::Paper, STATE_FILE, f.hooks(), f.running);
    f.attach(runner);

    runner.run(false, 4);
    std::vector<double> expected = {1, 2, 4};
    assert(f.sleeps == expected);
    ASSERT_EQ(runner.backoff_seconds(), 0);
    ASSERT_EQ(f.finalize_calls, 1);
    cleanup_state_file();
}

TEST(long_error_summary_truncated) {
    cleanup_state_file();
    Fixture f;
    RunnerHooks hooks = f.hooks();
    hooks.ingest_market = [](bool) -> services::IngestResult {
        throw std::runtime_error(std::string(1000, 'x'));
    };
    Runner runner(runner_config(), TradingMode::Paper, STATE_FILE, hooks, f.running);
    f.attach(runner);
    runner.run(true);
    ASSERT_EQ(runner.state().last_error_summary->size(), RunnerState::MAX_ERROR_SUMMARY);
    cleanup_state_file();
}

// ============================================================================
// Duplicate suppression
// ============================================================================

TEST(same_plan_finalized_once_within_cooldown) {
    cleanup_state_file();
    Fixture f;
    Runner runner(runner_config(), TradingMode::Paper, STATE_FILE, f.hooks(), f.running);
    f.attach(runner);

    // Cycles every 30s from T0 to T0 + 270s
    runner.run(false, 10);
    ASSERT_EQ(f.prepare_calls, 10);
    ASSERT_EQ(f.finalize_calls, 1);
    cleanup_state_file();
}

TEST(same_plan_finalized_again_after_cooldown) {
    cleanup_state_file();
    Fixture f;
    Runner runner(runner_config(), TradingMode::Paper, STATE_FILE, f.hooks(), f.running);
    f.attach(runner);

    // The eleventh cycle lands at T0 + 300s
    runner.run(false, 11);
    ASSERT_EQ(f.finalize_calls, 2);
    cleanup_state_file();
}

TEST(changed_plan_is_finalized) {
    cleanup_state_file();
    Fixture f;
    RunnerHooks hooks = f.hooks();
    auto base_prepare = hooks.prepare;
    hooks.prepare = [&f, base_prepare] {
        f.plan_size += 0.01;
        return base_prepare();
    };
    Runner runner(runner_config(), TradingMode::Paper, STATE_FILE, hooks, f.running);
    f.attach(runner);

    runner.run(false, 3);
    ASSERT_EQ(f.finalize_calls, 3);
    cleanup_state_file();
}

TEST(plan_signature_rounds_and_includes_mode) {
    strategy::TradePlan plan;
    plan.symbol = "BTC/USDT";
    plan.side = Side::Buy;
    plan.size = 0.123456781;
    plan.price = 42000;
    plan.strategy = "baseline";

    strategy::TradePlan nudged = plan;
    nudged.size = 0.123456784;  // same at 8 places

    std::string paper = Runner::plan_signature(plan, TradingMode::Paper);
    ASSERT_EQ(paper.size(), size_t(64));
    ASSERT_EQ(Runner::plan_signature(nudged, TradingMode::Paper), paper);
    assert(Runner::plan_signature(plan, TradingMode::Live) != paper);

    strategy::TradePlan other = plan;
    other.side = Side::Sell;
    assert(Runner::plan_signature(other, TradingMode::Paper) != paper);
}

// ============================================================================
// Auto-execute
// ============================================================================

TEST(auto_execute_runs_new_intent) {
    cleanup_state_file();
    Fixture f;
    auto cfg = runner_config();
    cfg.auto_execute = true;
    Runner runner(cfg, TradingMode::Paper, STATE_FILE, f.hooks(), f.running);
    f.attach(runner);

    runner.run(true);
    ASSERT_EQ(f.execute_calls, 1);
    ASSERT_EQ(runner.backoff_seconds(), 0);
    cleanup_state_file();
}

TEST(auto_execute_error_counts_as_failure) {
    cleanup_state_file();
    Fixture f;
    f.execute_status = IntentStatus::Error;
    auto cfg = runner_config();
    cfg.auto_execute = true;
    Runner runner(cfg, TradingMode::Paper, STATE_FILE, f.hooks(), f.running);
    f.attach(runner);

    runner.run(true);
    ASSERT_EQ(runner.backoff_seconds(), 1);
    ASSERT_EQ(*runner.state().last_error_summary, std::string("execute error=executed intent-1"));
    cleanup_state_file();
}

TEST(auto_execute_off_never_executes) {
    cleanup_state_file();
    Fixture f;
    Runner runner(runner_config(), TradingMode::Paper, STATE_FILE, f.hooks(), f.running);
    f.attach(runner);
    runner.run(true);
    ASSERT_EQ(f.execute_calls, 0);
    cleanup_state_file();
}

// ============================================================================
// Persistence
// ============================================================================

TEST(restart_resumes_schedule_and_dedup) {
    cleanup_state_file();
    {
        Fixture f;
        Runner runner(runner_config(), TradingMode::Paper, STATE_FILE, f.hooks(), f.running);
        f.attach(runner);
        runner.run(true);
    }

    Fixture f;
    f.now = T0 + 10 * util::MS_PER_SECOND;
    Runner resumed(runner_config(), TradingMode::Paper, STATE_FILE, f.hooks(), f.running);
    f.attach(resumed);

    ASSERT_EQ(resumed.state().iteration, 1);
    ASSERT_EQ(resumed.next_market_at(), T0 + 30 * util::MS_PER_SECOND);
    ASSERT_EQ(resumed.next_news_at(), T0 + 120 * util::MS_PER_SECOND);
    ASSERT_EQ(resumed.next_propose_at(), T0 + 60 * util::MS_PER_SECOND);

    // Nothing is due yet
    resumed.run(true);
    ASSERT_EQ(f.market_calls, 0);
    ASSERT_EQ(f.prepare_calls, 0);
    ASSERT_EQ(resumed.state().iteration, 2);

    // Same plan after restart is still suppressed
    f.now = T0 + 30 * util::MS_PER_SECOND;
    resumed.run(true);
    ASSERT_EQ(f.market_calls, 1);
    ASSERT_EQ(f.prepare_calls, 1);
    ASSERT_EQ(f.finalize_calls, 0);
    cleanup_state_file();
}

TEST(corrupt_state_starts_fresh) {
    cleanup_state_file();
    {
        std::ofstream out(STATE_FILE);
        out << "{ definitely not json";
    }
    Fixture f;
    Runner runner(runner_config(), TradingMode::Paper, STATE_FILE, f.hooks(), f.running);
    f.attach(runner);
    ASSERT_EQ(runner.state().iteration, 0);
    ASSERT_EQ(runner.next_market_at(), T0);
    runner.run(true);
    ASSERT_EQ(f.market_calls, 1);
    cleanup_state_file();
}

TEST(state_file_round_trip) {
    cleanup_state_file();
    RunnerState state;
    state.iteration = 7;
    state.last_success_market_at = T0;
    state.last_error_summary = "news ingest errors=2";
    state.last_signature = "abc";
    state.last_signature_at = T0 + 1500;

    RunnerStateStore store(STATE_FILE);
    assert(store.save(state));
    assert(store.exists());

    RunnerState back;
    assert(store.restore(back));
    ASSERT_EQ(back.iteration, 7);
    assert(back.last_success_market_at == T0);
    assert(!back.last_success_news_at.has_value());
    assert(back.last_signature_at == T0 + 1500);
    ASSERT_EQ(*back.last_error_summary, std::string("news ingest errors=2"));

    nlohmann::json doc = state.to_json();
    ASSERT_EQ(doc["last_success_ingest_market_at"].get<std::string>(), std::string("2024-01-01T00:00:00+00:00"));
    assert(doc["last_success_ingest_news_at"].is_null());
    cleanup_state_file();
}

int main() {
    std::cout << "\n=== Runner Tests ===\n\n";

    std::cout << "Cycles:\n";
    RUN_TEST(once_runs_single_cycle_without_sleeping);
    RUN_TEST(max_cycles_bounds_the_loop);
    RUN_TEST(schedules_use_interval_plus_jitter);
    RUN_TEST(stop_flag_ends_loop);
    RUN_TEST(already_stopped_runs_nothing);

    std::cout << "\nFailures and Backoff:\n";
    RUN_TEST(ingest_failure_skips_propose);
    RUN_TEST(hook_exception_becomes_failed_cycle);
    RUN_TEST(backoff_doubles_and_caps);
    RUN_TEST(success_resets_backoff);
    RUN_TEST(long_error_summary_truncated);

    std::cout << "\nDuplicate Suppression:\n";
    RUN_TEST(same_plan_finalized_once_within_cooldown);
    RUN_TEST(same_plan_finalized_again_after_cooldown);
    RUN_TEST(changed_plan_is_finalized);
    RUN_TEST(plan_signature_rounds_and_includes_mode);

    std::cout << "\nAuto-execute:\n";
    RUN_TEST(auto_execute_runs_new_intent);
    RUN_TEST(auto_execute_error_counts_as_failure);
    RUN_TEST(auto_execute_off_never_executes);

    std::cout << "\nPersistence:\n";
    RUN_TEST(restart_resumes_schedule_and_dedup);
    RUN_TEST(corrupt_state_starts_fresh);
    RUN_TEST(state_file_round_trip);

    std::cout << "\n=== All tests PASSED! ===\n\n";
    return 0;
}
