/**
 * JSON Store Test Suite
 *
 * Upsert and idempotency rules, status transitions, transaction rollback,
 * reload from disk, several handles sharing one file and the derived
 * position / daily queries.
 *
 * Run with: ./test_json_store
 */

#include <cassert>
#include <cmath>
#include <cstdio>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <string>
#include <thread>

#include "../include/tradegate/intent/approval_gate.hpp"
#include "../include/tradegate/store/json_store.hpp"
#include "../include/tradegate/util/crypto.hpp"
#include "../include/tradegate/util/time_utils.hpp"

using namespace tradegate;
using namespace tradegate::store;

#define TEST(name) void test_##name()
#define RUN_TEST(name) do { \
    std::cout << "  Running " #name "... "; \
    test_##name(); \
    std::cout << "PASSED\n"; \
} while(0)

#define ASSERT_DOUBLE_NEAR(a, b, tol) do { \
    if (std::abs((a) - (b)) > (tol)) { \
        std::cerr << "\nFAILED: " << #a << " != " << #b \
                  << " (" << (a) << " != " << (b) << ")\n"; \
        assert(false); \
    } \
} while(0)

static const char* TEST_FILE = "/tmp/tradegate_test_store.json";
static const Timestamp DAY1 = 1704067200000;  // 2024-01-01
static const Timestamp DAY2 = DAY1 + util::MS_PER_DAY;

void cleanup_test_file() {
    std::remove(TEST_FILE);
    std::remove((std::string(TEST_FILE) + ".tmp").c_str());
    std::remove((std::string(TEST_FILE) + ".lock").c_str());
}

market::Candle candle(Timestamp ts, double close) {
    market::Candle c;
    c.ts = ts;
    c.open = close;
    c.high = close;
    c.low = close;
    c.close = close;
    c.volume = 1;
    return c;
}

intent::IntentRecord make_record(const std::string& id, Timestamp created_at) {
    intent::OrderIntent intent;
    intent.intent_id = id;
    intent.created_at = created_at;
    intent.symbol = "BTC/USDT";
    intent.side = Side::Buy;
    intent.size = 0.1;
    intent.price = 100;
    intent.strategy = "baseline";
    intent.expires_at = created_at + 900 * util::MS_PER_SECOND;
    return intent::IntentRecord::create(intent);
}

Fill make_fill(Side side, double size, double price, double fee, Timestamp ts) {
    Fill f;
    f.fill_id = "f-" + std::to_string(ts);
    f.exec_id = "e-" + std::to_string(ts);
    f.symbol = "BTC/USDT";
    f.side = side;
    f.size = size;
    f.price = price;
    f.fee = fee;
    f.ts = ts;
    return f;
}

Execution make_execution(const std::string& id, Timestamp at) {
    Execution e;
    e.exec_id = id;
    e.intent_id = "i-" + id;
    e.executed_at = at;
    e.status = IntentStatus::Filled;
    return e;
}

// ============================================================================
// Market data
// ============================================================================

TEST(upsert_replaces_by_timestamp) {
    JsonStore store;
    size_t written = store.upsert_candles("BTC/USDT", "1m", {candle(DAY1, 100), candle(DAY1 + 60000, 101)});
    assert(written == 2);
    store.upsert_candles("BTC/USDT", "1m", {candle(DAY1 + 60000, 105)});

    auto candles = store.recent_candles("BTC/USDT", "1m", 10);
    assert(candles.size() == 2);
    ASSERT_DOUBLE_NEAR(candles[1].close, 105.0, 1e-12);
}

TEST(recent_candles_oldest_first_and_limited) {
    JsonStore store;
    std::vector<market::Candle> batch;
    for (int i = 4; i >= 0; --i)
        batch.push_back(candle(DAY1 + i * 60000, 100 + i));
    store.upsert_candles("BTC/USDT", "1m", batch);

    auto last3 = store.recent_candles("BTC/USDT", "1m", 3);
    assert(last3.size() == 3);
    assert(last3[0].ts == DAY1 + 2 * 60000);
    assert(last3[2].ts == DAY1 + 4 * 60000);
    assert(store.recent_candles("BTC/USDT", "5m", 3).empty());
}

TEST(latest_orderbook_by_timestamp) {
    JsonStore store;
    assert(!store.latest_orderbook("BTC/USDT").has_value());
    market::OrderbookTop a{DAY1 + 5, 99, 101, 1, 1};
    market::OrderbookTop b{DAY1 + 1, 90, 110, 1, 1};
    store.save_orderbook("BTC/USDT", a);
    store.save_orderbook("BTC/USDT", b);
    auto top = store.latest_orderbook("BTC/USDT");
    assert(top.has_value());
    assert(top->ts == DAY1 + 5);
}

// ============================================================================
// News
// ============================================================================

TEST(news_idempotent_by_id) {
    JsonStore store;
    news::NewsFeature item;
    item.id = "n1";
    item.source = "wire";
    item.published_at = DAY1;
    item.observed_at = DAY1 + 1000;
    assert(store.insert_news(item));
    item.sentiment = 0.9;
    assert(!store.insert_news(item));

    auto found = store.news_published_between(DAY1, DAY1);
    assert(found.size() == 1);
    ASSERT_DOUBLE_NEAR(found[0].sentiment, 0.0, 1e-12);
    assert(store.news_published_between(DAY1 + 1, DAY2).empty());
}

TEST(feature_row_replaced_by_features_ref) {
    JsonStore store;
    news::FeatureRow row;
    row.symbol = "BTC/USDT";
    row.ts = DAY1;
    row.features_ref = "BTC/USDT:1704067200000:news_v1";
    row.features.news_count = 1;
    store.save_feature_row(row);
    row.features.news_count = 3;
    store.save_feature_row(row);

    auto rows = store.feature_rows("BTC/USDT");
    assert(rows.size() == 1);
    assert(rows[0].features.news_count == 3);

    row.features_ref = "BTC/USDT:1704067260000:news_v1";
    store.save_feature_row(row);
    assert(store.feature_rows("BTC/USDT").size() == 2);
}

TEST(events_capped_oldest_first) {
    JsonStore store;
    const size_t total = JsonStore::MAX_EVENTS + 5;
    for (size_t i = 0; i < total; ++i)
        store.log_event("tick", json::object(), DAY1 + static_cast<Timestamp>(i));

    auto events = store.events();
    assert(events.size() == JsonStore::MAX_EVENTS);
    assert(events.front().ts == DAY1 + 5);
    assert(events.back().ts == DAY1 + static_cast<Timestamp>(total - 1));
}

// ============================================================================
// Intents
// ============================================================================

TEST(insert_intent_is_idempotent) {
    JsonStore store;
    auto record = make_record("i-1", DAY1);
    assert(store.insert_intent(record));

    auto changed = record;
    changed.intent.size = 99;
    assert(!store.insert_intent(changed));
    ASSERT_DOUBLE_NEAR(store.get_intent("i-1")->intent.size, 0.1, 1e-12);
    assert(store.list_intents(std::nullopt).size() == 1);
}

TEST(status_transitions_enforced) {
    JsonStore store;
    store.insert_intent(make_record("i-1", DAY1));

    assert(store.update_intent_status("i-1", IntentStatus::Approved, DAY1 + 1));
    assert(store.update_intent_status("i-1", IntentStatus::Filled, DAY1 + 2));
    assert(!store.update_intent_status("i-1", IntentStatus::Approved, DAY1 + 3));
    assert(!store.update_intent_status("i-1", IntentStatus::Proposed, DAY1 + 3));
    assert(!store.update_intent_status("missing", IntentStatus::Approved, DAY1));

    auto record = store.get_intent("i-1");
    assert(record->status == IntentStatus::Filled);
    assert(record->updated_at == DAY1 + 2);
}

TEST(list_and_latest_filter_by_status) {
    JsonStore store;
    store.insert_intent(make_record("old", DAY1));
    store.insert_intent(make_record("new", DAY1 + 1000));
    store.update_intent_status("old", IntentStatus::Approved, DAY1 + 2000);

    assert(store.latest_intent(std::nullopt)->intent.intent_id == "new");
    assert(store.latest_intent(IntentStatus::Approved)->intent.intent_id == "old");
    assert(store.list_intents(IntentStatus::Proposed).size() == 1);
    assert(!store.latest_intent(IntentStatus::Filled).has_value());
}

// ============================================================================
// Transactions
// ============================================================================

TEST(transaction_rolls_back_on_throw) {
    JsonStore store;
    store.insert_intent(make_record("i-1", DAY1));

    bool thrown = false;
    try {
        store.transaction([&] {
            store.insert_execution(make_execution("e1", DAY1));
            store.update_intent_status("i-1", IntentStatus::Approved, DAY1);
            store.log_event("execute", {{"intent_id", "i-1"}}, DAY1);
            throw std::runtime_error("boom");
        });
    } catch (const std::runtime_error&) {
        thrown = true;
    }
    assert(thrown);
    assert(store.executions_for_intent("i-e1").empty());
    assert(store.get_intent("i-1")->status == IntentStatus::Proposed);
    assert(store.events().empty());
}

TEST(transaction_commits_to_disk_together) {
    cleanup_test_file();
    {
        JsonStore store(TEST_FILE);
        store.transaction([&] {
            store.insert_execution(make_execution("e1", DAY1));
            store.insert_fill(make_fill(Side::Buy, 1, 100, 0, DAY1));
        });
    }
    JsonStore reloaded(TEST_FILE);
    assert(reloaded.executions_for_intent("i-e1").size() == 1);
    assert(reloaded.fills("BTC/USDT").size() == 1);
    cleanup_test_file();
}

TEST(failed_transaction_leaves_file_unchanged) {
    cleanup_test_file();
    {
        JsonStore store(TEST_FILE);
        store.insert_intent(make_record("i-1", DAY1));
        try {
            store.transaction([&] {
                store.update_intent_status("i-1", IntentStatus::Approved, DAY1);
                throw std::runtime_error("boom");
            });
        } catch (const std::runtime_error&) {
        }
    }
    JsonStore reloaded(TEST_FILE);
    assert(reloaded.get_intent("i-1")->status == IntentStatus::Proposed);
    cleanup_test_file();
}

// ============================================================================
// Persistence
// ============================================================================

TEST(reload_preserves_everything) {
    cleanup_test_file();
    auto record = make_record("i-1", DAY1);
    record.intent.rationale_features_ref = "BTC/USDT:1704067200000:news_v1";
    record.intent_hash = record.intent.hash();
    {
        JsonStore store(TEST_FILE);
        store.upsert_candles("BTC/USDT", "1m", {candle(DAY1, 100)});
        store.insert_intent(record);
        store.update_intent_status("i-1", IntentStatus::Approved, DAY1 + 5);

        Approval approval;
        approval.intent_id = "i-1";
        approval.intent_hash = record.intent_hash;
        approval.approved_at = DAY1 + 5;
        approval.approved_by = "alice";
        store.save_approval(approval);

        TradeResult result;
        result.trade_id = "t1";
        result.intent_id = "i-1";
        result.symbol = "BTC/USDT";
        result.side = Side::Sell;
        result.pnl = 12.5;
        result.mode = TradingMode::Live;
        result.created_at = DAY1 + 10;
        result.meta = {{"fill_price", 110.0}, {"size", 1.0}};
        store.insert_trade_result(result);
        store.log_event("approve", {{"intent_id", "i-1"}}, DAY1 + 5);
    }

    JsonStore reloaded(TEST_FILE);
    auto back = reloaded.get_intent("i-1");
    assert(back.has_value());
    assert(back->status == IntentStatus::Approved);
    assert(back->hash_matches());
    assert(back->intent_hash == record.intent_hash);
    assert(reloaded.get_approval("i-1")->approved_by == "alice");
    assert(reloaded.recent_candles("BTC/USDT", "1m", 5).size() == 1);

    auto trades = reloaded.trade_results(TradingMode::Live);
    assert(trades.size() == 1);
    ASSERT_DOUBLE_NEAR(trades[0].pnl, 12.5, 1e-12);
    ASSERT_DOUBLE_NEAR(trades[0].meta["fill_price"].get<double>(), 110.0, 1e-12);
    assert(reloaded.trade_results(TradingMode::Paper).empty());
    assert(reloaded.events().size() == 1);
    cleanup_test_file();
}

TEST(corrupt_file_throws) {
    cleanup_test_file();
    {
        std::ofstream out(TEST_FILE);
        out << "{ not json";
    }
    bool thrown = false;
    try {
        JsonStore store(TEST_FILE);
    } catch (const std::runtime_error&) {
        thrown = true;
    }
    assert(thrown);
    cleanup_test_file();
}

// ============================================================================
// Shared file
// ============================================================================

TEST(approval_from_other_handle_survives_later_write) {
    cleanup_test_file();
    JsonStore loop_store(TEST_FILE);
    loop_store.insert_intent(make_record("i-1", DAY1));

    {
        JsonStore cli_store(TEST_FILE);
        intent::ApprovalGate gate(cli_store, util::sha256_hex("I APPROVE"));
        gate.approve("i-1", "I APPROVE", "alice", DAY1 + 1000);
    }

    // A write from the long-lived handle must not put back its old copy
    news::FeatureRow row;
    row.symbol = "BTC/USDT";
    row.ts = DAY1 + 2000;
    row.features_ref = "BTC/USDT:1704067202000:news_v1";
    loop_store.save_feature_row(row);

    JsonStore reloaded(TEST_FILE);
    assert(reloaded.get_approval("i-1").has_value());
    assert(reloaded.get_approval("i-1")->approved_by == "alice");
    assert(reloaded.get_intent("i-1")->status == IntentStatus::Approved);
    assert(reloaded.feature_rows("BTC/USDT").size() == 1);
    assert(reloaded.events().size() == 1);
    cleanup_test_file();
}

TEST(reads_pick_up_other_handle_writes) {
    cleanup_test_file();
    JsonStore reader(TEST_FILE);
    assert(!reader.get_intent("i-1").has_value());

    JsonStore writer(TEST_FILE);
    writer.insert_intent(make_record("i-1", DAY1));
    assert(reader.get_intent("i-1").has_value());

    writer.update_intent_status("i-1", IntentStatus::Approved, DAY1 + 1);
    assert(reader.get_intent("i-1")->status == IntentStatus::Approved);
    assert(reader.list_intents(IntentStatus::Approved).size() == 1);
    cleanup_test_file();
}

TEST(transaction_merges_with_other_handle_writes) {
    cleanup_test_file();
    JsonStore a(TEST_FILE);
    JsonStore b(TEST_FILE);
    a.insert_intent(make_record("i-1", DAY1));
    b.insert_intent(make_record("i-2", DAY1 + 1));

    a.transaction([&] {
        a.insert_execution(make_execution("e1", DAY1 + 2));
        a.update_intent_status("i-2", IntentStatus::Approved, DAY1 + 2);
    });

    JsonStore reloaded(TEST_FILE);
    assert(reloaded.list_intents(std::nullopt).size() == 2);
    assert(reloaded.get_intent("i-2")->status == IntentStatus::Approved);
    assert(reloaded.executions_for_intent("i-e1").size() == 1);
    cleanup_test_file();
}

TEST(concurrent_handles_lose_no_writes) {
    cleanup_test_file();
    const int per_thread = 40;
    auto worker = [&](const std::string& tag) {
        JsonStore store(TEST_FILE);
        for (int i = 0; i < per_thread; ++i)
            store.log_event(tag, {{"i", i}}, DAY1 + i);
    };
    std::thread t1(worker, "one");
    std::thread t2(worker, "two");
    t1.join();
    t2.join();

    JsonStore reloaded(TEST_FILE);
    assert(reloaded.events().size() == static_cast<size_t>(2 * per_thread));
    cleanup_test_file();
}

// ============================================================================
// Derived queries
// ============================================================================

TEST(position_state_average_cost) {
    JsonStore store;
    store.insert_fill(make_fill(Side::Buy, 1, 100, 1, DAY1));
    store.insert_fill(make_fill(Side::Buy, 1, 110, 1, DAY1 + 1));

    PositionState pos = store.position_state("BTC/USDT");
    ASSERT_DOUBLE_NEAR(pos.size, 2.0, 1e-12);
    ASSERT_DOUBLE_NEAR(pos.avg_cost, 106.0, 1e-12);  // (100 + 1 + 110 + 1) / 2

    store.insert_fill(make_fill(Side::Sell, 1.5, 120, 0, DAY1 + 2));
    pos = store.position_state("BTC/USDT");
    ASSERT_DOUBLE_NEAR(pos.size, 0.5, 1e-12);
    ASSERT_DOUBLE_NEAR(pos.avg_cost, 106.0, 1e-9);

    store.insert_fill(make_fill(Side::Sell, 0.5, 120, 0, DAY1 + 3));
    pos = store.position_state("BTC/USDT");
    ASSERT_DOUBLE_NEAR(pos.size, 0.0, 1e-12);
    ASSERT_DOUBLE_NEAR(pos.avg_cost, 0.0, 1e-12);
    ASSERT_DOUBLE_NEAR(store.position_state("ETH/USDT").size, 0.0, 1e-12);
}

TEST(daily_figures_by_utc_day) {
    JsonStore store;
    store.insert_execution(make_execution("e1", DAY1 + 1000));
    store.insert_execution(make_execution("e2", DAY1 + 2000));
    store.insert_execution(make_execution("e3", DAY2 + 1000));

    TradeResult loss;
    loss.trade_id = "t1";
    loss.pnl = -50;
    loss.created_at = DAY1 + 1000;
    store.insert_trade_result(loss);
    TradeResult gain;
    gain.trade_id = "t2";
    gain.pnl = 20;
    gain.created_at = DAY2 + 1000;
    store.insert_trade_result(gain);

    assert(store.daily_execution_count("2024-01-01") == 2);
    assert(store.daily_execution_count("2024-01-02") == 1);
    ASSERT_DOUBLE_NEAR(store.daily_realized_pnl("2024-01-01"), -50.0, 1e-12);
    assert(store.last_execution_time() == DAY2 + 1000);

    auto snap = store.risk_snapshot("BTC/USDT", "2024-01-01");
    assert(snap.executions_today == 2);
    ASSERT_DOUBLE_NEAR(snap.realized_pnl, -50.0, 1e-12);
    assert(snap.last_execution_at == DAY2 + 1000);
}

TEST(daily_figures_exclude_one_intent) {
    JsonStore store;
    store.insert_execution(make_execution("e1", DAY1 + 1000));
    store.insert_execution(make_execution("e2", DAY1 + 5000));

    assert(store.daily_execution_count("2024-01-01", "i-e2") == 1);
    assert(store.last_execution_time("i-e2") == DAY1 + 1000);

    auto snap = store.risk_snapshot("BTC/USDT", "2024-01-01", "i-e2");
    assert(snap.executions_today == 1);
    assert(snap.last_execution_at == DAY1 + 1000);

    assert(store.last_execution_time("i-e1") == DAY1 + 5000);
    assert(store.daily_execution_count("2024-01-01") == 2);
}

int main() {
    std::cout << "\n=== JSON Store Tests ===\n\n";

    std::cout << "Market Data:\n";
    RUN_TEST(upsert_replaces_by_timestamp);
    RUN_TEST(recent_candles_oldest_first_and_limited);
    RUN_TEST(latest_orderbook_by_timestamp);
    RUN_TEST(news_idempotent_by_id);
    RUN_TEST(feature_row_replaced_by_features_ref);
    RUN_TEST(events_capped_oldest_first);

    std::cout << "\nIntents:\n";
    RUN_TEST(insert_intent_is_idempotent);
    RUN_TEST(status_transitions_enforced);
    RUN_TEST(list_and_latest_filter_by_status);

    std::cout << "\nTransactions:\n";
    RUN_TEST(transaction_rolls_back_on_throw);
    RUN_TEST(transaction_commits_to_disk_together);
    RUN_TEST(failed_transaction_leaves_file_unchanged);

    std::cout << "\nPersistence:\n";
    RUN_TEST(reload_preserves_everything);
    RUN_TEST(corrupt_file_throws);

    std::cout << "\nShared File:\n";
    RUN_TEST(approval_from_other_handle_survives_later_write);
    RUN_TEST(reads_pick_up_other_handle_writes);
    RUN_TEST(transaction_merges_with_other_handle_writes);
    RUN_TEST(concurrent_handles_lose_no_writes);

    std::cout << "\nDerived Queries:\n";
    RUN_TEST(position_state_average_cost);
    RUN_TEST(daily_figures_by_utc_day);
    RUN_TEST(daily_figures_exclude_one_intent);

    std::cout << "\n=== All tests PASSED! ===\n\n";
    return 0;
}
