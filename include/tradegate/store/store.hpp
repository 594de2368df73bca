#pragma once

#include "../intent/order_intent.hpp"
#include "../market/market_data.hpp"
#include "../news/news_features.hpp"
#include "../risk/risk_state.hpp"
#include "records.hpp"

#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace tradegate {
namespace store {

/**
 * Storage interface
 *
 * Writes outside a transaction are durable when the call returns. Writes
 * inside transaction(fn) become durable together when fn returns; if fn
 * throws, none of them are kept and the exception propagates.
 */
class IStore {
public:
    virtual ~IStore() = default;

    // ========================================
    // Market data
    // ========================================

    // Insert or replace by (symbol, timeframe, ts); returns number of candles written
    virtual size_t upsert_candles(const std::string& symbol, const std::string& timeframe,
                                  const std::vector<market::Candle>& candles) = 0;

    // Most recent `limit` candles, oldest first
    virtual std::vector<market::Candle> recent_candles(const std::string& symbol, const std::string& timeframe,
                                                       size_t limit) const = 0;

    virtual void save_orderbook(const std::string& symbol, const market::OrderbookTop& top) = 0;
    virtual std::optional<market::OrderbookTop> latest_orderbook(const std::string& symbol) const = 0;

    // ========================================
    // News and features
    // ========================================

    // Idempotent by item id; returns false if already stored
    virtual bool insert_news(const news::NewsFeature& item) = 0;
    virtual std::vector<news::NewsFeature> news_published_between(Timestamp start, Timestamp end) const = 0;

    virtual void save_feature_row(const news::FeatureRow& row) = 0;
    virtual std::vector<news::FeatureRow> feature_rows(const std::string& symbol) const = 0;

    // ========================================
    // Intents and approvals
    // ========================================

    // Idempotent by intent_id; returns false (and changes nothing) on a repeat
    virtual bool insert_intent(const intent::IntentRecord& record) = 0;
    virtual std::optional<intent::IntentRecord> get_intent(const std::string& intent_id) const = 0;

    // Returns false if the intent is missing or the move is not allowed
    virtual bool update_intent_status(const std::string& intent_id, IntentStatus status, Timestamp now) = 0;

    virtual std::vector<intent::IntentRecord> list_intents(std::optional<IntentStatus> status) const = 0;
    virtual std::optional<intent::IntentRecord> latest_intent(std::optional<IntentStatus> status) const = 0;

    virtual void save_approval(const Approval& approval) = 0;
    virtual std::optional<Approval> get_approval(const std::string& intent_id) const = 0;

    // ========================================
    // Executions
    // ========================================

    virtual void insert_execution(const Execution& execution) = 0;
    virtual void insert_fill(const Fill& fill) = 0;
    virtual void insert_trade_result(const TradeResult& result) = 0;

    virtual std::vector<Execution> executions_for_intent(const std::string& intent_id) const = 0;
    virtual std::vector<Fill> fills(const std::string& symbol) const = 0;
    virtual std::vector<TradeResult> trade_results(std::optional<TradingMode> mode) const = 0;

    // ========================================
    // Audit
    // ========================================

    virtual void log_event(const std::string& type, const json& payload, Timestamp ts) = 0;
    virtual std::vector<AuditEvent> events() const = 0;

    // ========================================
    // Derived queries
    // ========================================

    virtual PositionState position_state(const std::string& symbol) const = 0;
    virtual double daily_realized_pnl(const std::string& day) const = 0;
    // Executions of `exclude_intent_id` (if non-empty) are left out
    virtual int daily_execution_count(const std::string& day, const std::string& exclude_intent_id = "") const = 0;
    virtual std::optional<Timestamp> last_execution_time(const std::string& exclude_intent_id = "") const = 0;

    /**
     * Position and day figures for a risk check
     *
     * @param exclude_intent_id Intent being re-executed; its own earlier
     *        attempts do not count toward cooldown or the daily order limit
     */
    risk::RiskSnapshot risk_snapshot(const std::string& symbol, const std::string& day,
                                     const std::string& exclude_intent_id = "") const {
        risk::RiskSnapshot snap;
        PositionState pos = position_state(symbol);
        snap.position = pos.size;
        snap.avg_cost = pos.avg_cost;
        snap.realized_pnl = daily_realized_pnl(day);
        snap.executions_today = daily_execution_count(day, exclude_intent_id);
        snap.last_execution_at = last_execution_time(exclude_intent_id);
        return snap;
    }

    // ========================================
    // Transactions
    // ========================================

    virtual void transaction(const std::function<void()>& fn) = 0;
};

}  // namespace store
}  // namespace tradegate
