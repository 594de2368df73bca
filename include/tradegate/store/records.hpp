#pragma once

#include "../types.hpp"

#include <nlohmann/json.hpp>

#include <string>

namespace tradegate {
namespace store {

using json = nlohmann::json;

/**
 * Human approval bound to one intent hash. The phrase itself is never stored.
 */
struct Approval {
    std::string intent_id;
    std::string intent_hash;
    Timestamp approved_at = 0;
    std::string approved_by;
    std::string approval_phrase_hash;
};

/**
 * One execution attempt; owns zero or more fills
 */
struct Execution {
    std::string exec_id;
    std::string intent_id;
    std::string intent_hash;
    Timestamp executed_at = 0;
    TradingMode mode = TradingMode::Paper;
    IntentStatus status = IntentStatus::Error;
    double fee = 0;
    std::string slippage_model;  // "paper_v1", "live"
    json details = json::object();
};

struct Fill {
    std::string fill_id;
    std::string exec_id;
    std::string symbol;
    Side side = Side::Buy;
    double size = 0;
    double price = 0;
    double fee = 0;
    std::string fee_currency;
    Timestamp ts = 0;
};

/**
 * Realized outcome of a fill (pnl is 0 for buys)
 */
struct TradeResult {
    std::string trade_id;
    std::string intent_id;
    std::string symbol;
    Side side = Side::Buy;
    double pnl = 0;
    TradingMode mode = TradingMode::Paper;
    Timestamp created_at = 0;
    json meta = json::object();  // fill_price, size, notional, fee
};

struct AuditEvent {
    Timestamp ts = 0;
    std::string type;
    json payload = json::object();
};

struct PositionState {
    double size = 0;
    double avg_cost = 0;  // includes buy fees
};

}  // namespace store
}  // namespace tradegate
