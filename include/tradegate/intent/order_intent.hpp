#pragma once

#include "../strategy/trade_plan.hpp"
#include "../types.hpp"

#include <nlohmann/json.hpp>

#include <optional>
#include <string>

namespace tradegate {
namespace intent {

using json = nlohmann::json;

/**
 * OrderIntent - a frozen, hashable order request
 *
 * Immutable once created; status lives beside it in IntentRecord.
 * The hash covers every field below, so any edit to a stored intent is
 * detectable by recomputing it.
 */
struct OrderIntent {
    std::string intent_id;
    Timestamp created_at = 0;
    std::string symbol;
    Side side = Side::Hold;
    double size = 0;
    double price = 0;
    std::string order_type = "limit";
    std::string time_in_force = "GTC";
    std::string strategy;
    double confidence = 0;
    std::string rationale;
    std::optional<std::string> rationale_features_ref;
    Timestamp expires_at = 0;
    TradingMode mode = TradingMode::Paper;

    double notional() const { return size * price; }

    json to_json() const;
    static OrderIntent from_json(const json& j);

    // Sorted keys, no whitespace, ASCII-only
    std::string canonical_json() const;

    // Lowercase hex SHA-256 of canonical_json()
    std::string hash() const;
};

/**
 * Freeze a plan into a new intent with a fresh UUIDv4
 */
OrderIntent from_plan(const strategy::TradePlan& plan, TradingMode mode, int expiry_seconds,
                      std::optional<std::string> features_ref, Timestamp now);

inline bool is_expired(const OrderIntent& intent, Timestamp now) {
    return now >= intent.expires_at;
}

/**
 * Stored form: the intent, its hash at creation, and the mutable status
 */
struct IntentRecord {
    OrderIntent intent;
    std::string intent_hash;
    IntentStatus status = IntentStatus::Proposed;
    Timestamp updated_at = 0;

    static IntentRecord create(const OrderIntent& intent) {
        return IntentRecord{intent, intent.hash(), IntentStatus::Proposed, intent.created_at};
    }

    // Recomputed hash matches the one stored at creation
    bool hash_matches() const { return intent.hash() == intent_hash; }
};

}  // namespace intent
}  // namespace tradegate
