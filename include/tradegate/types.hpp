#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace tradegate {

// =============================================================================
// Core Types
// =============================================================================

// Milliseconds since Unix epoch (UTC)
using Timestamp = int64_t;

// Tolerance for size equality checks (base units)
constexpr double SIZE_EPSILON = 1e-9;

enum class Side : uint8_t { Buy = 0, Sell = 1, Hold = 2 };

enum class TradingMode : uint8_t { Paper = 0, Live = 1 };

/**
 * Intent lifecycle status
 *
 * proposed -> approved -> {open | filled | rejected | expired | error | canceled}
 * open may still move to a terminal state. Nothing returns to proposed.
 */
enum class IntentStatus : uint8_t { Proposed = 0, Approved, Open, Filled, Rejected, Expired, Error, Canceled };

inline const char* side_to_string(Side side) {
    switch (side) {
    case Side::Buy:
        return "buy";
    case Side::Sell:
        return "sell";
    case Side::Hold:
        return "hold";
    }
    return "hold";
}

inline std::optional<Side> parse_side(std::string_view s) {
    if (s == "buy")
        return Side::Buy;
    if (s == "sell")
        return Side::Sell;
    if (s == "hold")
        return Side::Hold;
    return std::nullopt;
}

inline const char* mode_to_string(TradingMode mode) {
    return mode == TradingMode::Live ? "live" : "paper";
}

inline std::optional<TradingMode> parse_mode(std::string_view s) {
    if (s == "paper")
        return TradingMode::Paper;
    if (s == "live")
        return TradingMode::Live;
    return std::nullopt;
}

inline const char* status_to_string(IntentStatus status) {
    switch (status) {
    case IntentStatus::Proposed:
        return "proposed";
    case IntentStatus::Approved:
        return "approved";
    case IntentStatus::Open:
        return "open";
    case IntentStatus::Filled:
        return "filled";
    case IntentStatus::Rejected:
        return "rejected";
    case IntentStatus::Expired:
        return "expired";
    case IntentStatus::Error:
        return "error";
    case IntentStatus::Canceled:
        return "canceled";
    }
    return "error";
}

inline std::optional<IntentStatus> parse_status(std::string_view s) {
    if (s == "proposed")
        return IntentStatus::Proposed;
    if (s == "approved")
        return IntentStatus::Approved;
    if (s == "open")
        return IntentStatus::Open;
    if (s == "filled")
        return IntentStatus::Filled;
    if (s == "rejected")
        return IntentStatus::Rejected;
    if (s == "expired")
        return IntentStatus::Expired;
    if (s == "error")
        return IntentStatus::Error;
    if (s == "canceled")
        return IntentStatus::Canceled;
    return std::nullopt;
}

inline bool is_terminal(IntentStatus status) {
    switch (status) {
    case IntentStatus::Filled:
    case IntentStatus::Rejected:
    case IntentStatus::Expired:
    case IntentStatus::Error:
    case IntentStatus::Canceled:
        return true;
    default:
        return false;
    }
}

/**
 * Allowed status moves. Terminal states never move; nothing goes back to proposed;
 * an open (resting) order cannot be re-approved.
 */
inline bool can_transition(IntentStatus from, IntentStatus to) {
    if (is_terminal(from) || to == IntentStatus::Proposed)
        return false;
    if (from == IntentStatus::Open && to == IntentStatus::Approved)
        return false;
    return true;
}

}  // namespace tradegate
