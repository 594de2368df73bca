#pragma once

#include "../types.hpp"

#include <optional>
#include <string>

namespace tradegate {
namespace risk {

/**
 * Raw per-day figures read from storage
 */
struct RiskSnapshot {
    double realized_pnl = 0;
    int executions_today = 0;
    std::optional<Timestamp> last_execution_at;
    double position = 0;
    double avg_cost = 0;
};

/**
 * RiskState - one UTC day of loss and frequency state
 */
struct RiskState {
    std::string day;  // "YYYY-MM-DD"
    double realized_pnl = 0;
    double unrealized_pnl = 0;
    int executions_today = 0;
    std::optional<Timestamp> last_execution_at;

    /**
     * Build from stored fills/executions, marking the open position at mark_price
     */
    static RiskState from_storage_snapshot(const RiskSnapshot& snap, double mark_price, std::string day) {
        RiskState s;
        s.day = std::move(day);
        s.realized_pnl = snap.realized_pnl;
        s.executions_today = snap.executions_today;
        s.last_execution_at = snap.last_execution_at;
        if (snap.position > 0 && mark_price > 0) {
            s.unrealized_pnl = (mark_price - snap.avg_cost) * snap.position;
        }
        return s;
    }

    static RiskState fresh_for_day(std::string day) {
        RiskState s;
        s.day = std::move(day);
        return s;
    }

    // Realized PnL plus open losses; open gains do not count toward the limit
    double daily_loss_basis() const { return realized_pnl + (unrealized_pnl < 0 ? unrealized_pnl : 0.0); }
};

}  // namespace risk
}  // namespace tradegate
