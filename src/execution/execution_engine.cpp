#include "../../include/tradegate/execution/execution_engine.hpp"
#include "../../include/tradegate/execution/maker_price.hpp"
#include "../../include/tradegate/util/crypto.hpp"
#include "../../include/tradegate/util/time_utils.hpp"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <cmath>
#include <cstdlib>
#include <thread>

namespace tradegate {
namespace execution {

namespace {

std::string lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

strategy::TradePlan plan_from_intent(const intent::OrderIntent& intent) {
    strategy::TradePlan plan;
    plan.symbol = intent.symbol;
    plan.side = intent.side;
    plan.size = intent.size;
    plan.price = intent.price;
    plan.confidence = intent.confidence;
    plan.rationale = intent.rationale;
    plan.strategy = intent.strategy;
    return plan;
}

}  // namespace

ExecutionEngine::ExecutionEngine(const config::Settings& settings, store::IStore& store,
                                 exchange::IMarketClient* client)
    : settings_(settings), store_(store), client_(client), approvals_(store, settings.approval_phrase_hash()),
      risk_(settings.risk, settings.trading), paper_model_(settings.paper) {
    clock_ = [] { return util::wall_clock_ms(); };
    sleeper_ = [](double seconds) {
        std::this_thread::sleep_for(std::chrono::milliseconds(static_cast<int64_t>(seconds * 1000)));
    };
    env_ = [](const std::string& name) -> std::optional<std::string> {
        const char* value = std::getenv(name.c_str());
        if (!value)
            return std::nullopt;
        return std::string(value);
    };
}

// =============================================================================
// Gates
// =============================================================================

bool ExecutionEngine::autopilot_ok(const intent::OrderIntent& intent) const {
    const auto& ap = settings_.autopilot;
    if (!ap.enabled)
        return false;
    if (std::find(ap.symbol_whitelist.begin(), ap.symbol_whitelist.end(), intent.symbol) == ap.symbol_whitelist.end())
        return false;
    if (intent.notional() > ap.max_order_notional)
        return false;
    if (settings_.risk.max_loss_per_trade > ap.max_loss_per_trade)
        return false;
    if (intent.confidence < ap.min_confidence)
        return false;
    return true;
}

std::optional<std::string> ExecutionEngine::live_gate_failure() const {
    if (settings_.trading.dry_run)
        return "dry_run enabled";

    auto ack = env_(LIVE_ACK_ENV);
    bool ack_env = ack && lower(*ack) == "true";
    if (!(settings_.trading.i_understand_live_trading && ack_env))
        return "live trading not acknowledged";

    auto key = env_(settings_.exchange.api_key_env);
    auto secret = env_(settings_.exchange.api_secret_env);
    if (!key || key->empty() || !secret || secret->empty())
        return "missing API credentials";

    if (!client_)
        return "exchange client missing";
    return std::nullopt;
}

risk::RiskDecision ExecutionEngine::recheck_risk(const intent::OrderIntent& intent, Timestamp now) const {
    std::string day = util::utc_day(now);
    // A resting paper order is retried each cycle; its own earlier attempts
    // must not trip cooldown or the daily order limit
    auto snap = store_.risk_snapshot(intent.symbol, day, intent.intent_id);

    risk::RiskContext ctx;
    ctx.position = snap.position;
    ctx.state = risk::RiskState::from_storage_snapshot(snap, intent.price, day);
    ctx.now = now;
    auto closes = store_.recent_candles(intent.symbol, settings_.trading.primary_timeframe(), 2);
    if (closes.size() == 2) {
        ctx.prev_close = closes[0].close;
        ctx.last_close = closes[1].close;
    }
    return risk_.evaluate(plan_from_intent(intent), ctx);
}

ExecutionResult ExecutionEngine::reject(const std::string& intent_id, const std::string& message, Timestamp now) {
    store_.log_event("execute_rejected", {{"intent_id", intent_id}, {"reason", message}}, now);
    TG_LOGF_WARN(logger_, Execution, "execute %s rejected: %s", intent_id.c_str(), message.c_str());
    return ExecutionResult{IntentStatus::Rejected, message, std::nullopt};
}

// =============================================================================
// Entry point
// =============================================================================

ExecutionResult ExecutionEngine::execute(const std::string& intent_id, TradingMode mode) {
    Timestamp now = clock_();

    auto record = store_.get_intent(intent_id);
    if (!record) {
        return ExecutionResult{IntentStatus::Error, "intent not found", std::nullopt};
    }
    const intent::OrderIntent& intent = record->intent;

    if (!record->hash_matches()) {
        return reject(intent_id, "intent hash mismatch", now);
    }
    if (is_terminal(record->status)) {
        return reject(intent_id, std::string("intent already ") + status_to_string(record->status), now);
    }
    if (mode != intent.mode) {
        return reject(intent_id, "mode mismatch", now);
    }
    if (intent::is_expired(intent, now)) {
        store_.update_intent_status(intent_id, IntentStatus::Expired, now);
        return reject(intent_id, "intent expired", now);
    }
    if (settings_.trading.require_approval && !autopilot_ok(intent) && !approvals_.verify(intent)) {
        return reject(intent_id, "approval required", now);
    }
    if (mode == TradingMode::Live) {
        if (auto failure = live_gate_failure()) {
            return reject(intent_id, *failure, now);
        }
    }

    auto decision = recheck_risk(intent, now);
    if (!decision.approved || !decision.plan || std::abs(decision.plan->size - intent.size) > SIZE_EPSILON) {
        std::string reason = decision.approved ? "size adjusted" : decision.reason;
        store_.update_intent_status(intent_id, IntentStatus::Rejected, now);
        return reject(intent_id, "risk re-check failed: " + reason + "; re-propose", now);
    }

    return mode == TradingMode::Paper ? execute_paper(intent, now) : execute_live(intent, now);
}

// =============================================================================
// Recording
// =============================================================================

void ExecutionEngine::record(const intent::OrderIntent& intent, const store::Execution& execution, double fill_size,
                             double fill_price, double fee, Timestamp now) {
    store_.transaction([&] {
        double avg_cost = store_.position_state(intent.symbol).avg_cost;

        store_.insert_execution(execution);
        if (fill_size > 0) {
            store::Fill fill;
            fill.fill_id = util::uuid4();
            fill.exec_id = execution.exec_id;
            fill.symbol = intent.symbol;
            fill.side = intent.side;
            fill.size = fill_size;
            fill.price = fill_price;
            fill.fee = fee;
            fill.fee_currency = settings_.trading.base_currency;
            fill.ts = now;
            store_.insert_fill(fill);

            store::TradeResult result;
            result.trade_id = util::uuid4();
            result.intent_id = intent.intent_id;
            result.symbol = intent.symbol;
            result.side = intent.side;
            result.pnl = intent.side == Side::Sell ? (fill_price - avg_cost) * fill_size - fee : 0.0;
            result.mode = execution.mode;
            result.created_at = now;
            result.meta = {{"fill_price", fill_price},
                           {"size", fill_size},
                           {"notional", fill_price * fill_size},
                           {"fee", fee}};
            store_.insert_trade_result(result);
        }
        store_.update_intent_status(intent.intent_id, execution.status, now);
        store_.log_event("execute",
                         {{"intent_id", intent.intent_id},
                          {"exec_id", execution.exec_id},
                          {"status", status_to_string(execution.status)}},
                         now);
    });
}

// =============================================================================
// Paper
// =============================================================================

ExecutionResult ExecutionEngine::execute_paper(const intent::OrderIntent& intent, Timestamp now) {
    auto stored_book = store_.latest_orderbook(intent.symbol);
    market::OrderbookTop book = stored_book ? *stored_book
                                            : estimate_orderbook_from_price(intent.price, settings_.paper.spread_bps, now);

    PaperFill fill = paper_model_.simulate(intent, book);

    store::Execution execution;
    execution.exec_id = util::uuid4();
    execution.intent_id = intent.intent_id;
    execution.intent_hash = intent.hash();
    execution.executed_at = now;
    execution.mode = TradingMode::Paper;
    execution.status = fill.status;
    execution.fee = fill.fee;
    execution.slippage_model = PAPER_SLIPPAGE_MODEL;
    execution.details = {{"message", fill.message},
                         {"book_source", stored_book ? "snapshot" : "estimated"},
                         {"bid", book.bid},
                         {"ask", book.ask}};

    record(intent, execution, fill.filled ? fill.size : 0.0, fill.price, fill.fee, now);

    TG_LOGF_INFO(logger_, Execution, "paper %s %s %.8f @ %.8f -> %s (%s)", side_to_string(intent.side),
                 intent.symbol.c_str(), intent.size, fill.filled ? fill.price : intent.price,
                 status_to_string(fill.status), fill.message.c_str());
    return ExecutionResult{fill.status, fill.message, execution.exec_id};
}

// =============================================================================
// Live
// =============================================================================

ExecutionResult ExecutionEngine::execute_live(const intent::OrderIntent& intent, Timestamp now) {
    store::Execution execution;
    execution.exec_id = util::uuid4();
    execution.intent_id = intent.intent_id;
    execution.intent_hash = intent.hash();
    execution.executed_at = now;
    execution.mode = TradingMode::Live;
    execution.slippage_model = LIVE_SLIPPAGE_MODEL;

    // Outside the try so a failure after a partial fill still records it
    std::string order_id;
    double filled = 0;
    double avg_price = 0;

    try {
        nlohmann::json details = {{"requested_price", intent.price}, {"maker_emulation", false}};
        double order_price = intent.price;
        bool post_only = settings_.trading.post_only;

        if (post_only && !client_->has_post_only()) {
            market::OrderbookTop book;
            std::optional<double> tick;
            std::optional<std::string> emulation_error;
            try {
                book = client_->fetch_orderbook(intent.symbol);
                if (settings_.trading.maker_emulation.use_tick)
                    tick = client_->price_tick(intent.symbol);
            } catch (const std::exception& e) {
                emulation_error = e.what();
            }
            if (emulation_error) {
                details["maker_emulation"] = true;
                details["maker_emulation_error"] = *emulation_error;
                TG_LOGF_WARN(logger_, Execution, "maker emulation skipped: %s", emulation_error->c_str());
            } else {
                auto quote = emulate_post_only_price(intent.side, intent.price, book, tick,
                                                     settings_.trading.maker_emulation);
                order_price = quote.price;
                details.update(quote.details);
            }
        }

        exchange::OrderAck ack = client_->create_limit_order(intent.symbol, intent.side, intent.size, order_price, post_only);
        order_id = ack.order_id;
        TG_LOGF_INFO(logger_, Execution, "live order %s placed: %s %s %.8f @ %.8f", ack.order_id.c_str(),
                     side_to_string(intent.side), intent.symbol.c_str(), intent.size, order_price);

        Timestamp deadline = now + static_cast<Timestamp>(settings_.trading.order_timeout_seconds) * 1000;
        std::string status = "open";
        while (clock_() < deadline) {
            exchange::OrderInfo info = client_->fetch_order(ack.order_id, intent.symbol);
            status = info.status;
            filled = info.filled;
            avg_price = info.average > 0 ? info.average : (info.price > 0 ? info.price : order_price);
            if (status == "closed" || status == "canceled")
                break;
            sleeper_(POLL_INTERVAL_SECONDS);
        }

        IntentStatus final_status = IntentStatus::Canceled;
        std::string message = "live execution";
        if (status == "closed") {
            final_status = IntentStatus::Filled;
        } else if (status != "canceled") {
            // The order may still rest on the exchange; keep what already filled
            try {
                client_->cancel_order(ack.order_id, intent.symbol);
                details["canceled_on_timeout"] = true;
            } catch (const std::exception& e) {
                final_status = IntentStatus::Error;
                message = std::string("cancel failed: ") + e.what();
                details["cancel_error"] = e.what();
                TG_LOGF_ERROR(logger_, Execution, "cancel of live order %s failed: %s", ack.order_id.c_str(),
                              e.what());
            }
        }

        details["order_id"] = ack.order_id;
        details["filled"] = filled;
        details["avg_price"] = avg_price;
        details["fee_assumed_zero"] = true;
        execution.status = final_status;
        execution.fee = 0.0;
        execution.details = details;

        Timestamp done = clock_();
        record(intent, execution, filled, avg_price, 0.0, done);

        TG_LOGF_INFO(logger_, Execution, "live order %s -> %s filled=%.8f", ack.order_id.c_str(),
                     status_to_string(final_status), filled);
        return ExecutionResult{final_status, message, execution.exec_id};
    } catch (const std::exception& e) {
        execution.status = IntentStatus::Error;
        execution.fee = 0.0;
        execution.details = {{"error", e.what()}};
        if (!order_id.empty()) {
            execution.details["order_id"] = order_id;
            execution.details["filled"] = filled;
            execution.details["avg_price"] = avg_price;
            execution.details["fee_assumed_zero"] = true;
        }
        record(intent, execution, filled, avg_price, 0.0, clock_());

        TG_LOGF_ERROR(logger_, Execution, "live execution of %s failed: %s", intent.intent_id.c_str(), e.what());
        return ExecutionResult{IntentStatus::Error, e.what(), execution.exec_id};
    }
}

}  // namespace execution
}  // namespace tradegate
