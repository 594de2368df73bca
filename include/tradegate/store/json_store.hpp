#pragma once

#include "store.hpp"

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace tradegate {
namespace store {

/**
 * JsonStore - single-document JSON persistence
 *
 * The whole store is one JSON file. Every durable write serializes the
 * document to <path>.tmp and renames it over <path> (atomic on POSIX), so a
 * crash leaves either the old or the new document, never a torn one.
 *
 * Several processes may share one file (a running loop plus approve or
 * execute from the command line). Each write or transaction holds an
 * exclusive flock on <path>.lock, reloads the document if another handle
 * replaced it, applies the change and writes it back. Reads reload when
 * the file on disk is no longer the one last loaded.
 *
 * An empty path keeps everything in memory (tests, dry runs).
 *
 * Not thread-safe; one owner thread per handle.
 *
 * Usage:
 *   JsonStore store("data/tradegate_store.json");
 *   store.transaction([&] {
 *       store.insert_execution(exec);
 *       store.insert_fill(fill);
 *   });
 */
class JsonStore : public IStore {
public:
    static constexpr int SCHEMA_VERSION = 1;
    static constexpr size_t MAX_ORDERBOOKS_PER_SYMBOL = 500;
    static constexpr size_t MAX_EVENTS = 10000;

    /**
     * @throws std::runtime_error if an existing file cannot be parsed
     */
    explicit JsonStore(std::string path = "");

    JsonStore(const JsonStore&) = delete;
    JsonStore& operator=(const JsonStore&) = delete;

    size_t upsert_candles(const std::string& symbol, const std::string& timeframe,
                          const std::vector<market::Candle>& candles) override;
    std::vector<market::Candle> recent_candles(const std::string& symbol, const std::string& timeframe,
                                               size_t limit) const override;
    void save_orderbook(const std::string& symbol, const market::OrderbookTop& top) override;
    std::optional<market::OrderbookTop> latest_orderbook(const std::string& symbol) const override;

    bool insert_news(const news::NewsFeature& item) override;
    std::vector<news::NewsFeature> news_published_between(Timestamp start, Timestamp end) const override;
    void save_feature_row(const news::FeatureRow& row) override;
    std::vector<news::FeatureRow> feature_rows(const std::string& symbol) const override;

    bool insert_intent(const intent::IntentRecord& record) override;
    std::optional<intent::IntentRecord> get_intent(const std::string& intent_id) const override;
    bool update_intent_status(const std::string& intent_id, IntentStatus status, Timestamp now) override;
    std::vector<intent::IntentRecord> list_intents(std::optional<IntentStatus> status) const override;
    std::optional<intent::IntentRecord> latest_intent(std::optional<IntentStatus> status) const override;

    void save_approval(const Approval& approval) override;
    std::optional<Approval> get_approval(const std::string& intent_id) const override;

    void insert_execution(const Execution& execution) override;
    void insert_fill(const Fill& fill) override;
    void insert_trade_result(const TradeResult& result) override;
    std::vector<Execution> executions_for_intent(const std::string& intent_id) const override;
    std::vector<Fill> fills(const std::string& symbol) const override;
    std::vector<TradeResult> trade_results(std::optional<TradingMode> mode) const override;

    void log_event(const std::string& type, const json& payload, Timestamp ts) override;
    std::vector<AuditEvent> events() const override;

    PositionState position_state(const std::string& symbol) const override;
    double daily_realized_pnl(const std::string& day) const override;
    int daily_execution_count(const std::string& day, const std::string& exclude_intent_id = "") const override;
    std::optional<Timestamp> last_execution_time(const std::string& exclude_intent_id = "") const override;

    void transaction(const std::function<void()>& fn) override;

    const std::string& path() const { return path_; }
    std::string lock_path() const { return path_ + ".lock"; }
    bool in_memory() const { return path_.empty(); }

private:
    struct Data {
        // key: "<symbol>|<timeframe>", inner map ordered by ts
        std::map<std::string, std::map<Timestamp, market::Candle>> candles;
        std::map<std::string, std::vector<market::OrderbookTop>> orderbooks;
        std::map<std::string, news::NewsFeature> news;
        std::vector<news::FeatureRow> feature_rows;
        std::vector<intent::IntentRecord> intents;  // insertion order
        std::map<std::string, Approval> approvals;
        std::vector<Execution> executions;
        std::vector<Fill> fills;
        std::vector<TradeResult> trade_results;
        std::vector<AuditEvent> events;
    };

    // Identity of the file last loaded or written; a rename by another
    // handle changes the inode even when size and mtime collide
    struct FileSignature {
        bool exists = false;
        uint64_t device = 0;
        uint64_t inode = 0;
        int64_t size = 0;
        int64_t mtime_ns = 0;

        bool operator==(const FileSignature& o) const {
            return exists == o.exists && device == o.device && inode == o.inode && size == o.size &&
                   mtime_ns == o.mtime_ns;
        }
    };

    std::string path_;
    // Cache of the on-disk document, refreshed from const readers
    mutable Data data_;
    mutable std::optional<FileSignature> loaded_;
    int tx_depth_ = 0;

    FileSignature stat_file() const;
    void load() const;
    void refresh() const;
    void write_file();

    // Runs one write against the current document under the file lock;
    // `change` returns false when it left the document untouched
    bool apply(const std::function<bool()>& change);

    intent::IntentRecord* find_intent(const std::string& intent_id);
    const intent::IntentRecord* find_intent(const std::string& intent_id) const;

    static json to_json(const Data& data);
    static Data from_json(const json& doc);
};

}  // namespace store
}  // namespace tradegate
