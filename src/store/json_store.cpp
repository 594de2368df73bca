#include "../../include/tradegate/store/json_store.hpp"
#include "../../include/tradegate/util/file_lock.hpp"
#include "../../include/tradegate/util/time_utils.hpp"

#include <algorithm>
#include <cstdio>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <stdexcept>

#include <sys/stat.h>

namespace tradegate {
namespace store {

namespace {

std::string candle_key(const std::string& symbol, const std::string& timeframe) {
    return symbol + "|" + timeframe;
}

void ensure_parent_dir(const std::string& path) {
    std::filesystem::path target(path);
    if (target.has_parent_path())
        std::filesystem::create_directories(target.parent_path());
}

json time_to_json(Timestamp ts) {
    return util::format_iso8601(ts);
}

// Accepts ISO text or integer milliseconds
Timestamp time_from_json(const json& j) {
    if (j.is_number_integer())
        return j.get<Timestamp>();
    auto ts = util::parse_iso8601(j.get<std::string>());
    if (!ts)
        throw std::runtime_error("store: bad timestamp '" + j.get<std::string>() + "'");
    return *ts;
}

template <typename E>
E enum_from_json(const json& j, std::optional<E> (*parse)(std::string_view), const char* what) {
    auto v = parse(j.get<std::string>());
    if (!v)
        throw std::runtime_error(std::string("store: bad ") + what + " '" + j.get<std::string>() + "'");
    return *v;
}

// =============================================================================
// Record <-> JSON
// =============================================================================

json candle_to_json(const market::Candle& c) {
    return json{{"ts", c.ts}, {"open", c.open}, {"high", c.high}, {"low", c.low}, {"close", c.close}, {"volume", c.volume}};
}

market::Candle candle_from_json(const json& j) {
    market::Candle c;
    c.ts = j.at("ts").get<Timestamp>();
    c.open = j.at("open").get<double>();
    c.high = j.at("high").get<double>();
    c.low = j.at("low").get<double>();
    c.close = j.at("close").get<double>();
    c.volume = j.value("volume", 0.0);
    return c;
}

json orderbook_to_json(const market::OrderbookTop& t) {
    return json{{"ts", t.ts}, {"bid", t.bid}, {"ask", t.ask}, {"bid_size", t.bid_size}, {"ask_size", t.ask_size}};
}

market::OrderbookTop orderbook_from_json(const json& j) {
    market::OrderbookTop t;
    t.ts = j.at("ts").get<Timestamp>();
    t.bid = j.at("bid").get<double>();
    t.ask = j.at("ask").get<double>();
    t.bid_size = j.value("bid_size", 0.0);
    t.ask_size = j.value("ask_size", 0.0);
    return t;
}

json news_to_json(const news::NewsFeature& n) {
    return json{{"id", n.id},
                {"source", n.source},
                {"title", n.title},
                {"sentiment", n.sentiment},
                {"source_weight", n.source_weight},
                {"published_at", time_to_json(n.published_at)},
                {"observed_at", time_to_json(n.observed_at)}};
}

news::NewsFeature news_from_json(const json& j) {
    news::NewsFeature n;
    n.id = j.at("id").get<std::string>();
    n.source = j.value("source", std::string());
    n.title = j.value("title", std::string());
    n.sentiment = j.at("sentiment").get<double>();
    n.source_weight = j.value("source_weight", 1.0);
    n.published_at = time_from_json(j.at("published_at"));
    n.observed_at = time_from_json(j.at("observed_at"));
    return n;
}

json feature_row_to_json(const news::FeatureRow& r) {
    return json{{"symbol", r.symbol},
                {"ts", time_to_json(r.ts)},
                {"features_ref", r.features_ref},
                {"sentiment_weighted", r.features.sentiment_weighted},
                {"news_count", r.features.news_count},
                {"positive_count", r.features.positive_count},
                {"negative_count", r.features.negative_count},
                {"avg_source_weight", r.features.avg_source_weight}};
}

news::FeatureRow feature_row_from_json(const json& j) {
    news::FeatureRow r;
    r.symbol = j.at("symbol").get<std::string>();
    r.ts = time_from_json(j.at("ts"));
    r.features_ref = j.value("features_ref", std::string());
    r.features.sentiment_weighted = j.value("sentiment_weighted", 0.0);
    r.features.news_count = j.value("news_count", 0);
    r.features.positive_count = j.value("positive_count", 0);
    r.features.negative_count = j.value("negative_count", 0);
    r.features.avg_source_weight = j.value("avg_source_weight", 0.0);
    return r;
}

json intent_record_to_json(const intent::IntentRecord& r) {
    return json{{"intent", r.intent.to_json()},
                {"intent_hash", r.intent_hash},
                {"status", status_to_string(r.status)},
                {"updated_at", time_to_json(r.updated_at)}};
}

intent::IntentRecord intent_record_from_json(const json& j) {
    intent::IntentRecord r;
    r.intent = intent::OrderIntent::from_json(j.at("intent"));
    r.intent_hash = j.at("intent_hash").get<std::string>();
    r.status = enum_from_json<IntentStatus>(j.at("status"), parse_status, "status");
    r.updated_at = time_from_json(j.at("updated_at"));
    return r;
}

json approval_to_json(const Approval& a) {
    return json{{"intent_id", a.intent_id},
                {"intent_hash", a.intent_hash},
                {"approved_at", time_to_json(a.approved_at)},
                {"approved_by", a.approved_by},
                {"approval_phrase_hash", a.approval_phrase_hash}};
}

Approval approval_from_json(const json& j) {
    Approval a;
    a.intent_id = j.at("intent_id").get<std::string>();
    a.intent_hash = j.at("intent_hash").get<std::string>();
    a.approved_at = time_from_json(j.at("approved_at"));
    a.approved_by = j.value("approved_by", std::string());
    a.approval_phrase_hash = j.at("approval_phrase_hash").get<std::string>();
    return a;
}

json execution_to_json(const Execution& e) {
    return json{{"exec_id", e.exec_id},
                {"intent_id", e.intent_id},
                {"intent_hash", e.intent_hash},
                {"executed_at", time_to_json(e.executed_at)},
                {"mode", mode_to_string(e.mode)},
                {"status", status_to_string(e.status)},
                {"fee", e.fee},
                {"slippage_model", e.slippage_model},
                {"details", e.details}};
}

Execution execution_from_json(const json& j) {
    Execution e;
    e.exec_id = j.at("exec_id").get<std::string>();
    e.intent_id = j.at("intent_id").get<std::string>();
    e.intent_hash = j.at("intent_hash").get<std::string>();
    e.executed_at = time_from_json(j.at("executed_at"));
    e.mode = enum_from_json<TradingMode>(j.at("mode"), parse_mode, "mode");
    e.status = enum_from_json<IntentStatus>(j.at("status"), parse_status, "status");
    e.fee = j.value("fee", 0.0);
    e.slippage_model = j.value("slippage_model", std::string());
    e.details = j.value("details", json::object());
    return e;
}

json fill_to_json(const Fill& f) {
    return json{{"fill_id", f.fill_id},
                {"exec_id", f.exec_id},
                {"symbol", f.symbol},
                {"side", side_to_string(f.side)},
                {"size", f.size},
                {"price", f.price},
                {"fee", f.fee},
                {"fee_currency", f.fee_currency},
                {"ts", time_to_json(f.ts)}};
}

Fill fill_from_json(const json& j) {
    Fill f;
    f.fill_id = j.at("fill_id").get<std::string>();
    f.exec_id = j.at("exec_id").get<std::string>();
    f.symbol = j.at("symbol").get<std::string>();
    f.side = enum_from_json<Side>(j.at("side"), parse_side, "side");
    f.size = j.at("size").get<double>();
    f.price = j.at("price").get<double>();
    f.fee = j.value("fee", 0.0);
    f.fee_currency = j.value("fee_currency", std::string());
    f.ts = time_from_json(j.at("ts"));
    return f;
}

json trade_result_to_json(const TradeResult& t) {
    return json{{"trade_id", t.trade_id},
                {"intent_id", t.intent_id},
                {"symbol", t.symbol},
                {"side", side_to_string(t.side)},
                {"pnl", t.pnl},
                {"mode", mode_to_string(t.mode)},
                {"created_at", time_to_json(t.created_at)},
                {"meta", t.meta}};
}

TradeResult trade_result_from_json(const json& j) {
    TradeResult t;
    t.trade_id = j.at("trade_id").get<std::string>();
    t.intent_id = j.at("intent_id").get<std::string>();
    t.symbol = j.value("symbol", std::string());
    t.side = enum_from_json<Side>(j.at("side"), parse_side, "side");
    t.pnl = j.at("pnl").get<double>();
    t.mode = enum_from_json<TradingMode>(j.at("mode"), parse_mode, "mode");
    t.created_at = time_from_json(j.at("created_at"));
    t.meta = j.value("meta", json::object());
    return t;
}

json event_to_json(const AuditEvent& e) {
    return json{{"ts", time_to_json(e.ts)}, {"type", e.type}, {"payload", e.payload}};
}

AuditEvent event_from_json(const json& j) {
    AuditEvent e;
    e.ts = time_from_json(j.at("ts"));
    e.type = j.at("type").get<std::string>();
    e.payload = j.value("payload", json::object());
    return e;
}

}  // namespace

// =============================================================================
// Construction and persistence
// =============================================================================

JsonStore::JsonStore(std::string path) : path_(std::move(path)) {
    if (!in_memory())
        load();
}

JsonStore::FileSignature JsonStore::stat_file() const {
    FileSignature sig;
    struct stat st;
    if (::stat(path_.c_str(), &st) != 0)
        return sig;
    sig.exists = true;
    sig.device = static_cast<uint64_t>(st.st_dev);
    sig.inode = static_cast<uint64_t>(st.st_ino);
    sig.size = static_cast<int64_t>(st.st_size);
    sig.mtime_ns = static_cast<int64_t>(st.st_mtim.tv_sec) * 1000000000LL + st.st_mtim.tv_nsec;
    return sig;
}

void JsonStore::load() const {
    // Stat before reading: a replacement landing in between is picked up
    // by the next refresh
    FileSignature sig = stat_file();

    std::ifstream in(path_);
    if (!in.is_open()) {
        data_ = Data{};  // fresh store
        loaded_ = sig;
        return;
    }

    std::string content((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    if (content.empty()) {
        data_ = Data{};
        loaded_ = sig;
        return;
    }

    try {
        data_ = from_json(json::parse(content));
    } catch (const json::exception& e) {
        loaded_.reset();
        throw std::runtime_error("Cannot load store " + path_ + ": " + e.what());
    }
    loaded_ = sig;
}

void JsonStore::refresh() const {
    // Inside a write the lock is held and data_ is already current
    if (in_memory() || tx_depth_ > 0)
        return;
    if (loaded_ && stat_file() == *loaded_)
        return;
    load();
}

void JsonStore::write_file() {
    // Write to temp file first, then rename (atomic on POSIX)
    std::string temp_path = path_ + ".tmp";
    {
        std::ofstream out(temp_path, std::ios::trunc);
        if (!out.is_open())
            throw std::runtime_error("Cannot write store file: " + temp_path);
        out << to_json(data_).dump(1, ' ', false, json::error_handler_t::replace);
        out.flush();
        if (!out)
            throw std::runtime_error("Short write to store file: " + temp_path);
    }

    if (std::rename(temp_path.c_str(), path_.c_str()) != 0) {
        std::remove(temp_path.c_str());
        throw std::runtime_error("Cannot replace store file: " + path_);
    }
    loaded_ = stat_file();
}

namespace {

struct DepthGuard {
    int& depth;
    explicit DepthGuard(int& d) : depth(d) { ++depth; }
    ~DepthGuard() { --depth; }
};

}  // namespace

bool JsonStore::apply(const std::function<bool()>& change) {
    if (tx_depth_ > 0 || in_memory())
        return change();

    ensure_parent_dir(path_);
    util::FileLock lock(lock_path());
    refresh();

    // Until the write lands, data_ may differ from disk; forget the
    // signature so a throw below forces a reload on next access
    std::optional<FileSignature> before = loaded_;
    loaded_.reset();

    bool changed;
    {
        DepthGuard guard(tx_depth_);
        changed = change();
    }
    if (changed)
        write_file();
    else
        loaded_ = before;
    return changed;
}

void JsonStore::transaction(const std::function<void()>& fn) {
    if (tx_depth_ > 0) {
        fn();  // nested: joins the outer transaction
        return;
    }

    std::optional<util::FileLock> lock;
    if (!in_memory()) {
        ensure_parent_dir(path_);
        lock.emplace(lock_path());
        refresh();
    }

    Data snapshot = data_;
    ++tx_depth_;
    try {
        fn();
        --tx_depth_;
        if (!in_memory())
            write_file();
    } catch (...) {
        tx_depth_ = 0;
        data_ = std::move(snapshot);
        throw;
    }
}

// =============================================================================
// Market data
// =============================================================================

size_t JsonStore::upsert_candles(const std::string& symbol, const std::string& timeframe,
                                 const std::vector<market::Candle>& candles) {
    apply([&] {
        auto& series = data_.candles[candle_key(symbol, timeframe)];
        for (const auto& c : candles)
            series[c.ts] = c;
        return !candles.empty();
    });
    return candles.size();
}

std::vector<market::Candle> JsonStore::recent_candles(const std::string& symbol, const std::string& timeframe,
                                                      size_t limit) const {
    refresh();
    std::vector<market::Candle> out;
    auto it = data_.candles.find(candle_key(symbol, timeframe));
    if (it == data_.candles.end())
        return out;

    const auto& series = it->second;
    size_t skip = series.size() > limit ? series.size() - limit : 0;
    out.reserve(series.size() - skip);
    size_t i = 0;
    for (const auto& [ts, candle] : series) {
        if (i++ >= skip)
            out.push_back(candle);
    }
    return out;
}

void JsonStore::save_orderbook(const std::string& symbol, const market::OrderbookTop& top) {
    apply([&] {
        auto& books = data_.orderbooks[symbol];
        books.push_back(top);
        if (books.size() > MAX_ORDERBOOKS_PER_SYMBOL)
            books.erase(books.begin(), books.begin() + static_cast<long>(books.size() - MAX_ORDERBOOKS_PER_SYMBOL));
        return true;
    });
}

std::optional<market::OrderbookTop> JsonStore::latest_orderbook(const std::string& symbol) const {
    refresh();
    auto it = data_.orderbooks.find(symbol);
    if (it == data_.orderbooks.end() || it->second.empty())
        return std::nullopt;
    const auto& books = it->second;
    return *std::max_element(books.begin(), books.end(),
                             [](const market::OrderbookTop& a, const market::OrderbookTop& b) { return a.ts < b.ts; });
}

// =============================================================================
// News and features
// =============================================================================

bool JsonStore::insert_news(const news::NewsFeature& item) {
    return apply([&] { return data_.news.emplace(item.id, item).second; });
}

std::vector<news::NewsFeature> JsonStore::news_published_between(Timestamp start, Timestamp end) const {
    refresh();
    std::vector<news::NewsFeature> out;
    for (const auto& [id, item] : data_.news) {
        if (item.published_at >= start && item.published_at <= end)
            out.push_back(item);
    }
    std::sort(out.begin(), out.end(), [](const news::NewsFeature& a, const news::NewsFeature& b) {
        return a.published_at != b.published_at ? a.published_at < b.published_at : a.id < b.id;
    });
    return out;
}

void JsonStore::save_feature_row(const news::FeatureRow& row) {
    apply([&] {
        // Recomputing a features_ref replaces the earlier row
        if (!row.features_ref.empty()) {
            for (auto& existing : data_.feature_rows) {
                if (existing.features_ref == row.features_ref) {
                    existing = row;
                    return true;
                }
            }
        }
        data_.feature_rows.push_back(row);
        return true;
    });
}

std::vector<news::FeatureRow> JsonStore::feature_rows(const std::string& symbol) const {
    refresh();
    std::vector<news::FeatureRow> out;
    for (const auto& row : data_.feature_rows) {
        if (row.symbol == symbol)
            out.push_back(row);
    }
    return out;
}

// =============================================================================
// Intents and approvals
// =============================================================================

intent::IntentRecord* JsonStore::find_intent(const std::string& intent_id) {
    for (auto& r : data_.intents) {
        if (r.intent.intent_id == intent_id)
            return &r;
    }
    return nullptr;
}

const intent::IntentRecord* JsonStore::find_intent(const std::string& intent_id) const {
    for (const auto& r : data_.intents) {
        if (r.intent.intent_id == intent_id)
            return &r;
    }
    return nullptr;
}

bool JsonStore::insert_intent(const intent::IntentRecord& record) {
    return apply([&] {
        if (find_intent(record.intent.intent_id))
            return false;
        data_.intents.push_back(record);
        return true;
    });
}

std::optional<intent::IntentRecord> JsonStore::get_intent(const std::string& intent_id) const {
    refresh();
    const auto* r = find_intent(intent_id);
    if (!r)
        return std::nullopt;
    return *r;
}

bool JsonStore::update_intent_status(const std::string& intent_id, IntentStatus status, Timestamp now) {
    return apply([&] {
        auto* r = find_intent(intent_id);
        if (!r || !can_transition(r->status, status))
            return false;
        r->status = status;
        r->updated_at = now;
        return true;
    });
}

std::vector<intent::IntentRecord> JsonStore::list_intents(std::optional<IntentStatus> status) const {
    refresh();
    std::vector<intent::IntentRecord> out;
    for (const auto& r : data_.intents) {
        if (!status || r.status == *status)
            out.push_back(r);
    }
    return out;
}

std::optional<intent::IntentRecord> JsonStore::latest_intent(std::optional<IntentStatus> status) const {
    refresh();
    const intent::IntentRecord* best = nullptr;
    for (const auto& r : data_.intents) {
        if (status && r.status != *status)
            continue;
        if (!best || r.intent.created_at >= best->intent.created_at)
            best = &r;
    }
    if (!best)
        return std::nullopt;
    return *best;
}

void JsonStore::save_approval(const Approval& approval) {
    apply([&] {
        data_.approvals[approval.intent_id] = approval;
        return true;
    });
}

std::optional<Approval> JsonStore::get_approval(const std::string& intent_id) const {
    refresh();
    auto it = data_.approvals.find(intent_id);
    if (it == data_.approvals.end())
        return std::nullopt;
    return it->second;
}

// =============================================================================
// Executions
// =============================================================================

void JsonStore::insert_execution(const Execution& execution) {
    apply([&] {
        data_.executions.push_back(execution);
        return true;
    });
}

void JsonStore::insert_fill(const Fill& fill) {
    apply([&] {
        data_.fills.push_back(fill);
        return true;
    });
}

void JsonStore::insert_trade_result(const TradeResult& result) {
    apply([&] {
        data_.trade_results.push_back(result);
        return true;
    });
}

std::vector<Execution> JsonStore::executions_for_intent(const std::string& intent_id) const {
    refresh();
    std::vector<Execution> out;
    for (const auto& e : data_.executions) {
        if (e.intent_id == intent_id)
            out.push_back(e);
    }
    return out;
}

std::vector<Fill> JsonStore::fills(const std::string& symbol) const {
    refresh();
    std::vector<Fill> out;
    for (const auto& f : data_.fills) {
        if (symbol.empty() || f.symbol == symbol)
            out.push_back(f);
    }
    std::stable_sort(out.begin(), out.end(), [](const Fill& a, const Fill& b) { return a.ts < b.ts; });
    return out;
}

std::vector<TradeResult> JsonStore::trade_results(std::optional<TradingMode> mode) const {
    refresh();
    std::vector<TradeResult> out;
    for (const auto& t : data_.trade_results) {
        if (!mode || t.mode == *mode)
            out.push_back(t);
    }
    std::stable_sort(out.begin(), out.end(),
                     [](const TradeResult& a, const TradeResult& b) { return a.created_at < b.created_at; });
    return out;
}

// =============================================================================
// Audit
// =============================================================================

void JsonStore::log_event(const std::string& type, const json& payload, Timestamp ts) {
    apply([&] {
        data_.events.push_back(AuditEvent{ts, type, payload});
        if (data_.events.size() > MAX_EVENTS)
            data_.events.erase(data_.events.begin(),
                               data_.events.begin() + static_cast<long>(data_.events.size() - MAX_EVENTS));
        return true;
    });
}

std::vector<AuditEvent> JsonStore::events() const {
    refresh();
    return data_.events;
}

// =============================================================================
// Derived queries
// =============================================================================

PositionState JsonStore::position_state(const std::string& symbol) const {
    double size = 0;
    double cost_total = 0;
    for (const auto& f : fills(symbol)) {
        if (f.side == Side::Buy) {
            cost_total += f.price * f.size + f.fee;
            size += f.size;
        } else {
            if (size <= 0)
                continue;
            double avg_cost = cost_total / size;
            cost_total -= avg_cost * f.size;
            size -= f.size;
        }
    }
    PositionState state;
    state.size = size;
    state.avg_cost = size > 0 ? cost_total / size : 0.0;
    return state;
}

double JsonStore::daily_realized_pnl(const std::string& day) const {
    refresh();
    double total = 0;
    for (const auto& t : data_.trade_results) {
        if (util::utc_day(t.created_at) == day)
            total += t.pnl;
    }
    return total;
}

int JsonStore::daily_execution_count(const std::string& day, const std::string& exclude_intent_id) const {
    refresh();
    int count = 0;
    for (const auto& e : data_.executions) {
        if (!exclude_intent_id.empty() && e.intent_id == exclude_intent_id)
            continue;
        if (util::utc_day(e.executed_at) == day)
            ++count;
    }
    return count;
}

std::optional<Timestamp> JsonStore::last_execution_time(const std::string& exclude_intent_id) const {
    refresh();
    std::optional<Timestamp> last;
    for (const auto& e : data_.executions) {
        if (!exclude_intent_id.empty() && e.intent_id == exclude_intent_id)
            continue;
        if (!last || e.executed_at > *last)
            last = e.executed_at;
    }
    return last;
}

// =============================================================================
// Document mapping
// =============================================================================

json JsonStore::to_json(const Data& data) {
    json doc;
    doc["version"] = SCHEMA_VERSION;

    json candles = json::object();
    for (const auto& [key, series] : data.candles) {
        json arr = json::array();
        for (const auto& [ts, c] : series)
            arr.push_back(candle_to_json(c));
        candles[key] = std::move(arr);
    }
    doc["candles"] = std::move(candles);

    json books = json::object();
    for (const auto& [symbol, list] : data.orderbooks) {
        json arr = json::array();
        for (const auto& t : list)
            arr.push_back(orderbook_to_json(t));
        books[symbol] = std::move(arr);
    }
    doc["orderbooks"] = std::move(books);

    doc["news"] = json::array();
    for (const auto& [id, n] : data.news)
        doc["news"].push_back(news_to_json(n));
    doc["feature_rows"] = json::array();
    for (const auto& r : data.feature_rows)
        doc["feature_rows"].push_back(feature_row_to_json(r));
    doc["intents"] = json::array();
    for (const auto& r : data.intents)
        doc["intents"].push_back(intent_record_to_json(r));
    doc["approvals"] = json::array();
    for (const auto& [id, a] : data.approvals)
        doc["approvals"].push_back(approval_to_json(a));
    doc["executions"] = json::array();
    for (const auto& e : data.executions)
        doc["executions"].push_back(execution_to_json(e));
    doc["fills"] = json::array();
    for (const auto& f : data.fills)
        doc["fills"].push_back(fill_to_json(f));
    doc["trade_results"] = json::array();
    for (const auto& t : data.trade_results)
        doc["trade_results"].push_back(trade_result_to_json(t));
    doc["events"] = json::array();
    for (const auto& e : data.events)
        doc["events"].push_back(event_to_json(e));
    return doc;
}

JsonStore::Data JsonStore::from_json(const json& doc) {
    int version = doc.value("version", 0);
    if (version != SCHEMA_VERSION)
        throw std::runtime_error("store: unsupported schema version " + std::to_string(version));

    Data data;
    const json candles = doc.value("candles", json::object());
    for (const auto& [key, arr] : candles.items()) {
        auto& series = data.candles[key];
        for (const auto& c : arr) {
            auto candle = candle_from_json(c);
            series[candle.ts] = candle;
        }
    }
    const json books = doc.value("orderbooks", json::object());
    for (const auto& [symbol, arr] : books.items()) {
        auto& list = data.orderbooks[symbol];
        for (const auto& t : arr)
            list.push_back(orderbook_from_json(t));
    }
    for (const auto& n : doc.value("news", json::array())) {
        auto item = news_from_json(n);
        data.news.emplace(item.id, std::move(item));
    }
    for (const auto& r : doc.value("feature_rows", json::array()))
        data.feature_rows.push_back(feature_row_from_json(r));
    for (const auto& r : doc.value("intents", json::array()))
        data.intents.push_back(intent_record_from_json(r));
    for (const auto& a : doc.value("approvals", json::array())) {
        auto approval = approval_from_json(a);
        data.approvals[approval.intent_id] = std::move(approval);
    }
    for (const auto& e : doc.value("executions", json::array()))
        data.executions.push_back(execution_from_json(e));
    for (const auto& f : doc.value("fills", json::array()))
        data.fills.push_back(fill_from_json(f));
    for (const auto& t : doc.value("trade_results", json::array()))
        data.trade_results.push_back(trade_result_from_json(t));
    for (const auto& e : doc.value("events", json::array()))
        data.events.push_back(event_from_json(e));
    return data;
}

}  // namespace store
}  // namespace tradegate
