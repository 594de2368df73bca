#pragma once
/**
 * RunnerState - scheduler bookkeeping persisted across restarts
 *
 * Written after every Runner cycle so a crashed or stopped runner resumes
 * its schedule and its duplicate-proposal memory.
 *
 * Usage:
 *   RunnerStateStore store(settings.runner_state_path());
 *   RunnerState state;
 *   if (!store.restore(state)) state = RunnerState{};
 *   ...
 *   store.save(state);
 */

#include "../types.hpp"
#include "../util/time_utils.hpp"

#include <nlohmann/json.hpp>

#include <cstdio>
#include <filesystem>
#include <fstream>
#include <optional>
#include <string>

namespace tradegate {
namespace runner {

using json = nlohmann::json;

struct RunnerState {
    static constexpr size_t MAX_ERROR_SUMMARY = 500;

    int64_t iteration = 0;
    std::optional<Timestamp> last_success_market_at;
    std::optional<Timestamp> last_success_news_at;
    std::optional<Timestamp> last_success_propose_at;
    std::optional<Timestamp> last_error_at;
    std::optional<std::string> last_error_summary;
    std::optional<std::string> last_signature;
    std::optional<Timestamp> last_signature_at;

    json to_json() const {
        auto ts = [](const std::optional<Timestamp>& v) -> json {
            return v ? json(util::format_iso8601(*v)) : json(nullptr);
        };
        auto str = [](const std::optional<std::string>& v) -> json { return v ? json(*v) : json(nullptr); };
        return json{{"iteration", iteration},
                    {"last_success_ingest_market_at", ts(last_success_market_at)},
                    {"last_success_ingest_news_at", ts(last_success_news_at)},
                    {"last_success_propose_at", ts(last_success_propose_at)},
                    {"last_error_at", ts(last_error_at)},
                    {"last_error_summary", str(last_error_summary)},
                    {"last_signature", str(last_signature)},
                    {"last_signature_at", ts(last_signature_at)}};
    }

    // Unparseable timestamps read back as absent
    static RunnerState from_json(const json& j) {
        auto ts = [&j](const char* key) -> std::optional<Timestamp> {
            if (!j.contains(key) || !j[key].is_string())
                return std::nullopt;
            return util::parse_iso8601(j[key].get<std::string>());
        };
        auto str = [&j](const char* key) -> std::optional<std::string> {
            if (!j.contains(key) || !j[key].is_string())
                return std::nullopt;
            return j[key].get<std::string>();
        };
        RunnerState s;
        if (j.contains("iteration") && j["iteration"].is_number_integer())
            s.iteration = j["iteration"].get<int64_t>();
        s.last_success_market_at = ts("last_success_ingest_market_at");
        s.last_success_news_at = ts("last_success_ingest_news_at");
        s.last_success_propose_at = ts("last_success_propose_at");
        s.last_error_at = ts("last_error_at");
        s.last_error_summary = str("last_error_summary");
        s.last_signature = str("last_signature");
        s.last_signature_at = ts("last_signature_at");
        return s;
    }
};

class RunnerStateStore {
public:
    explicit RunnerStateStore(std::string path) : path_(std::move(path)) {}

    /**
     * Write to <path>.tmp, then rename over the state file.
     * Returns false if the file could not be written.
     */
    bool save(const RunnerState& state) const {
        std::filesystem::path target(path_);
        std::error_code ec;
        if (target.has_parent_path()) {
            std::filesystem::create_directories(target.parent_path(), ec);
            if (ec)
                return false;
        }

        std::string temp_path = path_ + ".tmp";
        {
            std::ofstream out(temp_path);
            if (!out.is_open())
                return false;
            out << state.to_json().dump(2) << "\n";
            if (!out.good())
                return false;
        }

        if (std::rename(temp_path.c_str(), path_.c_str()) != 0) {
            std::remove(temp_path.c_str());
            return false;
        }
        return true;
    }

    /**
     * Returns false if the file is missing or not valid JSON; state is
     * left untouched in that case.
     */
    bool restore(RunnerState& state) const {
        std::ifstream in(path_);
        if (!in.is_open())
            return false;
        json doc = json::parse(in, nullptr, false);
        if (doc.is_discarded() || !doc.is_object())
            return false;
        state = RunnerState::from_json(doc);
        return true;
    }

    bool exists() const {
        std::ifstream f(path_);
        return f.good();
    }

    const std::string& path() const { return path_; }

private:
    std::string path_;
};

}  // namespace runner
}  // namespace tradegate
