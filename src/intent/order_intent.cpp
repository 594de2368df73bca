#include "../../include/tradegate/intent/order_intent.hpp"
#include "../../include/tradegate/util/canonical_json.hpp"
#include "../../include/tradegate/util/crypto.hpp"
#include "../../include/tradegate/util/time_utils.hpp"

#include <stdexcept>

namespace tradegate {
namespace intent {

json OrderIntent::to_json() const {
    json j;
    j["intent_id"] = intent_id;
    j["created_at"] = util::format_iso8601(created_at);
    j["symbol"] = symbol;
    j["side"] = side_to_string(side);
    j["size"] = size;
    j["price"] = price;
    j["order_type"] = order_type;
    j["time_in_force"] = time_in_force;
    j["strategy"] = strategy;
    j["confidence"] = confidence;
    j["rationale"] = rationale;
    j["rationale_features_ref"] = rationale_features_ref ? json(*rationale_features_ref) : json(nullptr);
    j["expires_at"] = util::format_iso8601(expires_at);
    j["mode"] = mode_to_string(mode);
    return j;
}

OrderIntent OrderIntent::from_json(const json& j) {
    auto parse_time = [&j](const char* key) {
        auto ts = util::parse_iso8601(j.at(key).get<std::string>());
        if (!ts)
            throw std::runtime_error(std::string("intent: bad timestamp in ") + key);
        return *ts;
    };

    OrderIntent intent;
    intent.intent_id = j.at("intent_id").get<std::string>();
    intent.created_at = parse_time("created_at");
    intent.symbol = j.at("symbol").get<std::string>();
    auto side = parse_side(j.at("side").get<std::string>());
    if (!side)
        throw std::runtime_error("intent: bad side");
    intent.side = *side;
    intent.size = j.at("size").get<double>();
    intent.price = j.at("price").get<double>();
    intent.order_type = j.value("order_type", std::string("limit"));
    intent.time_in_force = j.value("time_in_force", std::string("GTC"));
    intent.strategy = j.at("strategy").get<std::string>();
    intent.confidence = j.at("confidence").get<double>();
    intent.rationale = j.value("rationale", std::string());
    if (j.contains("rationale_features_ref") && !j["rationale_features_ref"].is_null())
        intent.rationale_features_ref = j["rationale_features_ref"].get<std::string>();
    intent.expires_at = parse_time("expires_at");
    auto mode = parse_mode(j.at("mode").get<std::string>());
    if (!mode)
        throw std::runtime_error("intent: bad mode");
    intent.mode = *mode;
    return intent;
}

std::string OrderIntent::canonical_json() const {
    return util::canonical_json(to_json());
}

std::string OrderIntent::hash() const {
    return util::sha256_hex(canonical_json());
}

OrderIntent from_plan(const strategy::TradePlan& plan, TradingMode mode, int expiry_seconds,
                      std::optional<std::string> features_ref, Timestamp now) {
    OrderIntent intent;
    intent.intent_id = util::uuid4();
    intent.created_at = now;
    intent.symbol = plan.symbol;
    intent.side = plan.side;
    intent.size = plan.size;
    intent.price = plan.price;
    intent.strategy = plan.strategy;
    intent.confidence = plan.confidence;
    intent.rationale = plan.rationale;
    intent.rationale_features_ref = std::move(features_ref);
    intent.expires_at = now + static_cast<Timestamp>(expiry_seconds) * util::MS_PER_SECOND;
    intent.mode = mode;
    return intent;
}

}  // namespace intent
}  // namespace tradegate
