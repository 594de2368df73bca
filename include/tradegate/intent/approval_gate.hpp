#pragma once

#include "../logging/async_logger.hpp"
#include "../store/store.hpp"
#include "order_intent.hpp"

#include <stdexcept>
#include <string>

namespace tradegate {
namespace intent {

/**
 * Raised for approval failures: unknown intent, terminal intent,
 * tampered intent, phrase mismatch.
 */
class ApprovalError : public std::runtime_error {
public:
    explicit ApprovalError(const std::string& what) : std::runtime_error(what) {}
};

struct ApprovalResult {
    std::string status;  // "approved"
    std::string intent_id;
    std::string intent_hash;
};

/**
 * ApprovalGate - binds a human-entered phrase to one intent hash
 *
 * The configured phrase is held only as its SHA-256. The supplied phrase is
 * trimmed before hashing; an empty phrase never matches.
 */
class ApprovalGate {
public:
    ApprovalGate(store::IStore& store, std::string phrase_hash) : store_(store), phrase_hash_(std::move(phrase_hash)) {}

    /**
     * @throws ApprovalError on any failure; nothing is written in that case
     */
    ApprovalResult approve(const std::string& intent_id, const std::string& phrase, const std::string& approved_by,
                           Timestamp now);

    // The stored approval is bound to the intent's current hash
    bool verify(const OrderIntent& intent) const;

    void set_logger(logging::AsyncLogger* logger) { logger_ = logger; }

private:
    store::IStore& store_;
    std::string phrase_hash_;
    logging::AsyncLogger* logger_ = nullptr;
};

// Strip leading/trailing ASCII whitespace
std::string trim(const std::string& s);

}  // namespace intent
}  // namespace tradegate
