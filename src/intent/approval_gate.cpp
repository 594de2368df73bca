#include "../../include/tradegate/intent/approval_gate.hpp"
#include "../../include/tradegate/util/crypto.hpp"

namespace tradegate {
namespace intent {

std::string trim(const std::string& s) {
    const char* ws = " \t\r\n\f\v";
    auto begin = s.find_first_not_of(ws);
    if (begin == std::string::npos)
        return "";
    auto end = s.find_last_not_of(ws);
    return s.substr(begin, end - begin + 1);
}

ApprovalResult ApprovalGate::approve(const std::string& intent_id, const std::string& phrase,
                                     const std::string& approved_by, Timestamp now) {
    auto record = store_.get_intent(intent_id);
    if (!record) {
        throw ApprovalError("intent not found");
    }
    if (is_terminal(record->status) || record->status == IntentStatus::Open) {
        throw ApprovalError(std::string("intent already ") + status_to_string(record->status));
    }

    std::string current_hash = record->intent.hash();
    if (current_hash != record->intent_hash) {
        TG_LOGF_ERROR(logger_, Approval, "approval refused: intent %s hash mismatch", intent_id.c_str());
        throw ApprovalError("intent hash mismatch");
    }

    std::string clean = trim(phrase);
    if (clean.empty() || util::sha256_hex(clean) != phrase_hash_) {
        TG_LOGF_WARN(logger_, Approval, "approval refused: phrase mismatch for %s", intent_id.c_str());
        throw ApprovalError("approval phrase mismatch");
    }

    store::Approval approval;
    approval.intent_id = intent_id;
    approval.intent_hash = current_hash;
    approval.approved_at = now;
    approval.approved_by = approved_by;
    approval.approval_phrase_hash = util::sha256_hex(clean);

    store_.transaction([&] {
        store_.save_approval(approval);
        store_.update_intent_status(intent_id, IntentStatus::Approved, now);
        store_.log_event("approve", {{"intent_id", intent_id}, {"approved_by", approved_by}}, now);
    });

    TG_LOGF_INFO(logger_, Approval, "intent %s approved by %s", intent_id.c_str(), approved_by.c_str());
    return ApprovalResult{"approved", intent_id, current_hash};
}

bool ApprovalGate::verify(const OrderIntent& intent) const {
    auto approval = store_.get_approval(intent.intent_id);
    return approval && approval->intent_hash == intent.hash();
}

}  // namespace intent
}  // namespace tradegate
