#include "keeper.hpp"
#include "vault_error.hpp"
#include <algorithm>
#include <set>

namespace tranchevault {
namespace service {

Keeper::Keeper(VaultService& vault)
    : vault_(vault), logger_(&Logger::get_instance()) {}

std::optional<UpkeepAction> Keeper::check_upkeep(const std::vector<std::string>& note_tokens) const {
    uint64_t current_bucket = vault_.timing().bucket_of(vault_.now());

    std::vector<uint64_t> buckets;
    if (current_bucket > 0) {
        buckets.push_back(current_bucket - 1);
    }
    buckets.push_back(current_bucket);

    std::set<std::string> unadapted;
    for (uint64_t bucket : buckets) {
        for (const LoanKey& key : vault_.pending_loans(bucket)) {
            if (std::find(note_tokens.begin(), note_tokens.end(), key.note_token) == note_tokens.end()) {
                continue;
            }
            std::shared_ptr<INoteAdapter> adapter = vault_.note_adapter(key.note_token);
            if (!adapter) {
                if (unadapted.insert(key.note_token).second) {
                    logger_->log_warning(TransactionContext("check_upkeep", ""),
                        "No adapter registered for note token " + key.note_token + ", its loans are skipped");
                }
                continue;
            }

            std::optional<UpkeepCode> code;
            if (adapter->is_repaid(key.loan_id)) {
                code = UpkeepCode::REPAID;
            } else if (adapter->is_liquidated(key.loan_id)) {
                code = UpkeepCode::LIQUIDATED;
            } else if (adapter->is_expired(key.loan_id)) {
                code = UpkeepCode::EXPIRED;
            }

            if (code) {
                logger_->log_upkeep("check", upkeep_code_to_string(*code), key);
                return UpkeepAction(*code, key);
            }
        }
    }

    logger_->log_upkeep("check", "none", LoanKey());
    return std::nullopt;
}

void Keeper::perform_upkeep(const AccountId& caller, const UpkeepAction& action) {
    switch (action.code) {
        case UpkeepCode::REPAID:
            vault_.on_loan_repaid(caller, action.key);
            break;
        case UpkeepCode::LIQUIDATED:
            vault_.on_loan_liquidated(caller, action.key);
            break;
        case UpkeepCode::EXPIRED:
            vault_.on_loan_expired(caller, action.key);
            break;
        default:
            throw InputValidationError(ErrorCode::PARAMETER_OUT_OF_RANGE,
                "Unknown upkeep code " + std::to_string(static_cast<int>(action.code)));
    }

    logger_->log_upkeep("perform", upkeep_code_to_string(action.code), action.key);
}

} // namespace service
} // namespace tranchevault
