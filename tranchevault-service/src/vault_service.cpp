/**
 * @file vault_service.cpp
 * @brief Implementation of the vault transaction dispatcher
 */

#include "vault_service.hpp"
#include "config_parser.hpp"
#include "redemption_queue.hpp"
#include "tranche_ledger.hpp"
#include "vault_error.hpp"
#include "io/state_json.hpp"
#include <stdexcept>

namespace tranchevault {
namespace service {

using fixed_point::one;
using fixed_point::to_decimal;

namespace {

std::string rate_model_to_string(const RateModel& model) {
    return "{offset=" + to_decimal(model.offset()) +
           ", slope1=" + to_decimal(model.slope1()) +
           ", slope2=" + to_decimal(model.slope2()) +
           ", kink=" + to_decimal(model.kink()) +
           ", max=" + to_decimal(model.max()) + "}";
}

} // anonymous namespace

// ============================================================================
// Construction
// ============================================================================

VaultService::VaultService(const VaultConfig& config, const VaultCollaborators& collaborators)
    : collaborators_(collaborators),
      collateral_oracle_(std::make_shared<StaticCollateralOracle>()),
      pricer_(collateral_oracle_),
      logger_(&Logger::get_instance()) {
    if (!collaborators_.asset_transfer || !collaborators_.custody ||
        !collaborators_.access_policy || !collaborators_.clock) {
        throw std::invalid_argument("VaultService requires asset transfer, custody, access policy and clock");
    }

    validate_vault_config(config);

    state_.parameters = config.parameters;

    pricer_.set_utilization_model(config.utilization_model);
    pricer_.set_minimum_discount_rate(config.minimum_discount_rate);
    pricer_.set_minimum_loan_duration(config.minimum_loan_duration);
    for (const auto& [collateral_class, entry] : config.collateral) {
        pricer_.set_collateral_parameters(collateral_class, entry.parameters);
        collateral_oracle_->set_collateral_value(collateral_class, entry.value);
    }
}

std::unique_ptr<VaultService> VaultService::from_config_file(const std::string& config_path,
                                                             const VaultCollaborators& collaborators) {
    VaultConfig config = parse_vault_config_from_file(config_path);
    Logger::get_instance().configure(config.logging);
    return std::make_unique<VaultService>(config, collaborators);
}

// ============================================================================
// Transactions
// ============================================================================

void VaultService::transact(const TransactionContext& ctx, const Command& command) {
    std::lock_guard<std::mutex> lock(mutex_);

    try {
        VaultState working = state_;
        Fields fields;

        command(working, fields);
        working.check_invariants();

        state_ = std::move(working);
        logger_->log_transaction_committed(ctx, fields);

    } catch (const VaultError& e) {
        logger_->log_transaction_rejected(ctx, error_code_to_string(e.code()), e.what());
        throw;
    } catch (const InvariantViolation& e) {
        logger_->log_error(ctx, e.what());
        throw;
    } catch (const std::exception& e) {
        logger_->log_transaction_rejected(ctx, "Exception", e.what());
        throw;
    }
}

void VaultService::administer(const TransactionContext& ctx, const std::string& parameter,
                              const std::string& value, const std::function<void()>& change) {
    std::lock_guard<std::mutex> lock(mutex_);

    try {
        require_capability(*collaborators_.access_policy, ctx.account, Capability::ADMIN);
        change();
        logger_->log_parameter_update(ctx, parameter, value);

    } catch (const VaultError& e) {
        logger_->log_transaction_rejected(ctx, error_code_to_string(e.code()), e.what());
        throw;
    } catch (const InvariantViolation& e) {
        logger_->log_error(ctx, e.what());
        throw;
    }
}

INoteAdapter& VaultService::require_adapter(const std::string& note_token) const {
    auto it = adapters_.find(note_token);
    if (it == adapters_.end()) {
        throw InputValidationError(ErrorCode::UNSUPPORTED_NOTE_TOKEN,
            "No adapter registered for note token " + note_token);
    }
    return *it->second;
}

void VaultService::require_active_loan(const VaultState& state, const LoanKey& key) const {
    const Loan* loan = state.find_loan(key);
    if (loan == nullptr || !loan->active) {
        throw StatePreconditionError(ErrorCode::UNKNOWN_LOAN,
            "Loan " + key.to_string() + " is not held or already defaulted");
    }
}

void VaultService::log_purchase(const TransactionContext& ctx, const LoanKey& key,
                                const PurchaseResult& result) const {
    logger_->log_loan_event(ctx, "purchased", key, {
        {"purchase_price", to_decimal(result.purchase_price)},
        {"discount_rate", to_decimal(result.discount_rate)},
        {"senior_return", to_decimal(result.senior_return)},
        {"junior_return", to_decimal(result.junior_return)},
        {"maturity_bucket", std::to_string(result.maturity_bucket)}
    });
}

// ============================================================================
// Depositors
// ============================================================================

Amount VaultService::deposit(const AccountId& caller, TrancheId tranche, const Amount& amount) {
    TransactionContext ctx("deposit", caller);
    Amount shares;

    transact(ctx, [&](VaultState& state, Fields& fields) {
        shares = tranchevault::deposit(state, tranche, caller, amount, now());
        collaborators_.asset_transfer->pull(caller, amount);

        fields["tranche"] = tranche_to_string(tranche);
        fields["amount"] = to_decimal(amount);
        fields["shares"] = to_decimal(shares);
    });

    return shares;
}

TrancheAllocation VaultService::deposit_tranches(const AccountId& caller, const TrancheAllocation& amounts) {
    TransactionContext ctx("deposit_tranches", caller);
    TrancheAllocation shares;

    transact(ctx, [&](VaultState& state, Fields& fields) {
        Amount total(0);
        for (TrancheId id : TRANCHE_PRIORITY) {
            if (amounts[id] == 0) {
                continue;
            }
            shares[id] = tranchevault::deposit(state, id, caller, amounts[id], now());
            total += amounts[id];

            fields[tranche_to_string(id) + "_amount"] = to_decimal(amounts[id]);
            fields[tranche_to_string(id) + "_shares"] = to_decimal(shares[id]);
        }
        if (total == 0) {
            throw InputValidationError(ErrorCode::INVALID_AMOUNT, "Deposit amounts must not all be zero");
        }

        collaborators_.asset_transfer->pull(caller, total);
    });

    return shares;
}

Amount VaultService::redeem(const AccountId& caller, TrancheId tranche, const Amount& shares) {
    TransactionContext ctx("redeem", caller);
    Amount owed;

    transact(ctx, [&](VaultState& state, Fields& fields) {
        owed = request_redemption(state, tranche, caller, shares);

        fields["tranche"] = tranche_to_string(tranche);
        fields["shares"] = to_decimal(shares);
        fields["amount"] = to_decimal(owed);
    });

    return owed;
}

void VaultService::withdraw(const AccountId& caller, TrancheId tranche, const Amount& amount) {
    TransactionContext ctx("withdraw", caller);

    transact(ctx, [&](VaultState& state, Fields& fields) {
        tranchevault::withdraw(state, tranche, caller, amount);
        collaborators_.asset_transfer->push(caller, amount);

        fields["tranche"] = tranche_to_string(tranche);
        fields["amount"] = to_decimal(amount);
    });
}

Amount VaultService::withdraw_max(const AccountId& caller, TrancheId tranche) {
    TransactionContext ctx("withdraw_max", caller);
    Amount withdrawn;

    transact(ctx, [&](VaultState& state, Fields& fields) {
        withdrawn = tranchevault::withdraw_max(state, tranche, caller);
        collaborators_.asset_transfer->push(caller, withdrawn);

        fields["tranche"] = tranche_to_string(tranche);
        fields["amount"] = to_decimal(withdrawn);
    });

    return withdrawn;
}

// ============================================================================
// Loans
// ============================================================================

PurchaseResult VaultService::sell_note(const AccountId& caller, const LoanKey& key,
                                       const Amount& offered_price) {
    TransactionContext ctx("sell_note", caller);
    PurchaseResult result;

    transact(ctx, [&](VaultState& state, Fields& fields) {
        INoteAdapter& adapter = require_adapter(key.note_token);
        LoanTerms terms = adapter.loan_terms(key.loan_id);

        result = purchase_loan(state, pricer_, key, terms, offered_price, now());

        collaborators_.custody->receive_note(key, caller);
        collaborators_.asset_transfer->push(caller, result.purchase_price);

        fields["loan"] = key.to_string();
        fields["purchase_price"] = to_decimal(result.purchase_price);
    });

    log_purchase(ctx, key, result);

    return result;
}

NoteSaleDeposit VaultService::sell_note_and_deposit(const AccountId& caller, const LoanKey& key,
                                                    const Amount& offered_price,
                                                    const TrancheAllocation& allocation) {
    TransactionContext ctx("sell_note_and_deposit", caller);
    NoteSaleDeposit result;

    transact(ctx, [&](VaultState& state, Fields& fields) {
        // Validates the allocation before the adapter is consulted
        split_by_fractions(Amount(0), allocation);

        INoteAdapter& adapter = require_adapter(key.note_token);
        LoanTerms terms = adapter.loan_terms(key.loan_id);

        result.purchase = purchase_loan(state, pricer_, key, terms, offered_price, now());
        result.amounts = split_by_fractions(result.purchase.purchase_price, allocation);
        for (TrancheId id : TRANCHE_PRIORITY) {
            if (result.amounts[id] > 0) {
                result.shares[id] = tranchevault::deposit(state, id, caller, result.amounts[id], now());
            }
        }

        collaborators_.custody->receive_note(key, caller);

        fields["loan"] = key.to_string();
        fields["purchase_price"] = to_decimal(result.purchase.purchase_price);
        for (TrancheId id : TRANCHE_PRIORITY) {
            fields[tranche_to_string(id) + "_amount"] = to_decimal(result.amounts[id]);
            fields[tranche_to_string(id) + "_shares"] = to_decimal(result.shares[id]);
        }
    });

    log_purchase(ctx, key, result.purchase);

    return result;
}

void VaultService::on_loan_repaid(const AccountId& caller, const LoanKey& key) {
    TransactionContext ctx("on_loan_repaid", caller);
    LoanSettlement settlement;

    transact(ctx, [&](VaultState& state, Fields& fields) {
        require_active_loan(state, key);
        if (!require_adapter(key.note_token).is_repaid(key.loan_id)) {
            throw StatePreconditionError(ErrorCode::LOAN_NOT_REPAID,
                "Loan " + key.to_string() + " has not been repaid");
        }

        settlement = repay_loan(state, key);

        fields["loan"] = key.to_string();
        fields["repayment"] = to_decimal(settlement.amount);
    });

    logger_->log_loan_event(ctx, "repaid", key, {
        {"repayment", to_decimal(settlement.amount)},
        {"senior_return", to_decimal(settlement.tranches[TrancheId::Senior])},
        {"junior_return", to_decimal(settlement.tranches[TrancheId::Junior])}
    });
}

void VaultService::on_loan_expired(const AccountId& caller, const LoanKey& key) {
    TransactionContext ctx("on_loan_expired", caller);
    LoanSettlement settlement;

    transact(ctx, [&](VaultState& state, Fields& fields) {
        require_active_loan(state, key);
        INoteAdapter& adapter = require_adapter(key.note_token);
        if (!adapter.is_expired(key.loan_id) || adapter.is_repaid(key.loan_id)) {
            throw StatePreconditionError(ErrorCode::LOAN_NOT_EXPIRED,
                "Loan " + key.to_string() + " has not expired unrepaid");
        }

        settlement = default_loan(state, key);
        adapter.liquidate(key.loan_id);

        fields["loan"] = key.to_string();
        fields["loss"] = to_decimal(settlement.amount);
    });

    logger_->log_loan_event(ctx, "defaulted", key, {
        {"loss", to_decimal(settlement.amount)},
        {"senior_loss", to_decimal(settlement.tranches[TrancheId::Senior])},
        {"junior_loss", to_decimal(settlement.tranches[TrancheId::Junior])}
    });
}

void VaultService::on_loan_liquidated(const AccountId& caller, const LoanKey& key) {
    TransactionContext ctx("on_loan_liquidated", caller);
    LoanSettlement settlement;

    transact(ctx, [&](VaultState& state, Fields& fields) {
        require_active_loan(state, key);
        if (!require_adapter(key.note_token).is_liquidated(key.loan_id)) {
            throw StatePreconditionError(ErrorCode::LOAN_NOT_LIQUIDATED,
                "Loan " + key.to_string() + " has not been liquidated by its platform");
        }

        settlement = default_loan(state, key);

        fields["loan"] = key.to_string();
        fields["loss"] = to_decimal(settlement.amount);
    });

    logger_->log_loan_event(ctx, "defaulted", key, {
        {"loss", to_decimal(settlement.amount)},
        {"senior_loss", to_decimal(settlement.tranches[TrancheId::Senior])},
        {"junior_loss", to_decimal(settlement.tranches[TrancheId::Junior])}
    });
}

void VaultService::on_collateral_liquidated(const AccountId& caller, const LoanKey& key,
                                            const Amount& proceeds) {
    TransactionContext ctx("on_collateral_liquidated", caller);
    LoanSettlement settlement;

    transact(ctx, [&](VaultState& state, Fields& fields) {
        require_capability(*collaborators_.access_policy, caller, Capability::COLLATERAL_LIQUIDATOR);

        settlement = receive_liquidation_proceeds(state, key, proceeds);
        collaborators_.asset_transfer->pull(caller, proceeds);

        fields["loan"] = key.to_string();
        fields["proceeds"] = to_decimal(proceeds);
    });

    logger_->log_loan_event(ctx, "collateral_liquidated", key, {
        {"proceeds", to_decimal(settlement.amount)},
        {"senior_recovery", to_decimal(settlement.tranches[TrancheId::Senior])},
        {"junior_recovery", to_decimal(settlement.tranches[TrancheId::Junior])}
    });
}

void VaultService::withdraw_collateral(const AccountId& caller, const LoanKey& key) {
    TransactionContext ctx("withdraw_collateral", caller);
    CollateralRef collateral;

    transact(ctx, [&](VaultState& state, Fields& fields) {
        require_capability(*collaborators_.access_policy, caller, Capability::COLLATERAL_LIQUIDATOR);

        mark_collateral_withdrawn(state, key);
        collateral = state.require_loan(key).collateral;
        collaborators_.custody->release_collateral(collateral, caller);

        fields["loan"] = key.to_string();
        fields["collateral"] = collateral.collateral_class + "/" + collateral.token_id;
    });

    logger_->log_loan_event(ctx, "collateral_withdrawn", key, {
        {"collateral_class", collateral.collateral_class},
        {"token_id", collateral.token_id}
    });
}

// ============================================================================
// Administration
// ============================================================================

void VaultService::set_senior_tranche_rate(const AccountId& caller, const Amount& rate) {
    administer(TransactionContext("set_senior_tranche_rate", caller), "senior_tranche_rate",
               to_decimal(rate), [&]() {
        state_.parameters.set_senior_tranche_rate(rate);
    });
}

void VaultService::set_reserve_ratio(const AccountId& caller, const Amount& ratio) {
    administer(TransactionContext("set_reserve_ratio", caller), "reserve_ratio",
               to_decimal(ratio), [&]() {
        state_.parameters.set_reserve_ratio(ratio);
    });
}

void VaultService::set_paused(const AccountId& caller, bool paused) {
    administer(TransactionContext("set_paused", caller), "paused",
               paused ? "true" : "false", [&]() {
        state_.parameters.paused = paused;
    });
}

void VaultService::set_price_tolerance(const AccountId& caller, const Amount& tolerance) {
    administer(TransactionContext("set_price_tolerance", caller), "price_tolerance",
               to_decimal(tolerance), [&]() {
        state_.parameters.price_tolerance = tolerance;
    });
}

void VaultService::set_utilization_model(const AccountId& caller, const RateModel& model) {
    administer(TransactionContext("set_utilization_model", caller), "utilization_model",
               rate_model_to_string(model), [&]() {
        if (model.max() < one()) {
            throw InputValidationError(ErrorCode::PARAMETER_OUT_OF_RANGE,
                "Utilization model max " + to_decimal(model.max()) + " must cover full utilization");
        }
        pricer_.set_utilization_model(model);
    });
}

void VaultService::set_collateral_parameters(const AccountId& caller, const std::string& collateral_class,
                                             const CollateralRiskParameters& parameters) {
    std::string value = std::string(parameters.enabled ? "enabled" : "disabled") +
                        " weights=" + std::to_string(parameters.weights[0]) + "/" +
                        std::to_string(parameters.weights[1]) + "/" +
                        std::to_string(parameters.weights[2]);

    administer(TransactionContext("set_collateral_parameters", caller),
               "collateral_parameters." + collateral_class, value, [&]() {
        pricer_.set_collateral_parameters(collateral_class, parameters);
    });
}

void VaultService::set_collateral_value(const AccountId& caller, const std::string& collateral_class,
                                        const Amount& value) {
    administer(TransactionContext("set_collateral_value", caller),
               "collateral_value." + collateral_class, to_decimal(value), [&]() {
        if (collateral_class.empty()) {
            throw InputValidationError(ErrorCode::PARAMETER_OUT_OF_RANGE,
                "Collateral class must not be empty");
        }
        collateral_oracle_->set_collateral_value(collateral_class, value);
    });
}

void VaultService::set_minimum_discount_rate(const AccountId& caller, const Amount& rate) {
    administer(TransactionContext("set_minimum_discount_rate", caller), "minimum_discount_rate",
               to_decimal(rate), [&]() {
        pricer_.set_minimum_discount_rate(rate);
    });
}

void VaultService::set_minimum_loan_duration(const AccountId& caller, uint64_t seconds) {
    administer(TransactionContext("set_minimum_loan_duration", caller), "minimum_loan_duration",
               std::to_string(seconds), [&]() {
        pricer_.set_minimum_loan_duration(seconds);
    });
}

void VaultService::set_note_adapter(const AccountId& caller, const std::string& note_token,
                                    std::shared_ptr<INoteAdapter> adapter) {
    administer(TransactionContext("set_note_adapter", caller), "note_adapter." + note_token,
               adapter ? "registered" : "removed", [&]() {
        if (note_token.empty()) {
            throw InputValidationError(ErrorCode::PARAMETER_OUT_OF_RANGE,
                "Note token must not be empty");
        }
        if (adapter) {
            adapters_[note_token] = std::move(adapter);
        } else {
            adapters_.erase(note_token);
        }
    });
}

void VaultService::restore_state(const AccountId& caller, const VaultState& state) {
    administer(TransactionContext("restore_state", caller), "state",
               std::to_string(state.loans.size()) + " loans", [&]() {
        state.parameters.validate();
        state.check_invariants();
        state_ = state;
    });
}

// ============================================================================
// Queries
// ============================================================================

Amount VaultService::share_price(TrancheId tranche) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return tranchevault::share_price(state_, tranche, now());
}

Amount VaultService::redemption_share_price(TrancheId tranche) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return tranchevault::redemption_share_price(state_, tranche);
}

Amount VaultService::estimated_value(TrancheId tranche) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return tranchevault::estimated_value(state_, tranche, now());
}

Amount VaultService::utilization() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_.utilization();
}

Amount VaultService::share_balance(TrancheId tranche, const AccountId& account) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_.tranche(tranche).share_balance(account);
}

Amount VaultService::redemption_available(TrancheId tranche, const AccountId& account) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return tranchevault::redemption_available(state_, tranche, account);
}

PriceQuote VaultService::quote(const LoanKey& key) const {
    std::lock_guard<std::mutex> lock(mutex_);

    LoanTerms terms = require_adapter(key.note_token).loan_terms(key.loan_id);
    uint64_t timestamp = now();
    if (terms.maturity <= timestamp) {
        throw EconomicPreconditionError(ErrorCode::INSUFFICIENT_TIME_REMAINING,
            "Loan " + key.to_string() + " has matured");
    }

    PricingRequest request;
    request.collateral = terms.collateral;
    request.principal = terms.principal;
    request.repayment = terms.repayment;
    request.duration_remaining = terms.maturity - timestamp;
    request.utilization = state_.utilization();

    return pricer_.quote(request);
}

std::unique_ptr<Loan> VaultService::find_loan(const LoanKey& key) const {
    std::lock_guard<std::mutex> lock(mutex_);
    const Loan* loan = state_.find_loan(key);
    return loan ? std::make_unique<Loan>(*loan) : nullptr;
}

VaultState VaultService::snapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_;
}

void VaultService::write_snapshot(const std::string& file_path) const {
    VaultState copy = snapshot();
    io::write_vault_state_json(file_path, copy);
}

std::set<LoanKey> VaultService::pending_loans(uint64_t bucket) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = state_.pending_loans.find(bucket);
    return it == state_.pending_loans.end() ? std::set<LoanKey>() : it->second;
}

std::shared_ptr<INoteAdapter> VaultService::note_adapter(const std::string& note_token) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = adapters_.find(note_token);
    return it == adapters_.end() ? nullptr : it->second;
}

TimeBucketConfig VaultService::timing() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_.parameters.timing;
}

} // namespace service
} // namespace tranchevault
