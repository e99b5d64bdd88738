/**
 * @file vault_service.hpp
 * @brief Serialized transaction dispatcher over the vault ledger
 *
 * The VaultService is responsible for:
 * - Reading external loan state through note adapters
 * - Applying each command to a working copy of the ledger
 * - Performing token, note and collateral transfers after the ledger update
 * - Committing the working copy only when every step succeeded
 * - Logging committed and rejected transactions
 *
 * Design Pattern: Copy-on-write transaction with a single writer
 */

#ifndef TRANCHEVAULT_SERVICE_VAULT_SERVICE_HPP
#define TRANCHEVAULT_SERVICE_VAULT_SERVICE_HPP

#include "access_policy.hpp"
#include "collaborators.hpp"
#include "logger.hpp"
#include "vault_config.hpp"
#include "collateral.hpp"
#include "loan_lifecycle.hpp"
#include "loan_pricer.hpp"
#include "vault_state.hpp"
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <set>
#include <string>

namespace tranchevault {
namespace service {

/**
 * @brief External systems wired into a vault service
 */
struct VaultCollaborators {
    std::shared_ptr<IAssetTransfer> asset_transfer;
    std::shared_ptr<ICustody> custody;
    std::shared_ptr<IAccessPolicy> access_policy;
    std::shared_ptr<IClock> clock;
};

/**
 * @brief Outcome of selling a note and depositing the proceeds
 */
struct NoteSaleDeposit {
    PurchaseResult purchase;
    TrancheAllocation amounts;   ///< Purchase price split across tranches
    TrancheAllocation shares;    ///< Shares minted to the seller
};

/**
 * @brief Single authoritative vault ledger with serialized transactions
 *
 * Every mutating operation copies the committed state, applies the command to
 * the copy, performs external transfers last and then replaces the committed
 * state. Any exception (a VaultError, a collaborator failure, checked
 * arithmetic overflow) leaves the committed state untouched and is rethrown
 * to the caller after being logged as a rejected transaction.
 *
 * Usage Example:
 *   @code
 *   VaultCollaborators collaborators;
 *   collaborators.asset_transfer = std::make_shared<MyTokenLedger>();
 *   collaborators.custody = std::make_shared<MyCustody>();
 *   collaborators.access_policy = policy;
 *   collaborators.clock = std::make_shared<SystemClock>();
 *
 *   auto vault = VaultService::from_config_file("vault.json", collaborators);
 *   vault->set_note_adapter("admin", "note", adapter);
 *
 *   vault->deposit("alice", TrancheId::Senior, fixed_point::from_decimal("10"));
 *   PriceQuote quote = vault->quote(LoanKey("note", 7));
 *   vault->sell_note("lender", LoanKey("note", 7), quote.purchase_price);
 *   @endcode
 */
class VaultService {
public:
    /**
     * @brief Construct a vault from a configuration
     *
     * @throws VaultConfigError if the configuration is invalid
     * @throws std::invalid_argument if a collaborator is missing
     */
    VaultService(const VaultConfig& config, const VaultCollaborators& collaborators);

    /**
     * @brief Parse a configuration file, apply its logging settings and build the vault
     *
     * @throws ConfigParseError, VaultConfigError
     */
    static std::unique_ptr<VaultService> from_config_file(const std::string& config_path,
                                                          const VaultCollaborators& collaborators);

    VaultService(const VaultService&) = delete;
    VaultService& operator=(const VaultService&) = delete;

    // ------------------------------------------------------------------
    // Depositors
    // ------------------------------------------------------------------

    /**
     * @brief Deposit into a tranche; pulls the amount from the depositor
     * @return Shares minted
     */
    Amount deposit(const AccountId& caller, TrancheId tranche, const Amount& amount);

    /**
     * @brief Deposit into both tranches in one transaction; zero amounts are skipped
     *
     * Either every deposit is applied or none is. Pulls the total from the depositor.
     *
     * @throws InputValidationError(INVALID_AMOUNT) when both amounts are zero
     * @return Shares minted per tranche
     */
    TrancheAllocation deposit_tranches(const AccountId& caller, const TrancheAllocation& amounts);

    /**
     * @brief Burn shares and queue their realized value for withdrawal
     * @return Amount queued
     */
    Amount redeem(const AccountId& caller, TrancheId tranche, const Amount& shares);

    /**
     * @brief Withdraw processed redemption cash; pushes the amount to the caller
     */
    void withdraw(const AccountId& caller, TrancheId tranche, const Amount& amount);

    /**
     * @brief Withdraw everything currently available
     * @return Amount withdrawn
     */
    Amount withdraw_max(const AccountId& caller, TrancheId tranche);

    // ------------------------------------------------------------------
    // Loans
    // ------------------------------------------------------------------

    /**
     * @brief Sell a note to the vault at the offered price
     *
     * Reads the loan terms from the note token's adapter, prices and records
     * the purchase, takes custody of the note and pays the seller.
     *
     * @throws InputValidationError(UNSUPPORTED_NOTE_TOKEN) without an adapter
     * @return Purchase breakdown (price, returns, maturity bucket)
     */
    PurchaseResult sell_note(const AccountId& caller, const LoanKey& key, const Amount& offered_price);

    /**
     * @brief Sell a note and deposit the purchase price instead of receiving it
     *
     * The price is split by `allocation` (fractions summing to 1.0) and deposited
     * for the seller after the purchase, at the resulting share prices. No cash
     * leaves the vault.
     *
     * @throws InputValidationError(PARAMETER_OUT_OF_RANGE) for an invalid allocation,
     *         before the note is looked up
     */
    NoteSaleDeposit sell_note_and_deposit(const AccountId& caller, const LoanKey& key,
                                          const Amount& offered_price, const TrancheAllocation& allocation);

    /**
     * @brief Realize a repaid loan; callable by anyone
     * @throws StatePreconditionError(LOAN_NOT_REPAID) unless the adapter reports repayment
     */
    void on_loan_repaid(const AccountId& caller, const LoanKey& key);

    /**
     * @brief Default an expired, unrepaid loan and foreclose it on its platform
     * @throws StatePreconditionError(LOAN_NOT_EXPIRED)
     */
    void on_loan_expired(const AccountId& caller, const LoanKey& key);

    /**
     * @brief Default a loan its platform has already liquidated
     * @throws StatePreconditionError(LOAN_NOT_LIQUIDATED)
     */
    void on_loan_liquidated(const AccountId& caller, const LoanKey& key);

    /**
     * @brief Book collateral liquidation proceeds; pulls them from the liquidator
     * @throws AuthorizationError without the collateral-liquidator capability
     */
    void on_collateral_liquidated(const AccountId& caller, const LoanKey& key, const Amount& proceeds);

    /**
     * @brief Release a liquidated loan's collateral to the liquidator
     * @throws AuthorizationError without the collateral-liquidator capability
     */
    void withdraw_collateral(const AccountId& caller, const LoanKey& key);

    // ------------------------------------------------------------------
    // Administration (admin capability)
    // ------------------------------------------------------------------

    void set_senior_tranche_rate(const AccountId& caller, const Amount& rate);
    void set_reserve_ratio(const AccountId& caller, const Amount& ratio);
    void set_paused(const AccountId& caller, bool paused);
    void set_price_tolerance(const AccountId& caller, const Amount& tolerance);
    void set_utilization_model(const AccountId& caller, const RateModel& model);
    void set_collateral_parameters(const AccountId& caller, const std::string& collateral_class,
                                   const CollateralRiskParameters& parameters);
    void set_collateral_value(const AccountId& caller, const std::string& collateral_class,
                              const Amount& value);
    void set_minimum_discount_rate(const AccountId& caller, const Amount& rate);
    void set_minimum_loan_duration(const AccountId& caller, uint64_t seconds);

    /**
     * @brief Register the adapter for a note token; a null adapter removes it
     */
    void set_note_adapter(const AccountId& caller, const std::string& note_token,
                          std::shared_ptr<INoteAdapter> adapter);

    /**
     * @brief Replace the ledger with a previously saved snapshot
     * @throws InvariantViolation if the snapshot does not balance
     */
    void restore_state(const AccountId& caller, const VaultState& state);

    // ------------------------------------------------------------------
    // Queries (committed state only)
    // ------------------------------------------------------------------

    Amount share_price(TrancheId tranche) const;
    Amount redemption_share_price(TrancheId tranche) const;
    Amount estimated_value(TrancheId tranche) const;
    Amount utilization() const;
    Amount share_balance(TrancheId tranche, const AccountId& account) const;
    Amount redemption_available(TrancheId tranche, const AccountId& account) const;

    /**
     * @brief Advisory purchase price for a loan at the current time
     */
    PriceQuote quote(const LoanKey& key) const;

    /**
     * @brief Copy of a held loan, or nullptr when not held
     */
    std::unique_ptr<Loan> find_loan(const LoanKey& key) const;

    /**
     * @brief Copy of the committed ledger
     */
    VaultState snapshot() const;

    /**
     * @brief Write the committed ledger as JSON
     */
    void write_snapshot(const std::string& file_path) const;

    /**
     * @brief Held loans maturing in the given time bucket
     */
    std::set<LoanKey> pending_loans(uint64_t bucket) const;

    /**
     * @brief Adapter registered for a note token, or nullptr
     */
    std::shared_ptr<INoteAdapter> note_adapter(const std::string& note_token) const;

    uint64_t now() const { return collaborators_.clock->now(); }
    TimeBucketConfig timing() const;

private:
    using Fields = std::map<std::string, std::string>;
    using Command = std::function<void(VaultState&, Fields&)>;

    /**
     * @brief Run a command against a working copy and commit it
     *
     * Logs transaction_committed with the fields the command filled in, or
     * transaction_rejected before rethrowing.
     */
    void transact(const TransactionContext& ctx, const Command& command);

    /**
     * @brief Apply an administrative change under the admin capability
     */
    void administer(const TransactionContext& ctx, const std::string& parameter,
                    const std::string& value, const std::function<void()>& change);

    INoteAdapter& require_adapter(const std::string& note_token) const;
    void require_active_loan(const VaultState& state, const LoanKey& key) const;
    void log_purchase(const TransactionContext& ctx, const LoanKey& key, const PurchaseResult& result) const;

    mutable std::mutex mutex_;
    VaultState state_;
    VaultCollaborators collaborators_;
    std::shared_ptr<StaticCollateralOracle> collateral_oracle_;
    LoanPricer pricer_;
    std::map<std::string, std::shared_ptr<INoteAdapter>> adapters_;
    Logger* logger_;
};

} // namespace service
} // namespace tranchevault

#endif // TRANCHEVAULT_SERVICE_VAULT_SERVICE_HPP
