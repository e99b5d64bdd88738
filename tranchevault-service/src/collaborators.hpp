/**
 * @file collaborators.hpp
 * @brief External systems the vault service talks to
 *
 * The vault never moves tokens, notes or collateral itself; it instructs these
 * collaborators. Implementations throw on failure and never partially apply
 * a transfer, so a throwing call rolls the surrounding transaction back.
 */

#ifndef TRANCHEVAULT_SERVICE_COLLABORATORS_HPP
#define TRANCHEVAULT_SERVICE_COLLABORATORS_HPP

#include <cstdint>
#include "collateral.hpp"
#include "fixed_point.hpp"
#include "loan.hpp"
#include "tranche.hpp"

namespace tranchevault {
namespace service {

/**
 * @brief Deposit-token movements between accounts and the vault
 */
class IAssetTransfer {
public:
    virtual ~IAssetTransfer() = default;

    /**
     * @brief Move amount from an account into the vault
     */
    virtual void pull(const AccountId& from, const Amount& amount) = 0;

    /**
     * @brief Move amount from the vault to an account
     */
    virtual void push(const AccountId& to, const Amount& amount) = 0;
};

/**
 * @brief Loan platform adapter, one per note token
 */
class INoteAdapter {
public:
    virtual ~INoteAdapter() = default;

    virtual LoanTerms loan_terms(uint64_t loan_id) const = 0;
    virtual bool is_repaid(uint64_t loan_id) const = 0;
    virtual bool is_expired(uint64_t loan_id) const = 0;
    virtual bool is_liquidated(uint64_t loan_id) const = 0;

    /**
     * @brief Foreclose an expired loan on its platform
     */
    virtual void liquidate(uint64_t loan_id) = 0;
};

/**
 * @brief Custody of notes and of collateral from foreclosed loans
 */
class ICustody {
public:
    virtual ~ICustody() = default;

    virtual void receive_note(const LoanKey& key, const AccountId& from) = 0;
    virtual void release_collateral(const CollateralRef& collateral, const AccountId& to) = 0;
};

/**
 * @brief Time source, unix seconds
 */
class IClock {
public:
    virtual ~IClock() = default;

    virtual uint64_t now() const = 0;
};

/**
 * @brief Wall clock
 */
class SystemClock : public IClock {
public:
    uint64_t now() const override;
};

} // namespace service
} // namespace tranchevault

#endif // TRANCHEVAULT_SERVICE_COLLABORATORS_HPP
