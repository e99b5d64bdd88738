/**
 * @file vault_error.hpp
 * @brief Error taxonomy for the vault ledger and pricer
 *
 * Every rejected operation throws a VaultError subclass before any ledger
 * mutation is committed. The ErrorCode identifies the precise failure; the
 * subclass identifies its category.
 */

#ifndef TRANCHEVAULT_VAULT_ERROR_HPP
#define TRANCHEVAULT_VAULT_ERROR_HPP

#include <stdexcept>
#include <string>

namespace tranchevault {

/**
 * @brief Failure codes reported by the vault
 */
enum class ErrorCode {
    // Input validation
    PARAMETER_OUT_OF_RANGE,
    INVALID_AMOUNT,
    DUPLICATE_LOAN,
    UNSUPPORTED_NOTE_TOKEN,
    // State preconditions
    UNKNOWN_LOAN,
    LOAN_NOT_REPAID,
    LOAN_NOT_EXPIRED,
    LOAN_NOT_LIQUIDATED,
    COLLATERAL_ALREADY_WITHDRAWN,
    REDEMPTION_IN_PROGRESS,
    INSUFFICIENT_SHARES,
    TRANCHE_INSOLVENT,
    PAUSED,
    // Economic preconditions
    PRICE_MISMATCH,
    REPAYMENT_TOO_LOW,
    INSUFFICIENT_LIQUIDITY,
    SENIOR_RETURN_EXCEEDS_SPREAD,
    INSUFFICIENT_TIME_REMAINING,
    UNSUPPORTED_COLLATERAL,
    // Access control
    UNAUTHORIZED
};

/**
 * @brief Convert error code to string for logging
 */
inline std::string error_code_to_string(ErrorCode code) {
    switch (code) {
        case ErrorCode::PARAMETER_OUT_OF_RANGE: return "ParameterOutOfRange";
        case ErrorCode::INVALID_AMOUNT: return "InvalidAmount";
        case ErrorCode::DUPLICATE_LOAN: return "DuplicateLoan";
        case ErrorCode::UNSUPPORTED_NOTE_TOKEN: return "UnsupportedNoteToken";
        case ErrorCode::UNKNOWN_LOAN: return "UnknownLoan";
        case ErrorCode::LOAN_NOT_REPAID: return "LoanNotRepaid";
        case ErrorCode::LOAN_NOT_EXPIRED: return "LoanNotExpired";
        case ErrorCode::LOAN_NOT_LIQUIDATED: return "LoanNotLiquidated";
        case ErrorCode::COLLATERAL_ALREADY_WITHDRAWN: return "CollateralAlreadyWithdrawn";
        case ErrorCode::REDEMPTION_IN_PROGRESS: return "RedemptionInProgress";
        case ErrorCode::INSUFFICIENT_SHARES: return "InsufficientShares";
        case ErrorCode::TRANCHE_INSOLVENT: return "TrancheInsolvent";
        case ErrorCode::PAUSED: return "Paused";
        case ErrorCode::PRICE_MISMATCH: return "PriceMismatch";
        case ErrorCode::REPAYMENT_TOO_LOW: return "RepaymentTooLow";
        case ErrorCode::INSUFFICIENT_LIQUIDITY: return "InsufficientLiquidity";
        case ErrorCode::SENIOR_RETURN_EXCEEDS_SPREAD: return "SeniorReturnExceedsSpread";
        case ErrorCode::INSUFFICIENT_TIME_REMAINING: return "InsufficientTimeRemaining";
        case ErrorCode::UNSUPPORTED_COLLATERAL: return "UnsupportedCollateral";
        case ErrorCode::UNAUTHORIZED: return "Unauthorized";
        default: return "Unknown";
    }
}

/**
 * @brief Base exception for vault errors
 */
class VaultError : public std::runtime_error {
public:
    VaultError(ErrorCode code, const std::string& message)
        : std::runtime_error(error_code_to_string(code) + ": " + message), code_(code) {}

    ErrorCode code() const { return code_; }

private:
    ErrorCode code_;
};

/**
 * @brief Raised for malformed or out-of-range inputs
 */
class InputValidationError : public VaultError {
public:
    InputValidationError(ErrorCode code, const std::string& message)
        : VaultError(code, message) {}
};

/**
 * @brief Raised when the ledger is not in a state that permits the operation
 */
class StatePreconditionError : public VaultError {
public:
    StatePreconditionError(ErrorCode code, const std::string& message)
        : VaultError(code, message) {}
};

/**
 * @brief Raised when executing the operation would harm solvency
 */
class EconomicPreconditionError : public VaultError {
public:
    EconomicPreconditionError(ErrorCode code, const std::string& message)
        : VaultError(code, message) {}
};

/**
 * @brief Raised when the caller lacks the required capability
 */
class AuthorizationError : public VaultError {
public:
    explicit AuthorizationError(const std::string& message)
        : VaultError(ErrorCode::UNAUTHORIZED, message) {}
};

} // namespace tranchevault

#endif // TRANCHEVAULT_VAULT_ERROR_HPP
