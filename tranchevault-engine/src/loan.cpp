#include "loan.hpp"
#include <tuple>

namespace tranchevault {

bool LoanKey::operator==(const LoanKey& other) const {
    return note_token == other.note_token && loan_id == other.loan_id;
}

bool LoanKey::operator<(const LoanKey& other) const {
    return std::tie(note_token, loan_id) < std::tie(other.note_token, other.loan_id);
}

std::string LoanKey::to_string() const {
    return note_token + "#" + std::to_string(loan_id);
}

bool Loan::operator==(const Loan& other) const {
    return collateral == other.collateral &&
           borrower == other.borrower &&
           purchase_price == other.purchase_price &&
           repayment_amount == other.repayment_amount &&
           maturity_timestamp == other.maturity_timestamp &&
           tranche_returns == other.tranche_returns &&
           active == other.active &&
           liquidated == other.liquidated &&
           collateral_withdrawn == other.collateral_withdrawn;
}

} // namespace tranchevault
