#ifndef TRANCHEVAULT_FIXED_POINT_HPP
#define TRANCHEVAULT_FIXED_POINT_HPP

#include <boost/multiprecision/cpp_int.hpp>
#include <cstdint>
#include <string>

namespace tranchevault {

// Unsigned 256-bit ledger amount. Checked: overflow and underflow throw
// (std::overflow_error / std::range_error) instead of wrapping.
using Amount = boost::multiprecision::checked_uint256_t;

// Fixed-point helpers with 18 fractional digits (1.0 == 10^18).
// Every operation truncates toward zero.
namespace fixed_point {

constexpr unsigned DECIMALS = 18;
constexpr uint64_t SECONDS_PER_YEAR = 365ULL * 86400ULL;

// 10^18
const Amount& one();

// Largest representable amount
const Amount& max_amount();

// Integer n -> n * 10^18
Amount from_integer(uint64_t value);

// Parse a non-negative decimal such as "2.2" or "0.000000000000000001".
// Throws std::invalid_argument on malformed text or more than 18 fractional digits.
Amount from_decimal(const std::string& text);

// Render as decimal with trailing fractional zeros trimmed ("10", "1.0055")
std::string to_decimal(const Amount& value);

// a * b / 10^18
Amount mul(const Amount& a, const Amount& b);

// a * 10^18 / b, throws std::domain_error when b == 0
Amount div(const Amount& a, const Amount& b);

// a * b / c on a 512-bit intermediate, throws std::domain_error when c == 0
Amount mul_div(const Amount& a, const Amount& b, const Amount& c);

// Annual rate -> per-second rate (annual / seconds per year)
Amount normalize_rate(const Amount& annual_rate);

// max(a - b, 0)
Amount saturating_sub(const Amount& a, const Amount& b);

} // namespace fixed_point
} // namespace tranchevault

#endif // TRANCHEVAULT_FIXED_POINT_HPP
