#include "fixed_point.hpp"
#include <cctype>
#include <limits>
#include <stdexcept>

namespace tranchevault {
namespace fixed_point {

using Wide = boost::multiprecision::uint512_t;

namespace {

// cpp_int treats a leading '0' as an octal prefix, so digits are stripped first
Amount parse_digits(const std::string& digits) {
    size_t first = digits.find_first_not_of('0');
    if (first == std::string::npos) {
        return Amount(0);
    }
    return Amount(digits.substr(first));
}

Amount narrow(const Wide& value) {
    if (value > Wide(max_amount())) {
        throw std::overflow_error("Fixed-point result exceeds 256 bits");
    }
    return Amount(value);
}

} // anonymous namespace

const Amount& one() {
    static const Amount value("1000000000000000000");
    return value;
}

const Amount& max_amount() {
    static const Amount value = std::numeric_limits<Amount>::max();
    return value;
}

Amount from_integer(uint64_t value) {
    return Amount(value) * one();
}

Amount from_decimal(const std::string& text) {
    if (text.empty()) {
        throw std::invalid_argument("Empty decimal string");
    }

    size_t dot = text.find('.');
    std::string integer_part = text.substr(0, dot);
    std::string fraction_part = dot == std::string::npos ? "" : text.substr(dot + 1);

    if (integer_part.empty() && fraction_part.empty()) {
        throw std::invalid_argument("Malformed decimal: " + text);
    }
    for (char c : integer_part + fraction_part) {
        if (!std::isdigit(static_cast<unsigned char>(c))) {
            throw std::invalid_argument("Malformed decimal: " + text);
        }
    }
    if (fraction_part.size() > DECIMALS) {
        throw std::invalid_argument("More than 18 fractional digits: " + text);
    }

    fraction_part.append(DECIMALS - fraction_part.size(), '0');
    return parse_digits(integer_part + fraction_part);
}

std::string to_decimal(const Amount& value) {
    std::string digits = value.str();
    if (digits.size() <= DECIMALS) {
        digits.insert(0, DECIMALS + 1 - digits.size(), '0');
    }

    std::string integer_part = digits.substr(0, digits.size() - DECIMALS);
    std::string fraction_part = digits.substr(digits.size() - DECIMALS);

    size_t last = fraction_part.find_last_not_of('0');
    if (last == std::string::npos) {
        return integer_part;
    }
    return integer_part + "." + fraction_part.substr(0, last + 1);
}

Amount mul(const Amount& a, const Amount& b) {
    return mul_div(a, b, one());
}

Amount div(const Amount& a, const Amount& b) {
    if (b == 0) {
        throw std::domain_error("Fixed-point division by zero");
    }
    return mul_div(a, one(), b);
}

Amount mul_div(const Amount& a, const Amount& b, const Amount& c) {
    if (c == 0) {
        throw std::domain_error("Fixed-point division by zero");
    }
    Wide product = Wide(a) * Wide(b);
    return narrow(product / Wide(c));
}

Amount normalize_rate(const Amount& annual_rate) {
    return annual_rate / Amount(SECONDS_PER_YEAR);
}

Amount saturating_sub(const Amount& a, const Amount& b) {
    return a > b ? Amount(a - b) : Amount(0);
}

} // namespace fixed_point
} // namespace tranchevault
