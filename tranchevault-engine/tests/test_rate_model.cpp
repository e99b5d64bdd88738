#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers.hpp>
#include "rate_model.hpp"
#include "test_support.hpp"

using namespace tranchevault;
using namespace tranchevault::testing;
using fixed_point::one;

namespace {

// 5% at 0, 10% at the 0.6 kink, 30% at 1.0
RateModel create_kinked_model() {
    return RateModel::from_target_rates(dec("0.05"), dec("0.10"), dec("0.30"), dec("0.6"), one());
}

} // anonymous namespace

TEST_CASE("RateModel construction", "[rate_model]") {
    SECTION("Default model is a zero rate at zero input") {
        RateModel model;
        REQUIRE(model.evaluate(Amount(0)) == Amount(0));
        REQUIRE_THROWS_MATCHES(model.evaluate(Amount(1)), VaultError,
                               HasErrorCode(ErrorCode::PARAMETER_OUT_OF_RANGE));
    }

    SECTION("Kink above max is rejected") {
        REQUIRE_THROWS_MATCHES(RateModel(Amount(0), Amount(0), Amount(0), dec("2"), one()),
                               VaultError, HasErrorCode(ErrorCode::PARAMETER_OUT_OF_RANGE));
        REQUIRE_THROWS_AS(RateModel::from_target_rates(dec("0.05"), dec("0.1"), dec("0.3"), dec("2"), one()),
                          InputValidationError);
    }

    SECTION("Target rates must be ordered") {
        REQUIRE_THROWS_AS(RateModel::from_target_rates(dec("0.2"), dec("0.1"), dec("0.3"), dec("0.5"), one()),
                          InputValidationError);
        REQUIRE_THROWS_AS(RateModel::from_target_rates(dec("0.05"), dec("0.4"), dec("0.3"), dec("0.5"), one()),
                          InputValidationError);
    }

    SECTION("Slopes are derived from the target rates") {
        RateModel model = create_kinked_model();
        REQUIRE(model.offset() == dec("0.05"));
        REQUIRE(model.slope1() == dec("0.083333333333333333"));
        REQUIRE(model.slope2() == dec("0.5"));
        REQUIRE(model.kink() == dec("0.6"));
        REQUIRE(model.max() == one());
    }

    SECTION("Degenerate segments have zero slope") {
        RateModel flat = RateModel::from_target_rates(dec("0.1"), dec("0.1"), dec("0.1"), Amount(0), one());
        REQUIRE(flat.slope1() == Amount(0));
        REQUIRE(flat.evaluate(dec("0.7")) == dec("0.1"));

        RateModel single = RateModel::from_target_rates(dec("0"), dec("0.2"), dec("0.2"), one(), one());
        REQUIRE(single.slope2() == Amount(0));
        REQUIRE(single.evaluate(one()) == dec("0.2"));
    }
}

TEST_CASE("RateModel evaluation", "[rate_model]") {
    RateModel model = create_kinked_model();

    SECTION("Piecewise linear values") {
        REQUIRE(model.evaluate(Amount(0)) == dec("0.05"));
        REQUIRE(model.evaluate(dec("0.3")) == dec("0.074999999999999999"));
        REQUIRE(model.evaluate(dec("0.6")) == dec("0.099999999999999999"));
        REQUIRE(model.evaluate(dec("0.8")) == dec("0.199999999999999999"));
    }

    SECTION("Input exactly at max succeeds") {
        REQUIRE(model.evaluate(one()) == dec("0.299999999999999999"));
    }

    SECTION("One unit above max fails") {
        REQUIRE_THROWS_MATCHES(model.evaluate(one() + 1), VaultError,
                               HasErrorCode(ErrorCode::PARAMETER_OUT_OF_RANGE));
    }

    SECTION("Continuous at the kink") {
        const Amount& kink = model.kink();
        Amount lower_piece = model.offset() + fixed_point::mul(model.slope1(), kink);
        Amount upper_piece = model.offset() + fixed_point::mul(model.slope1(), kink) +
                             fixed_point::mul(model.slope2(), kink - kink);
        REQUIRE(model.evaluate(kink) == lower_piece);
        REQUIRE(model.evaluate(kink) == upper_piece);
        REQUIRE(model.evaluate(kink + 1) >= model.evaluate(kink));
    }

    SECTION("Monotonic over the domain") {
        Amount previous = model.evaluate(Amount(0));
        for (int step = 1; step <= 20; ++step) {
            Amount x = fixed_point::mul_div(one(), Amount(step), Amount(20));
            Amount rate = model.evaluate(x);
            REQUIRE(rate >= previous);
            previous = rate;
        }
    }
}

TEST_CASE("RateModel equality", "[rate_model]") {
    REQUIRE(create_kinked_model() == create_kinked_model());
    REQUIRE(create_kinked_model() != RateModel());
}
