#include <catch2/catch_test_macros.hpp>

#include "expense/decimal.hpp"

#include <limits>

TEST_CASE("Decimal", "[decimal]") {

    SECTION("ParseIntegers") {
        auto d = Decimal::parse("25");
        REQUIRE(d);
        REQUIRE(d->units() == 25);
        REQUIRE(d->scale() == 0);
        REQUIRE(d->to_string(2) == "25.00");
    }

    SECTION("ParseFractions") {
        REQUIRE(Decimal::parse("25.5")->to_string() == "25.5");
        REQUIRE(Decimal::parse("  12.30 ")->to_string() == "12.3");
        REQUIRE(Decimal::parse("-0.01")->to_string() == "-0.01");
        REQUIRE(Decimal::parse("0.5")->to_string(2) == "0.50");
        REQUIRE(Decimal::parse("007")->units() == 7);
    }

    SECTION("TrailingZerosNormalize") {
        REQUIRE(*Decimal::parse("12.30") == *Decimal::parse("12.3"));
        REQUIRE(Decimal::parse("12.30")->fractional_digits() == 1);
        REQUIRE(Decimal::parse("0.00")->is_zero());
    }

    SECTION("RejectsNonNumbers") {
        REQUIRE_FALSE(Decimal::parse(""));
        REQUIRE_FALSE(Decimal::parse("   "));
        REQUIRE_FALSE(Decimal::parse("abc"));
        REQUIRE_FALSE(Decimal::parse("1,000"));
        REQUIRE_FALSE(Decimal::parse("¥25"));
        REQUIRE_FALSE(Decimal::parse("1.2.3"));
        REQUIRE_FALSE(Decimal::parse("."));
        REQUIRE_FALSE(Decimal::parse("-"));
    }

    SECTION("Exponents") {
        REQUIRE(Decimal::parse("1e2")->to_string() == "100");
        REQUIRE(Decimal::parse("2.5E1")->to_string() == "25");
        REQUIRE(Decimal::parse("1.5e+3")->to_string() == "1500");
        REQUIRE(Decimal::parse("2500e-2")->to_string() == "25");
        REQUIRE(Decimal::parse("-1.25e-1")->to_string() == "-0.125");
        REQUIRE_FALSE(Decimal::parse("1e"));
        REQUIRE_FALSE(Decimal::parse("e2"));
        REQUIRE_FALSE(Decimal::parse("1e+-2"));
        REQUIRE_FALSE(Decimal::parse("1e2.5"));
        REQUIRE_FALSE(Decimal::parse("1e19"));
        REQUIRE_FALSE(Decimal::parse("1e-10"));
    }

    SECTION("RejectsTooManyDigits") {
        REQUIRE_FALSE(Decimal::parse("1234567890123456789"));
        REQUIRE_FALSE(Decimal::parse("0.1234567891"));
    }

    SECTION("FromDoubleKeepsShortestForm") {
        REQUIRE(Decimal::from_double(12.345)->to_string() == "12.345");
        REQUIRE(Decimal::from_double(0.1)->to_string() == "0.1");
        REQUIRE(Decimal::from_double(25.0)->to_string() == "25");
        REQUIRE_FALSE(Decimal::from_double(std::numeric_limits<double>::infinity()));
    }

    SECTION("Cents") {
        REQUIRE(Decimal::parse("25")->to_cents() == 2500);
        REQUIRE(Decimal::parse("25.5")->to_cents() == 2550);
        REQUIRE(Decimal::from_cents(199).to_string() == "1.99");
        REQUIRE_FALSE(Decimal::parse("12.345")->to_cents());
    }

    SECTION("Ordering") {
        REQUIRE(*Decimal::parse("0.01") < *Decimal::parse("0.1"));
        REQUIRE(*Decimal::parse("999999.99") < *Decimal::parse("1000000"));
        REQUIRE(*Decimal::parse("-1") < Decimal());
        REQUIRE(*Decimal::parse("2.50") == Decimal(25, 1));
    }
}
