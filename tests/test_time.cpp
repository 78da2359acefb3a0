#include <fxgen/core/time.hpp>

#include <catch2/catch_test_macros.hpp>

TEST_CASE("Parse yyyy.mm.dd dates", "[core][time]") {
    auto epoch = fxgen::parse_date("1970.01.01");
    REQUIRE(epoch.has_value());
    REQUIRE(epoch->days == 0);

    auto date = fxgen::parse_date("2020.01.01");
    REQUIRE(date.has_value());
    REQUIRE(date->days == 18262);

    SECTION("single-digit month and day are accepted") {
        auto short_form = fxgen::parse_date("2020.1.1");
        REQUIRE(short_form.has_value());
        REQUIRE(*short_form == *date);
    }

    SECTION("malformed or impossible dates are rejected") {
        REQUIRE_FALSE(fxgen::parse_date("2020-01-01").has_value());
        REQUIRE_FALSE(fxgen::parse_date("2020.13.01").has_value());
        REQUIRE_FALSE(fxgen::parse_date("2021.02.29").has_value());
        REQUIRE_FALSE(fxgen::parse_date("20.01.01").has_value());
        REQUIRE_FALSE(fxgen::parse_date("2020.01.0x").has_value());
        REQUIRE_FALSE(fxgen::parse_date("").has_value());
    }

    SECTION("leap day") {
        REQUIRE(fxgen::parse_date("2020.02.29").has_value());
    }
}

TEST_CASE("Format dates and timestamps", "[core][time]") {
    auto date = fxgen::parse_date("2014.01.30").value();
    REQUIRE(fxgen::format_date(date) == "2014.01.30");

    auto ts = fxgen::start_of(date);
    REQUIRE(fxgen::format_timestamp(ts) == "2014.01.30 00:00:00.000");

    ts.nanos += 13 * 3600 * fxgen::kNanosPerSecond + 5 * fxgen::kNanosPerMinute +
                7 * fxgen::kNanosPerSecond + 250'999'999;
    REQUIRE(fxgen::format_timestamp(ts) == "2014.01.30 13:05:07.250");
}

TEST_CASE("Parse timestamps written by format_timestamp", "[core][time]") {
    auto ts = fxgen::parse_timestamp("2020.01.01 00:01:30.500");
    REQUIRE(ts.has_value());
    auto midnight = fxgen::start_of(fxgen::parse_date("2020.01.01").value());
    REQUIRE(ts->nanos - midnight.nanos == 90 * fxgen::kNanosPerSecond + 500'000'000);

    REQUIRE(fxgen::parse_timestamp("2020.01.01 23:59:59").has_value());
    REQUIRE_FALSE(fxgen::parse_timestamp("2020.01.01T00:00:00").has_value());
    REQUIRE_FALSE(fxgen::parse_timestamp("2020.01.01 24:00:00").has_value());
    REQUIRE_FALSE(fxgen::parse_timestamp("2020.01.01 00:00:00,000").has_value());
}

TEST_CASE("Inclusive day counting", "[core][time]") {
    auto first = fxgen::parse_date("2020.01.01").value();
    auto last = fxgen::parse_date("2020.01.31").value();
    REQUIRE(fxgen::days_inclusive(first, last) == 31);
    REQUIRE(fxgen::days_inclusive(first, first) == 1);
}
