/**
 * @file date_normalizer_test.cpp
 * @brief Unit tests for GEDCOM date placeholder substitution
 */

#include <catch2/catch_test_macros.hpp>

#include "gedanon/security/date_normalizer.hpp"

using namespace gedanon::security;

TEST_CASE("DateNormalizer: Full Dates", "[security][date]") {
    CHECK(normalize_date("15 MAR 1850") == "1 JAN 1900");
    CHECK(normalize_date("4 JUL 1776") == "1 JAN 1900");
    CHECK(normalize_date("01 jan 2001") == "1 JAN 1900");
    CHECK(classify_date("15 MAR 1850") == date_shape::full_date);

    SECTION("Only the prefix has to match") {
        CHECK(normalize_date("15 MAR 1850 (approx)") == "1 JAN 1900");
        CHECK(normalize_date("15 MAR 18500") == "1 JAN 1900");
    }

    SECTION("Month token must be exactly three word characters") {
        CHECK(normalize_date("15 MARCH 1850") == "15 MARCH 1850");
        CHECK(normalize_date("15 MA 1850") == "15 MA 1850");
    }

    SECTION("Day must have one or two digits") {
        CHECK(normalize_date("123 MAR 1850") == "123 MAR 1850");
    }

    SECTION("Year must have four digits") {
        CHECK(normalize_date("15 MAR 185") == "15 MAR 185");
    }
}

TEST_CASE("DateNormalizer: Qualified Years", "[security][date]") {
    CHECK(normalize_date("ABT 1850") == "ABT 1900");
    CHECK(normalize_date("BEF 1900") == "BEF 1900");
    CHECK(normalize_date("AFT 1820") == "AFT 1900");
    CHECK(normalize_date("CAL 1799") == "CAL 1900");
    CHECK(normalize_date("EST 1700") == "EST 1900");
    CHECK(classify_date("ABT 1850") == date_shape::qualified_year);

    SECTION("Qualifier survives, trailing text does not") {
        CHECK(normalize_date("ABT 1850 or so") == "ABT 1900");
        CHECK(normalize_date("ABT  1850") == "ABT 1900");
    }

    SECTION("Qualified full date uses the qualifier rule") {
        CHECK(normalize_date("ABT 15 MAR 1850") == "ABT 15 MAR 1850");
    }

    SECTION("Unknown or lowercase qualifiers are not recognized") {
        CHECK(normalize_date("abt 1850") == "abt 1850");
        CHECK(normalize_date("INT 1850") == "INT 1850");
        CHECK(normalize_date("BET 1850 AND 1860") == "BET 1850 AND 1860");
    }

    SECTION("Qualifier must be followed by whitespace") {
        CHECK(normalize_date("ABT1850") == "ABT1850");
    }
}

TEST_CASE("DateNormalizer: Years", "[security][date]") {
    CHECK(normalize_date("1923") == "1900");
    CHECK(normalize_date("1923-1925") == "1900");
    CHECK(normalize_date("12345") == "1900");
    CHECK(classify_date("1923") == date_shape::year);
}

TEST_CASE("DateNormalizer: Unrecognized Values", "[security][date]") {
    CHECK(normalize_date("") == "");
    CHECK(normalize_date("192") == "192");
    CHECK(normalize_date("MAR 1850") == "MAR 1850");
    CHECK(normalize_date("FROM 1850 TO 1860") == "FROM 1850 TO 1860");
    CHECK(normalize_date(" 1850") == " 1850");
    CHECK(classify_date("unknown") == date_shape::unrecognized);
}

TEST_CASE("DateNormalizer: Non-ASCII Dates", "[security][date][unicode]") {
    SECTION("Month tokens with accented or non-Latin letters") {
        CHECK(normalize_date("1 M" "\xC3\x84" "R 1850") == "1 JAN 1900");
        CHECK(normalize_date("15 " "\xD0\x9C\xD0\x90\xD0\xA0" " 1850") == "1 JAN 1900");
    }

    SECTION("Month token length counts characters, not bytes") {
        CHECK(normalize_date("1 M" "\xC3\x84" "RZ 1850") == "1 M" "\xC3\x84" "RZ 1850");
        CHECK(normalize_date("1 " "\xC3\x84\xC3\x84" " 1850") == "1 " "\xC3\x84\xC3\x84" " 1850");
    }

    SECTION("No-break space is whitespace") {
        CHECK(normalize_date("1" "\xC2\xA0" "MAR 1850") == "1 JAN 1900");
        CHECK(normalize_date("ABT" "\xC2\xA0" "1850") == "ABT 1900");
    }

    SECTION("Digits from other scripts") {
        // Arabic-Indic 1850
        CHECK(normalize_date("\xD9\xA1\xD9\xA8\xD9\xA5\xD9\xA0") == "1900");
        CHECK(normalize_date("\xD9\xA1\xD9\xA8\xD9\xA5") ==
              "\xD9\xA1\xD9\xA8\xD9\xA5");
    }
}

TEST_CASE("DateNormalizer: Shape Names", "[security][date]") {
    CHECK(to_string(date_shape::full_date) == "full_date");
    CHECK(to_string(date_shape::qualified_year) == "qualified_year");
    CHECK(to_string(date_shape::year) == "year");
    CHECK(to_string(date_shape::unrecognized) == "unrecognized");
}
