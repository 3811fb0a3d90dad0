/**
 * @file json_text_test.cpp
 * @brief Unit tests for JSON text helpers
 */

#include <catch2/catch_test_macros.hpp>

#include "gedanon/core/json_text.hpp"

#include <chrono>
#include <string>

using namespace gedanon;

TEST_CASE("JsonText: Escaping", "[core][json]") {
    CHECK(json_escape("plain") == "plain");
    CHECK(json_escape("say \"hi\"") == "say \\\"hi\\\"");
    CHECK(json_escape("C:\\path") == "C:\\\\path");
    CHECK(json_escape("a\nb\tc\r") == "a\\nb\\tc\\r");
    CHECK(json_escape(std::string("\x01", 1)) == "\\u0001");
    CHECK(json_escape("\x1f") == "\\u001f");
    CHECK(json_escape("Zo\xC3\xAB") == "Zo\xC3\xAB");
}

TEST_CASE("JsonText: Quoting", "[core][json]") {
    CHECK(json_quote("") == "\"\"");
    CHECK(json_quote("Person 1") == "\"Person 1\"");
}

TEST_CASE("JsonText: Timestamps", "[core][json]") {
    using namespace std::chrono;

    const system_clock::time_point epoch{};
    CHECK(iso8601_utc(epoch) == "1970-01-01T00:00:00.000Z");

    const auto later = epoch + seconds(86400 + 3661) + milliseconds(42);
    CHECK(iso8601_utc(later) == "1970-01-02T01:01:01.042Z");
}
