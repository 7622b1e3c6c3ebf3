#include <catch2/catch_test_macros.hpp>
#include "classifier/pattern_catalog.hpp"

#include <algorithm>

using namespace docshield;

namespace {

size_t count_category(const std::vector<PatternMatch>& matches, EntityCategory category) {
    return static_cast<size_t>(std::count_if(matches.begin(), matches.end(),
        [&](const PatternMatch& m) { return m.category == category; }));
}

} // anonymous namespace

TEST_CASE("Default catalog holds six categories in fixed order", "[catalog]") {
    const auto catalog = PatternCatalog::default_catalog();
    REQUIRE(catalog.size() == 6);

    const std::vector<EntityCategory> expected = {
        EntityCategory::EMAIL_ADDRESS,
        EntityCategory::PHONE_NUMBER,
        EntityCategory::IP_ADDRESS,
        EntityCategory::CREDIT_CARD,
        EntityCategory::SSN,
        EntityCategory::DATE,
    };
    CHECK(catalog.categories() == expected);
}

TEST_CASE("Catalog detects email addresses", "[catalog]") {
    const auto catalog = PatternCatalog::default_catalog();
    const auto matches = catalog.find_all("Write to alice.smith+tag@example.co.uk today");

    REQUIRE(matches.size() == 1);
    CHECK(matches[0].category == EntityCategory::EMAIL_ADDRESS);
    CHECK(matches[0].catalog_index == 0);
    CHECK(matches[0].begin == 9);
    CHECK(matches[0].end == 38);
}

TEST_CASE("Catalog detects SSNs", "[catalog]") {
    const auto matches = PatternCatalog::default_catalog().find_all("SSN 123-45-6789");

    REQUIRE(matches.size() == 1);
    CHECK(matches[0].category == EntityCategory::SSN);
    CHECK(matches[0].begin == 4);
    CHECK(matches[0].end == 15);
}

TEST_CASE("Catalog detects an IP address at end of text", "[catalog]") {
    const auto matches = PatternCatalog::default_catalog().find_all("Server 10.0.0.1");

    REQUIRE(matches.size() == 1);
    CHECK(matches[0].category == EntityCategory::IP_ADDRESS);
    CHECK(matches[0].begin == 7);
    CHECK(matches[0].end == 15);
}

TEST_CASE("Catalog detects an IP address before a trailing newline", "[catalog]") {
    const auto catalog = PatternCatalog::default_catalog();

    SECTION("address alone") {
        const auto matches = catalog.find_all("10.0.0.1\n");
        REQUIRE(matches.size() == 1);
        CHECK(matches[0].category == EntityCategory::IP_ADDRESS);
        CHECK(matches[0].begin == 0);
        CHECK(matches[0].end == 8);
    }

    SECTION("address overlapping a phone hit") {
        const auto matches = catalog.find_all("192.168.1.254\n");
        REQUIRE(matches.size() == 2);
        CHECK(matches[0].category == EntityCategory::PHONE_NUMBER);
        CHECK(matches[0].begin == 0);
        CHECK(matches[0].end == 7);
        CHECK(matches[1].category == EntityCategory::IP_ADDRESS);
        CHECK(matches[1].begin == 0);
        CHECK(matches[1].end == 13);
    }

    SECTION("newline in the middle still needs a dot") {
        CHECK(count_category(catalog.find_all("10.0.0.1\nmore"), EntityCategory::IP_ADDRESS) == 0);
    }
}

TEST_CASE("Catalog detects dates in both layouts", "[catalog]") {
    const auto catalog = PatternCatalog::default_catalog();

    SECTION("day/month/year") {
        const auto matches = catalog.find_all("on 12/05/1990");
        REQUIRE(matches.size() == 1);
        CHECK(matches[0].category == EntityCategory::DATE);
        CHECK(matches[0].begin == 3);
        CHECK(matches[0].end == 13);
    }

    SECTION("year-month-day") {
        const auto matches = catalog.find_all("due 2024-01-15");
        REQUIRE(matches.size() == 1);
        CHECK(matches[0].category == EntityCategory::DATE);
        CHECK(matches[0].begin == 4);
        CHECK(matches[0].end == 14);
    }
}

TEST_CASE("Word boundaries are ASCII-only", "[catalog]") {
    const auto catalog = PatternCatalog::default_catalog();

    // A trailing non-ASCII letter ends the digit run; an ASCII one does not
    const auto accented = catalog.find_all("id 1234567890123\xC3\xA9");
    REQUIRE(count_category(accented, EntityCategory::CREDIT_CARD) == 1);
    const auto card = std::find_if(accented.begin(), accented.end(),
        [](const PatternMatch& m) { return m.category == EntityCategory::CREDIT_CARD; });
    CHECK(card->begin == 3);
    CHECK(card->end == 16);

    CHECK(count_category(catalog.find_all("id 1234567890123x"), EntityCategory::CREDIT_CARD) == 0);
}

TEST_CASE("Catalog finds nothing in plain or empty text", "[catalog]") {
    const auto catalog = PatternCatalog::default_catalog();
    CHECK(catalog.find_all("").empty());
    CHECK(catalog.find_all("No personal data in this sentence.").empty());
}

TEST_CASE("Matches of different categories may overlap", "[catalog]") {
    const auto matches = PatternCatalog::default_catalog().find_all("4111 1111 1111 1111");

    CHECK(count_category(matches, EntityCategory::PHONE_NUMBER) >= 1);
    REQUIRE(count_category(matches, EntityCategory::CREDIT_CARD) == 1);

    // Grouped by catalog order: phone hits come before the card hit
    CHECK(matches.front().category == EntityCategory::PHONE_NUMBER);
    const auto card = std::find_if(matches.begin(), matches.end(),
        [](const PatternMatch& m) { return m.category == EntityCategory::CREDIT_CARD; });
    CHECK(card->begin == 0);
    CHECK(card->end == 19);
}

TEST_CASE("Custom catalog scans each entry left to right without overlap", "[catalog]") {
    std::vector<PatternCatalog::Entry> entries;
    entries.push_back({EntityCategory::SSN, std::regex("X+")});
    const PatternCatalog catalog(std::move(entries));

    const auto matches = catalog.find_all("aXXbX");
    REQUIRE(matches.size() == 2);
    CHECK(matches[0].begin == 1);
    CHECK(matches[0].end == 3);
    CHECK(matches[1].begin == 4);
    CHECK(matches[1].end == 5);
}

TEST_CASE("Zero-length regex hits are ignored", "[catalog]") {
    std::vector<PatternCatalog::Entry> entries;
    entries.push_back({EntityCategory::DATE, std::regex("\\d*")});
    const PatternCatalog catalog(std::move(entries));

    const auto matches = catalog.find_all("ab12c");
    REQUIRE(matches.size() == 1);
    CHECK(matches[0].begin == 2);
    CHECK(matches[0].end == 4);
}
