#include <catch2/catch_test_macros.hpp>

#include "switchboard/utils/address.hpp"

#include <string>

TEST_CASE("normalize_address drops separators and keeps a leading plus") {
    REQUIRE(switchboard::utils::normalize_address(" +1 (555) 010-0100 ") == "+15550100100");
    REQUIRE(switchboard::utils::normalize_address("555.0100") == "5550100");
    REQUIRE(switchboard::utils::normalize_address("1+2") == "12");
}

TEST_CASE("parse_remote_uri reads display name and number") {
    const auto party =
        switchboard::utils::parse_remote_uri("\"Alice\" <sip:+15550100@host;transport=tcp>");
    REQUIRE(party.number == "+15550100");
    REQUIRE(party.display_name);
    REQUIRE(*party.display_name == "Alice");
}

TEST_CASE("parse_remote_uri accepts bare uris") {
    const auto party = switchboard::utils::parse_remote_uri("sip:1000@pbx.local");
    REQUIRE(party.number == "1000");
    REQUIRE_FALSE(party.display_name);
    REQUIRE(switchboard::utils::parse_remote_uri("tel:+4420").number == "+4420");
}

TEST_CASE("expand_agent_uri fills agent and domain") {
    REQUIRE(switchboard::utils::expand_agent_uri("sip:{agent}@{domain}", "acme-alice",
                                                 "pbx.example.com") ==
            "sip:acme-alice@pbx.example.com");
}
