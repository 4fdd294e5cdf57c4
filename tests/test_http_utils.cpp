#include <catch2/catch_test_macros.hpp>

#include "switchboard/errors.hpp"
#include "switchboard/utils/http.hpp"

#include <string>

TEST_CASE("url_encode escapes reserved characters") {
    const std::string input = "hello world!";
    const std::string expected = "hello%20world%21";
    REQUIRE(switchboard::utils::url_encode(input) == expected);
}

TEST_CASE("parse_url splits scheme host port and path") {
    const auto url = switchboard::utils::parse_url("https://example.com:8443/path/file");
    REQUIRE(url.scheme == "https");
    REQUIRE(url.host == "example.com");
    REQUIRE(url.port == 8443);
    REQUIRE(url.path == "/path/file");
}

TEST_CASE("parse_url fills in default ports") {
    REQUIRE(switchboard::utils::parse_url("https://example.com").port == 443);
    REQUIRE(switchboard::utils::parse_url("http://example.com/x").port == 80);
    REQUIRE(switchboard::utils::parse_url("example.com").scheme == "http");
}

TEST_CASE("parse_url rejects a missing host or a bad port") {
    REQUIRE_THROWS_AS(switchboard::utils::parse_url("https:///path"), switchboard::InvalidValue);
    REQUIRE_THROWS_AS(switchboard::utils::parse_url("http://host:80a/"),
                      switchboard::InvalidValue);
}

TEST_CASE("resolve_redirect_url handles absolute and relative redirects") {
    const std::string base_url = "https://example.com/path/file";
    REQUIRE(switchboard::utils::resolve_redirect_url(base_url, "/new") ==
            "https://example.com/new");
    REQUIRE(switchboard::utils::resolve_redirect_url(base_url, "other") ==
            "https://example.com/path/other");
    REQUIRE(switchboard::utils::resolve_redirect_url(base_url, "https://host/x") ==
            "https://host/x");
}

TEST_CASE("parse_query decodes form fields") {
    const auto params = switchboard::utils::parse_query("CallSid=CA1&From=%2B15550100&Name=a+b");
    REQUIRE(params.at("CallSid") == "CA1");
    REQUIRE(params.at("From") == "+15550100");
    REQUIRE(params.at("Name") == "a b");
}

TEST_CASE("resolve_redirect_url keeps a non-default port") {
    const std::string base_url = "http://music.local:8080/hold/loop.wav";
    REQUIRE(switchboard::utils::resolve_redirect_url(base_url, "/cdn/loop.wav") ==
            "http://music.local:8080/cdn/loop.wav");
    REQUIRE(switchboard::utils::resolve_redirect_url(base_url, "") == "");
}
