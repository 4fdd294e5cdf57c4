#include <catch2/catch_test_macros.hpp>

#include "switchboard/errors.hpp"
#include "switchboard/server/rest_server.hpp"

#include <nlohmann/json.hpp>
#include <optional>
#include <stdexcept>
#include <string>

TEST_CASE("handler errors map to HTTP statuses") {
    using switchboard::RestServer;
    REQUIRE(RestServer::status_for(switchboard::NotFound("no session")) == 404);
    REQUIRE(RestServer::status_for(switchboard::StateConflict("already answered")) == 409);
    REQUIRE(RestServer::status_for(switchboard::SlotConflict("slot taken")) == 409);
    REQUIRE(RestServer::status_for(switchboard::ResourceExhausted("lot full")) == 429);
    REQUIRE(RestServer::status_for(switchboard::TransportError("provider down")) == 502);
    REQUIRE(RestServer::status_for(switchboard::InvalidValue("bad status")) == 400);
    REQUIRE(RestServer::status_for(switchboard::StoreError("disk")) == 500);
    REQUIRE(RestServer::status_for(std::runtime_error("other")) == 500);
}

TEST_CASE("malformed request bodies are client errors") {
    try {
        const auto body = nlohmann::json::parse("{not json");
        FAIL("parse should have thrown");
    } catch (const nlohmann::json::exception& ex) {
        REQUIRE(switchboard::RestServer::status_for(ex) == 400);
    }
    try {
        const auto value = nlohmann::json::object().at("session_id");
        FAIL("lookup should have thrown");
    } catch (const nlohmann::json::exception& ex) {
        REQUIRE(switchboard::RestServer::status_for(ex) == 400);
    }
}

TEST_CASE("oversized path numbers are client errors") {
    using switchboard::RestServer;
    REQUIRE(RestServer::path_number("42") == 42);
    try {
        RestServer::path_number("99999999999999999999999");
        FAIL("overflow should have thrown");
    } catch (const std::exception& ex) {
        REQUIRE(RestServer::status_for(ex) == 400);
    }
    try {
        RestServer::path_number("12abc");
        FAIL("trailing characters should have thrown");
    } catch (const std::exception& ex) {
        REQUIRE(RestServer::status_for(ex) == 400);
    }
}

TEST_CASE("history limit defaults and is clamped") {
    using switchboard::RestServer;
    REQUIRE(RestServer::history_limit(std::nullopt) == 50);
    REQUIRE(RestServer::history_limit(std::string("20")) == 20);
    REQUIRE(RestServer::history_limit(std::string("0")) == 1);
    REQUIRE(RestServer::history_limit(std::string("-5")) == 1);
    REQUIRE(RestServer::history_limit(std::string("100000")) == 500);
    REQUIRE(RestServer::history_limit(std::string("99999999999999")) == 500);
    try {
        RestServer::history_limit(std::string("lots"));
        FAIL("a non-number should have thrown");
    } catch (const std::exception& ex) {
        REQUIRE(RestServer::status_for(ex) == 400);
    }
}
