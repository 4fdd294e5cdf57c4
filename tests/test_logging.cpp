#include <catch2/catch_test_macros.hpp>

#include "switchboard/logging.hpp"

#include <chrono>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>

TEST_CASE("context is appended as key value pairs") {
    using switchboard::logging::with_kv;
    REQUIRE(with_kv("Session parked", {}) == "Session parked");
    REQUIRE(with_kv("Session parked", {switchboard::kv("slot", 3), switchboard::kv("held", true)}) ==
            "Session parked [slot=3, held=true]");
    REQUIRE(with_kv("Caller", {switchboard::kv("name", std::string("Ann \"A\" Lee"))}) ==
            "Caller [name=\"Ann \\\"A\\\" Lee\"]");
    REQUIRE(with_kv("x", {switchboard::kv("agent", std::optional<std::string>())}) == "x [agent=-]");
    REQUIRE(with_kv("x", {switchboard::kv("empty", std::string())}) == "x [empty=\"\"]");
    REQUIRE(with_kv("x", {switchboard::kv("delay", std::chrono::milliseconds(1500))}) ==
            "x [delay=1500ms]");
}

TEST_CASE("json lines carry level message and fields") {
    const auto line = switchboard::logging::to_json_line(
        spdlog::level::warn, "Transfer timed out",
        {switchboard::kv("transfer", 7), switchboard::kv("msg", "shadowed")});
    const auto json = nlohmann::json::parse(line);
    REQUIRE(json.at("level") == "warning");
    REQUIRE(json.at("msg") == "Transfer timed out");
    REQUIRE(json.at("transfer") == "7");
    REQUIRE(json.at("field_msg") == "shadowed");
    REQUIRE(json.at("ts").is_number_integer());
}

TEST_CASE("logging works before init") {
    REQUIRE(switchboard::logging::get_logger());
    REQUIRE_NOTHROW(switchboard::logging::info("No logger configured", {switchboard::kv("ok", 1)}));
}
