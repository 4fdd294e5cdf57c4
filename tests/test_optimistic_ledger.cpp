#include <catch2/catch_test_macros.hpp>

#include "switchboard/client/optimistic.hpp"

#include <optional>
#include <string>
#include <vector>

namespace {

struct Row {
    std::optional<std::string> correlation_id;
    std::string label;
};

}

TEST_CASE("pending entries are confirmed by correlation id") {
    switchboard::OptimisticLedger<Row> ledger;
    ledger.add_pending("c1", Row{std::string("c1"), "draft one"}, 100);
    ledger.add_pending("c2", Row{std::string("c2"), "draft two"}, 110);
    REQUIRE(ledger.pending_count() == 2);

    REQUIRE(ledger.confirm("c1", Row{std::string("c1"), "stored one"}));
    REQUIRE_FALSE(ledger.is_pending("c1"));
    REQUIRE(ledger.is_pending("c2"));
    REQUIRE_FALSE(ledger.confirm("unknown", Row{}));
    REQUIRE(ledger.size() == 2);
    REQUIRE(ledger.values().front().label == "stored one");
}

TEST_CASE("reconcile ignores records without a matching correlation id") {
    switchboard::OptimisticLedger<Row> ledger;
    ledger.add_pending("c1", Row{std::string("c1"), "draft"}, 100);

    const std::vector<Row> records{
        Row{std::nullopt, "inbound call"},
        Row{std::string("other"), "someone else"},
        Row{std::string("c1"), "stored"},
    };
    const auto confirmed =
        ledger.reconcile(records, [](const Row& row) { return row.correlation_id; });
    REQUIRE(confirmed == 1);
    REQUIRE(ledger.size() == 1);
    REQUIRE(ledger.values().front().label == "stored");
    REQUIRE(ledger.reconcile(records, [](const Row& row) { return row.correlation_id; }) == 0);
}

TEST_CASE("discard and expire drop only what they should") {
    switchboard::OptimisticLedger<Row> ledger;
    ledger.add_pending("old", Row{std::string("old"), "old"}, 100);
    ledger.add_pending("new", Row{std::string("new"), "new"}, 500);
    ledger.add_pending("kept", Row{std::string("kept"), "kept"}, 50);
    ledger.confirm("kept", Row{std::string("kept"), "confirmed"});

    REQUIRE(ledger.expire(200) == 1);
    REQUIRE_FALSE(ledger.find("old"));
    REQUIRE(ledger.find("kept"));

    REQUIRE(ledger.discard("new"));
    REQUIRE_FALSE(ledger.discard("new"));
    REQUIRE(ledger.size() == 1);
}

TEST_CASE("re-adding a correlation id replaces the entry") {
    switchboard::OptimisticLedger<Row> ledger;
    ledger.add_pending("c1", Row{std::string("c1"), "first"}, 100);
    ledger.add_pending("c1", Row{std::string("c1"), "second"}, 200);
    REQUIRE(ledger.size() == 1);
    REQUIRE(ledger.values().front().label == "second");
}
