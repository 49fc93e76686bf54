#include <catch2/catch_test_macros.hpp>
#include "peerdrop/history/transfer_history.hpp"
#include <chrono>
#include <vector>
using namespace peerdrop::protocol;
using namespace peerdrop::protocol::history;
using proto::transfer::TransferRecord;

namespace {
TransferRecord RecordAt(const std::string& name, const std::string& timestamp) {
    auto record = MakeRecord("alice1", "bob001", name, "00");
    record.set_timestamp(timestamp);
    return record;
}
}

TEST_CASE("TransferHistory - Timestamps", "[history]") {
    using namespace std::chrono;
    const system_clock::time_point when{milliseconds(1700000000123)};
    REQUIRE(FormatTimestamp(when) == "2023-11-14T22:13:20.123Z");
    REQUIRE(CurrentTimestamp().size() == 24);
}

TEST_CASE("TransferHistory - Ordering", "[history]") {
    std::vector<TransferRecord> records = {
        RecordAt("old", "2024-01-01T00:00:00.000Z"),
        RecordAt("new", "2024-03-01T00:00:00.000Z"),
        RecordAt("mid", "2024-02-01T00:00:00.000Z"),
    };
    SortNewestFirst(records);
    REQUIRE(records[0].file_name() == "new");
    REQUIRE(records[1].file_name() == "mid");
    REQUIRE(records[2].file_name() == "old");
}

TEST_CASE("TransferHistory - In-memory store", "[history]") {
    InMemoryTransferHistory history("test-app");
    std::vector<std::vector<TransferRecord>> snapshots;
    auto subscription = history.SubscribeAll("alice1",
        [&](const std::vector<TransferRecord>& records) { snapshots.push_back(records); });
    REQUIRE(subscription.IsOk());

    SECTION("Subscribers get the current list immediately") {
        REQUIRE(snapshots.size() == 1);
        REQUIRE(snapshots[0].empty());
    }
    SECTION("Appends are delivered newest first") {
        REQUIRE(history.Append(RecordAt("first", "2024-01-01T00:00:00.000Z")).IsOk());
        REQUIRE(history.Append(RecordAt("second", "2024-01-02T00:00:00.000Z")).IsOk());
        REQUIRE(snapshots.size() == 3);
        REQUIRE(snapshots.back()[0].file_name() == "second");
        REQUIRE(history.Records("alice1").size() == 2);
    }
    SECTION("Records are grouped by sender") {
        auto other = MakeRecord("carol1", "bob001", "x", "00");
        REQUIRE(history.Append(other).IsOk());
        REQUIRE(snapshots.size() == 1);
        REQUIRE(history.Records("carol1").size() == 1);
        REQUIRE(history.Records("alice1").empty());
    }
    SECTION("A record needs a sender") {
        auto orphan = MakeRecord("", "bob001", "x", "00");
        REQUIRE(history.Append(orphan).UnwrapErr().type == ProtocolFailureType::InvalidInput);
    }
}
