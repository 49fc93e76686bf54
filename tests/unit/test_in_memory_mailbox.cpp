#include <catch2/catch_test_macros.hpp>
#include "peerdrop/signaling/in_memory_mailbox.hpp"
#include "peerdrop/signaling/signaling_codec.hpp"
#include <string>
#include <vector>
using namespace peerdrop::protocol;
using namespace peerdrop::protocol::signaling;
using interfaces::MailboxEntry;

TEST_CASE("InMemoryMailbox - Paths", "[mailbox][signaling]") {
    InMemoryMailbox mailbox("demo-app");
    REQUIRE(mailbox.MailboxPath("abc123") == "artifacts/demo-app/users/abc123/signaling");
}

TEST_CASE("InMemoryMailbox - Delivery", "[mailbox][signaling]") {
    InMemoryMailbox mailbox("demo-app");
    std::vector<MailboxEntry> delivered;

    SECTION("Entries waiting before subscription are delivered on subscribe") {
        auto id = mailbox.Send("bob001", SignalingCodec::MakeCandidate("alice1", "bob001", "candidate:x"));
        REQUIRE(id.IsOk());
        auto subscription = mailbox.Subscribe("bob001",
            [&](const std::vector<MailboxEntry>& entries) {
                delivered.insert(delivered.end(), entries.begin(), entries.end());
            });
        REQUIRE(subscription.IsOk());
        REQUIRE(delivered.size() == 1);
        REQUIRE(delivered[0].id == id.Unwrap());
    }
    SECTION("New entries reach only the owner's subscribers") {
        auto subscription = mailbox.Subscribe("bob001",
            [&](const std::vector<MailboxEntry>& entries) {
                delivered.insert(delivered.end(), entries.begin(), entries.end());
            }).Unwrap();
        REQUIRE(mailbox.AppendRaw("carol1", "{}").IsOk());
        REQUIRE(delivered.empty());
        REQUIRE(mailbox.AppendRaw("bob001", "{}").IsOk());
        REQUIRE(delivered.size() == 1);
    }
    SECTION("Cancelled subscriptions receive nothing") {
        auto subscription = mailbox.Subscribe("bob001",
            [&](const std::vector<MailboxEntry>& entries) {
                delivered.insert(delivered.end(), entries.begin(), entries.end());
            }).Unwrap();
        subscription.Cancel();
        REQUIRE_FALSE(subscription.IsActive());
        REQUIRE(mailbox.AppendRaw("bob001", "{}").IsOk());
        REQUIRE(delivered.empty());
    }
    SECTION("A callback may delete the entry it was handed") {
        auto subscription = mailbox.Subscribe("bob001",
            [&](const std::vector<MailboxEntry>& entries) {
                for (const auto& entry : entries) {
                    REQUIRE(mailbox.DeleteMessage("bob001", entry.id).IsOk());
                }
            }).Unwrap();
        REQUIRE(mailbox.AppendRaw("bob001", "{}").IsOk());
        REQUIRE(mailbox.Entries("bob001").empty());
    }
}

TEST_CASE("InMemoryMailbox - Deletion", "[mailbox][signaling]") {
    InMemoryMailbox mailbox("demo-app");
    auto first = mailbox.AppendRaw("bob001", "one").Unwrap();
    auto second = mailbox.AppendRaw("bob001", "two").Unwrap();
    REQUIRE(first != second);
    REQUIRE(mailbox.DeleteMessage("bob001", first).IsOk());
    REQUIRE(mailbox.Entries("bob001").size() == 1);
    REQUIRE(mailbox.Entries("bob001")[0].document == "two");

    SECTION("Deleting twice or an unknown id succeeds") {
        REQUIRE(mailbox.DeleteMessage("bob001", first).IsOk());
        REQUIRE(mailbox.DeleteMessage("nobody", "msg-999").IsOk());
    }
    SECTION("Empty owner is rejected") {
        REQUIRE(mailbox.AppendRaw("", "x").UnwrapErr().type == ProtocolFailureType::InvalidInput);
    }
}
