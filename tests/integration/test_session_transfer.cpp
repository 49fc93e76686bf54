#include <catch2/catch_test_macros.hpp>
#include "helpers/session_harness.hpp"
#include "helpers/test_keys.hpp"
#include "peerdrop/crypto/integrity_verifier.hpp"
#include "peerdrop/protocol/status_messages.hpp"
#include "peerdrop/transfer/byte_sources.hpp"
#include <filesystem>
#include <fstream>
using namespace peerdrop::protocol;
using namespace peerdrop::protocol::test_helpers;

TEST_CASE("PeerSession - File transfer between connected peers", "[integration][session][transfer]") {
    SessionHarness harness;
    auto alice = harness.AddPeer("alice1");
    auto bob = harness.AddPeer("bob001");
    REQUIRE(alice.session->Connect("bob001").IsOk());
    REQUIRE(alice.session->Status() == ConnectionStatus::Connected);

    const auto content = PatternBytes(5 * 1024 * 1024);
    const std::string expected_hash = crypto::IntegrityVerifier::Digest(content);

    std::optional<size_t> receiver_progress_when_recorded;
    auto history_subscription = harness.history->SubscribeAll("alice1",
        [&](const std::vector<proto::transfer::TransferRecord>& records) {
            if (!records.empty() && !receiver_progress_when_recorded) {
                receiver_progress_when_recorded = bob.events->progress.size();
            }
        }).Unwrap();

    auto file = transfer::MakeOutgoingFile("video.mp4", "video/mp4", content);
    auto summary = alice.session->SendFile(file);
    REQUIRE(summary.IsOk());
    REQUIRE(summary.Unwrap().file_hash == expected_hash);
    REQUIRE(summary.Unwrap().chunks_sent == 320);

    SECTION("The receiver holds a verified copy") {
        REQUIRE(bob.events->SawMessage(StatusMessages::RECEIVE_VERIFIED));
        REQUIRE(bob.events->received.size() == 1);
        REQUIRE(bob.events->received[0].first == "video.mp4");
        REQUIRE(bob.events->received[0].second == content.size());
        auto received = bob.session->TakeReceivedFile();
        REQUIRE(received.has_value());
        REQUIRE(received->hash == expected_hash);
        REQUIRE(received->mime_type == "video/mp4");
        REQUIRE(received->content == content);
        REQUIRE(bob.session->TransferProgress() == 100.0);
    }
    SECTION("The sender reports completion") {
        REQUIRE(alice.session->LastStatusMessage() == StatusMessages::SEND_COMPLETE);
        REQUIRE(alice.events->progress.back() == 100.0);
        REQUIRE(alice.session->TransferProgress() == 100.0);
    }
    SECTION("The record is written before any chunk arrives") {
        REQUIRE(receiver_progress_when_recorded.has_value());
        REQUIRE(*receiver_progress_when_recorded == 0);
        auto records = harness.history->Records("alice1");
        REQUIRE(records.size() == 1);
        REQUIRE(records[0].recipient_id() == "bob001");
        REQUIRE(records[0].file_hash() == expected_hash);
    }
    SECTION("The answerer can send back over the same link") {
        auto reply = transfer::MakeOutgoingFile("reply.txt", "text/plain", PatternBytes(10));
        REQUIRE(bob.session->SendFile(reply).IsOk());
        auto received = alice.session->TakeReceivedFile();
        REQUIRE(received.has_value());
        REQUIRE(received->name == "reply.txt");
        REQUIRE(harness.history->Records("bob001").size() == 1);
    }
}

TEST_CASE("PeerSession - Sending requires a connection", "[integration][session][transfer]") {
    SessionHarness harness;
    auto alice = harness.AddPeer("alice1");
    auto file = transfer::MakeOutgoingFile("a.txt", "text/plain", PatternBytes(10));

    SECTION("Never connected") {
        auto result = alice.session->SendFile(file);
        REQUIRE(result.UnwrapErr().type == ProtocolFailureType::InvalidState);
        REQUIRE(alice.session->LastStatusMessage() == StatusMessages::NOT_READY_TO_SEND);
        REQUIRE(harness.history->Records("alice1").empty());
    }
    SECTION("Still negotiating") {
        REQUIRE(alice.session->Connect("absent").IsOk());
        REQUIRE(alice.session->SendFile(file).IsErr());
    }
    SECTION("After the peer left") {
        auto bob = harness.AddPeer("bob001");
        REQUIRE(alice.session->Connect("bob001").IsOk());
        bob.session->Disconnect();
        REQUIRE(alice.session->SendFile(file).UnwrapErr().type == ProtocolFailureType::InvalidState);
    }
}

TEST_CASE("PeerSession - Empty file and on-disk sources", "[integration][session][transfer]") {
    auto config = configuration::PeerConfig::Create(kMinChunkSize, "disk-test").Unwrap();
    SessionHarness harness(std::move(config));
    auto alice = harness.AddPeer("alice1");
    auto bob = harness.AddPeer("bob001");
    REQUIRE(alice.session->Connect("bob001").IsOk());

    SECTION("Empty file") {
        auto file = transfer::MakeOutgoingFile("empty.txt", "text/plain", {});
        auto summary = alice.session->SendFile(file);
        REQUIRE(summary.IsOk());
        REQUIRE(summary.Unwrap().chunks_sent == 0);
        auto received = bob.session->TakeReceivedFile();
        REQUIRE(received.has_value());
        REQUIRE(received->content.empty());
    }
    SECTION("File read from disk") {
        const auto path = std::filesystem::temp_directory_path() / "peerdrop_session_source.bin";
        const auto content = PatternBytes(3 * kMinChunkSize + 17);
        {
            std::ofstream out(path, std::ios::binary | std::ios::trunc);
            out.write(reinterpret_cast<const char*>(content.data()), static_cast<std::streamsize>(content.size()));
        }
        auto file = transfer::OpenOutgoingFile(path.string(), "application/octet-stream");
        REQUIRE(file.IsOk());
        REQUIRE(file.Unwrap().name == "peerdrop_session_source.bin");
        auto summary = alice.session->SendFile(file.Unwrap());
        REQUIRE(summary.IsOk());
        REQUIRE(summary.Unwrap().chunks_sent == 4);
        REQUIRE(bob.session->TakeReceivedFile()->content == content);
        std::filesystem::remove(path);
    }
    SECTION("Missing file") {
        auto file = transfer::OpenOutgoingFile("/nonexistent/peerdrop/missing.bin", "text/plain");
        REQUIRE(file.IsErr());
    }
}
