#include <catch2/catch_test_macros.hpp>
#include <catch2/generators/catch_generators.hpp>
#include "helpers/recording_transport.hpp"
#include "helpers/test_keys.hpp"
#include "peerdrop/transfer/file_receiver.hpp"
#include "peerdrop/transfer/file_sender.hpp"
#include <optional>
#include <variant>
using namespace peerdrop::protocol;
using namespace peerdrop::protocol::transfer;
using namespace peerdrop::protocol::test_helpers;

namespace {
Result<ReceiveUpdate, ProtocolFailure> Deliver(
    FileReceiver& receiver,
    const RecordingTransport::Message& message,
    const crypto::SymmetricKey& key) {
    if (const auto* text = std::get_if<std::string>(&message)) {
        return receiver.OnText(*text);
    }
    return receiver.OnBinary(std::get<std::vector<uint8_t>>(message), &key);
}
}

TEST_CASE("Chunked transfer - Sizes around the chunk boundary", "[integration][transfer]") {
    REQUIRE(crypto::SodiumInterop::Initialize().IsOk());
    const size_t size = GENERATE(size_t{0}, size_t{1}, size_t{16383}, size_t{16384}, size_t{16385}, size_t{10000000});
    auto [sender_key, receiver_key] = MakeMatchingKeys();
    const auto content = PatternBytes(size, static_cast<uint8_t>(size));

    RecordingTransport transport;
    const FileSender sender(kDefaultChunkSize, nullptr);
    auto file = MakeOutgoingFile("payload.bin", "application/octet-stream", content);
    auto summary = sender.Send(file, sender_key, transport, "alice1", "bob001", nullptr);
    REQUIRE(summary.IsOk());
    REQUIRE(summary.Unwrap().chunks_sent == (size + kDefaultChunkSize - 1) / kDefaultChunkSize);

    FileReceiver receiver;
    std::optional<ReceiveUpdate> last;
    for (const auto& message : transport.sent) {
        auto update = Deliver(receiver, message, receiver_key);
        REQUIRE(update.IsOk());
        last = update.Unwrap();
    }
    REQUIRE(last == ReceiveUpdate::Completed);
    auto received = receiver.TakeReceivedFile();
    REQUIRE(received.has_value());
    REQUIRE(received->content.size() == size);
    REQUIRE(received->content == content);
    REQUIRE(received->hash == summary.Unwrap().file_hash);
}

TEST_CASE("Chunked transfer - Tampered frame fails the transfer", "[integration][transfer]") {
    REQUIRE(crypto::SodiumInterop::Initialize().IsOk());
    auto [sender_key, receiver_key] = MakeMatchingKeys();
    RecordingTransport transport;
    const FileSender sender(kMinChunkSize, nullptr);
    auto file = MakeOutgoingFile("payload.bin", "application/octet-stream", PatternBytes(5000));
    REQUIRE(sender.Send(file, sender_key, transport, "alice1", "bob001", nullptr).IsOk());

    auto& victim = std::get<std::vector<uint8_t>>(transport.sent[2]);
    victim[victim.size() / 2] ^= 0x01;

    FileReceiver receiver;
    REQUIRE(Deliver(receiver, transport.sent[0], receiver_key).IsOk());
    REQUIRE(Deliver(receiver, transport.sent[1], receiver_key).IsOk());
    auto failed = Deliver(receiver, transport.sent[2], receiver_key);
    REQUIRE(failed.IsErr());
    REQUIRE(failed.UnwrapErr().type == ProtocolFailureType::Decryption);
    REQUIRE_FALSE(receiver.HasReceivedFile());
}
