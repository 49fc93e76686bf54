/**
 * @file file_share_demo.cpp
 * @brief Two in-process peers exchange a file over the loopback transport
 *
 * Usage: peerdrop_demo <input-file> <output-dir>
 */

#include "peerdrop/protocol/peer_session.hpp"
#include "peerdrop/configuration/peer_config.hpp"
#include "peerdrop/history/transfer_history.hpp"
#include "peerdrop/identity/peer_identity.hpp"
#include "peerdrop/logging/logger.hpp"
#include "peerdrop/signaling/in_memory_mailbox.hpp"
#include "peerdrop/transport/loopback_transport.hpp"
#include "peerdrop/transfer/byte_sources.hpp"

#include <filesystem>
#include <fstream>
#include <iostream>

using namespace peerdrop::protocol;

namespace {

class ConsoleEventHandler final : public interfaces::ISessionEventHandler {
public:
    explicit ConsoleEventHandler(std::string label) : label_(std::move(label)) {}

    void OnConnectionStatusChanged(const ConnectionStatus status) override {
        std::cout << "[" << label_ << "] status: " << ToString(status) << std::endl;
    }
    void OnStatusMessage(const std::string& message) override {
        std::cout << "[" << label_ << "] " << message << std::endl;
    }
    void OnTransferProgress(const double percent) override {
        const int bucket = static_cast<int>(percent) / 25;
        if (bucket != last_bucket_) {
            last_bucket_ = bucket;
            std::cout << "[" << label_ << "] progress " << static_cast<int>(percent) << "%" << std::endl;
        }
    }
    void OnFileReceived(const std::string& file_name, const uint64_t size) override {
        std::cout << "[" << label_ << "] received " << file_name << " (" << size << " bytes)" << std::endl;
    }
    void OnTransferFailed(const ProtocolFailure& failure) override {
        std::cerr << "[" << label_ << "] transfer failed: " << failure.message << std::endl;
    }

private:
    std::string label_;
    int last_bucket_ = -1;
};

}

int main(int argc, char** argv) {
    if (argc != 3) {
        std::cerr << "Usage: " << argv[0] << " <input-file> <output-dir>" << std::endl;
        return 2;
    }
    const std::string input_path = argv[1];
    const std::filesystem::path output_dir = argv[2];

    auto config_result = configuration::PeerConfig::FromEnvironment();
    if (config_result.IsErr()) {
        std::cerr << "Invalid configuration: " << config_result.UnwrapErr().message << std::endl;
        return 1;
    }
    const auto config = std::move(config_result).Unwrap();

    auto mailbox = std::make_shared<signaling::InMemoryMailbox>(config.AppId());
    auto transports = std::make_shared<transport::LoopbackTransportFactory>();
    auto history = std::make_shared<history::InMemoryTransferHistory>(config.AppId());

    auto make_session = [&](const std::string& label) {
        PeerSession::Dependencies deps{
            mailbox, transports, history, std::make_shared<ConsoleEventHandler>(label)};
        return PeerSession::Create(identity::GeneratePeerId(), std::move(deps), config);
    };
    auto sender_result = make_session("sender");
    auto receiver_result = make_session("receiver");
    if (sender_result.IsErr() || receiver_result.IsErr()) {
        const auto& failure = sender_result.IsErr() ? sender_result.UnwrapErr() : receiver_result.UnwrapErr();
        std::cerr << "Failed to create session: " << failure.message << std::endl;
        return 1;
    }
    auto sender = std::move(sender_result).Unwrap();
    auto receiver = std::move(receiver_result).Unwrap();
    std::cout << "Sender id: " << sender->LocalId() << ", receiver id: " << receiver->LocalId() << std::endl;

    if (auto started = sender->Start(); started.IsErr()) {
        std::cerr << "Sender failed to start: " << started.UnwrapErr().message << std::endl;
        return 1;
    }
    if (auto started = receiver->Start(); started.IsErr()) {
        std::cerr << "Receiver failed to start: " << started.UnwrapErr().message << std::endl;
        return 1;
    }
    if (auto connected = sender->Connect(receiver->LocalId()); connected.IsErr()) {
        std::cerr << "Connect failed: " << connected.UnwrapErr().message << std::endl;
        return 1;
    }
    if (sender->Status() != ConnectionStatus::Connected) {
        std::cerr << "Peers did not connect" << std::endl;
        return 1;
    }

    auto file_result = transfer::OpenOutgoingFile(input_path, std::string(kDefaultMimeType));
    if (file_result.IsErr()) {
        std::cerr << "Cannot open " << input_path << ": " << file_result.UnwrapErr().message << std::endl;
        return 1;
    }
    auto file = std::move(file_result).Unwrap();
    auto summary = sender->SendFile(file);
    if (summary.IsErr()) {
        return 1;
    }
    std::cout << "Sent " << summary.Unwrap().bytes_sent << " bytes in "
              << summary.Unwrap().chunks_sent << " chunks, sha256 " << summary.Unwrap().file_hash << std::endl;

    auto received = receiver->TakeReceivedFile();
    if (!received) {
        std::cerr << "Receiver has no verified file" << std::endl;
        return 1;
    }
    std::error_code ec;
    std::filesystem::create_directories(output_dir, ec);
    if (ec) {
        std::cerr << "Cannot create " << output_dir << ": " << ec.message() << std::endl;
        return 1;
    }
    const auto output_path = output_dir / std::filesystem::path(received->name).filename();
    std::ofstream out(output_path, std::ios::binary | std::ios::trunc);
    out.write(reinterpret_cast<const char*>(received->content.data()),
        static_cast<std::streamsize>(received->content.size()));
    if (!out) {
        std::cerr << "Failed to write " << output_path << std::endl;
        return 1;
    }
    std::cout << "Wrote " << output_path << std::endl;

    for (const auto& record : history->Records(sender->LocalId())) {
        std::cout << "History: " << record.timestamp() << " " << record.file_name()
                  << " -> " << record.recipient_id() << std::endl;
    }

    sender->Stop();
    receiver->Stop();
    return 0;
}
