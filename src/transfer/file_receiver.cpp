#include "peerdrop/transfer/file_receiver.hpp"
#include "peerdrop/transfer/chunk_frame.hpp"
#include "peerdrop/transfer/file_metadata_codec.hpp"
#include "peerdrop/transfer/file_sender.hpp"
#include "peerdrop/crypto/sodium_interop.hpp"
#include "peerdrop/core/constants.hpp"
#include "peerdrop/core/format.hpp"
#include <algorithm>
namespace peerdrop::protocol::transfer {

namespace {
    constexpr uint64_t kMaxInitialReserve = 64ULL * 1024 * 1024;
}

Result<ReceiveUpdate, ProtocolFailure> FileReceiver::OnText(std::string_view text) {
    auto metadata = FileMetadataCodec::TryDecode(text);
    if (!metadata) {
        return Result<ReceiveUpdate, ProtocolFailure>::Ok(ReceiveUpdate::Ignored);
    }
    Discard();
    expected_bytes_ = FileMetadataCodec::FileSize(*metadata);
    buffer_.reserve(static_cast<size_t>(std::min(expected_bytes_, kMaxInitialReserve)));
    active_ = std::move(*metadata);
    if (expected_bytes_ == 0) {
        return Complete();
    }
    return Result<ReceiveUpdate, ProtocolFailure>::Ok(ReceiveUpdate::TransferStarted);
}

Result<ReceiveUpdate, ProtocolFailure> FileReceiver::OnBinary(
    std::span<const uint8_t> frame,
    const crypto::SymmetricKey* key) {
    if (key == nullptr) {
        return Result<ReceiveUpdate, ProtocolFailure>::Err(
            ProtocolFailure::NoKeyEstablished(std::string(ErrorMessages::NO_SYMMETRIC_KEY)));
    }
    if (!active_) {
        return Result<ReceiveUpdate, ProtocolFailure>::Err(
            ProtocolFailure::UnexpectedChunk(
                compat::format("Chunk of {} bytes arrived with no active transfer", frame.size())));
    }
    auto plaintext = ChunkFrame::Open(*key, frame);
    if (plaintext.IsErr()) {
        Discard();
        return Result<ReceiveUpdate, ProtocolFailure>::Err(std::move(plaintext).UnwrapErr());
    }
    const auto& bytes = plaintext.Unwrap();
    buffer_.insert(buffer_.end(), bytes.begin(), bytes.end());
    verifier_.Update(bytes);
    received_bytes_ += bytes.size();
    progress_ = FileSender::ProgressPercent(received_bytes_, expected_bytes_);
    if (received_bytes_ >= expected_bytes_) {
        return Complete();
    }
    return Result<ReceiveUpdate, ProtocolFailure>::Ok(ReceiveUpdate::ChunkAccepted);
}

Result<ReceiveUpdate, ProtocolFailure> FileReceiver::Complete() {
    const std::string digest = verifier_.Finalize();
    proto::transfer::FileMetadata metadata = std::move(*active_);
    active_.reset();
    if (!crypto::IntegrityVerifier::Matches(metadata.file_hash(), digest)) {
        Discard();
        DropReceivedFile();
        return Result<ReceiveUpdate, ProtocolFailure>::Err(
            ProtocolFailure::VerificationMismatch(
                compat::format("'{}' hashed to {}, sender announced {}",
                    metadata.file_name(), digest, metadata.file_hash())));
    }
    received_file_ = ReceivedFile{
        metadata.file_name(),
        metadata.file_type(),
        digest,
        std::move(buffer_)};
    buffer_ = {};
    progress_ = 100.0;
    return Result<ReceiveUpdate, ProtocolFailure>::Ok(ReceiveUpdate::Completed);
}

std::optional<ReceivedFile> FileReceiver::TakeReceivedFile() {
    std::optional<ReceivedFile> taken = std::move(received_file_);
    received_file_.reset();
    return taken;
}

void FileReceiver::Abort() {
    Discard();
}

void FileReceiver::Discard() {
    if (!buffer_.empty()) {
        (void)crypto::SodiumInterop::SecureWipe(std::span<uint8_t>(buffer_));
    }
    buffer_.clear();
    buffer_.shrink_to_fit();
    active_.reset();
    (void)verifier_.Finalize();
    received_bytes_ = 0;
    expected_bytes_ = 0;
    progress_ = 0.0;
}

void FileReceiver::DropReceivedFile() {
    if (received_file_ && !received_file_->content.empty()) {
        (void)crypto::SodiumInterop::SecureWipe(std::span<uint8_t>(received_file_->content));
    }
    received_file_.reset();
}

}
