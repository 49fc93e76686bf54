#include "peerdrop/transfer/file_sender.hpp"
#include "peerdrop/transfer/chunk_frame.hpp"
#include "peerdrop/transfer/file_metadata_codec.hpp"
#include "peerdrop/crypto/integrity_verifier.hpp"
#include "peerdrop/crypto/sodium_interop.hpp"
#include "peerdrop/history/transfer_history.hpp"
#include "peerdrop/logging/logger.hpp"
#include "peerdrop/core/format.hpp"
#include <algorithm>
#include <vector>
namespace peerdrop::protocol::transfer {

FileSender::FileSender(const size_t chunk_size, interfaces::ITransferHistory* history)
    : chunk_size_(chunk_size)
    , history_(history) {}

double FileSender::ProgressPercent(const uint64_t done, const uint64_t total) noexcept {
    if (total == 0) {
        return 100.0;
    }
    const double percent = static_cast<double>(done) / static_cast<double>(total) * 100.0;
    return std::clamp(percent, 0.0, 100.0);
}

Result<std::string, ProtocolFailure> FileSender::DigestSource(interfaces::IByteSource& source) const {
    crypto::IntegrityVerifier verifier;
    std::vector<uint8_t> buffer(chunk_size_);
    uint64_t offset = 0;
    while (offset < source.Size()) {
        auto read = source.ReadAt(offset, buffer);
        PEERDROP_TRY(read);
        if (read.Unwrap() == 0) {
            return Result<std::string, ProtocolFailure>::Err(
                ProtocolFailure::Generic(
                    compat::format("Source ended at {} of {} bytes", offset, source.Size())));
        }
        verifier.Update(std::span<const uint8_t>(buffer.data(), read.Unwrap()));
        offset += read.Unwrap();
    }
    return Result<std::string, ProtocolFailure>::Ok(verifier.Finalize());
}

Result<SendSummary, ProtocolFailure> FileSender::Send(
    OutgoingFile& file,
    const crypto::SymmetricKey& key,
    interfaces::ITransport& transport,
    const std::string& sender_id,
    const std::string& recipient_id,
    const ProgressCallback& on_progress) const {
    if (!file.source) {
        return Result<SendSummary, ProtocolFailure>::Err(
            ProtocolFailure::InvalidInput("Outgoing file has no content source"));
    }
    auto logger = logging::GetLogger();
    interfaces::IByteSource& source = *file.source;
    const uint64_t total = source.Size();

    auto digest = DigestSource(source);
    PEERDROP_TRY(digest);
    SendSummary summary;
    summary.file_hash = std::move(digest).Unwrap();

    if (history_) {
        auto appended = history_->Append(
            history::MakeRecord(sender_id, recipient_id, file.name, summary.file_hash));
        summary.history_recorded = appended.IsOk();
        if (appended.IsErr()) {
            logger->warn("Transfer record for '{}' not stored: {}", file.name, appended.UnwrapErr().message);
        }
    }

    auto metadata = FileMetadataCodec::Encode(
        FileMetadataCodec::Make(file.name, total, file.mime_type, summary.file_hash));
    PEERDROP_TRY(metadata);
    PEERDROP_TRY(transport.SendText(metadata.Unwrap()));
    logger->info("Sending '{}' ({} bytes) to {}", file.name, total, recipient_id);

    if (total == 0 && on_progress) {
        on_progress(100.0);
    }

    std::vector<uint8_t> buffer(chunk_size_);
    while (summary.bytes_sent < total) {
        auto read = source.ReadAt(summary.bytes_sent, buffer);
        PEERDROP_TRY(read);
        const size_t count = read.Unwrap();
        if (count == 0) {
            return Result<SendSummary, ProtocolFailure>::Err(
                ProtocolFailure::Generic(
                    compat::format("Source ended at {} of {} bytes", summary.bytes_sent, total)));
        }
        auto frame = ChunkFrame::Seal(key, std::span<const uint8_t>(buffer.data(), count), summary.chunks_sent);
        PEERDROP_TRY(frame);
        PEERDROP_TRY(transport.SendBinary(frame.Unwrap()));
        summary.bytes_sent += count;
        ++summary.chunks_sent;
        if (on_progress) {
            on_progress(ProgressPercent(summary.bytes_sent, total));
        }
    }
    (void)crypto::SodiumInterop::SecureWipe(std::span<uint8_t>(buffer));
    logger->info("Sent '{}' in {} chunks", file.name, summary.chunks_sent);
    return Result<SendSummary, ProtocolFailure>::Ok(std::move(summary));
}

}
