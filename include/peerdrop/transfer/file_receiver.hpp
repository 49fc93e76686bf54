#pragma once
#include "peerdrop/core/result.hpp"
#include "peerdrop/core/failures.hpp"
#include "peerdrop/crypto/integrity_verifier.hpp"
#include "peerdrop/crypto/symmetric_key.hpp"
#include "transfer/transfer.pb.h"
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>
namespace peerdrop::protocol::transfer {

enum class ReceiveUpdate {
    Ignored,
    TransferStarted,
    ChunkAccepted,
    Completed
};

/// A verified incoming file.
struct ReceivedFile {
    std::string name;
    std::string mime_type;
    std::string hash;
    std::vector<uint8_t> content;
};

/**
 * Receiver half of the chunked transfer.
 *
 * Metadata starts a transfer and drops anything accumulated before it.
 * Chunks are decrypted and appended until the declared size is reached, then
 * the digest decides whether the file is exposed. A chunk that fails to
 * decrypt discards the transfer; later chunks are UnexpectedChunk until new
 * metadata arrives. A transfer that fails verification also drops any
 * earlier verified file that was never taken.
 */
class FileReceiver {
public:
    /// Ignored for non-metadata text. Completed at once for a zero-size file.
    [[nodiscard]] Result<ReceiveUpdate, ProtocolFailure> OnText(std::string_view text);

    [[nodiscard]] Result<ReceiveUpdate, ProtocolFailure> OnBinary(
        std::span<const uint8_t> frame,
        const crypto::SymmetricKey* key);

    /// Hands over the last verified file once.
    [[nodiscard]] std::optional<ReceivedFile> TakeReceivedFile();

    [[nodiscard]] bool HasReceivedFile() const noexcept { return received_file_.has_value(); }
    [[nodiscard]] const ReceivedFile* PeekReceivedFile() const noexcept {
        return received_file_ ? &*received_file_ : nullptr;
    }
    [[nodiscard]] bool InProgress() const noexcept { return active_.has_value(); }
    [[nodiscard]] double Progress() const noexcept { return progress_; }
    [[nodiscard]] uint64_t ReceivedBytes() const noexcept { return received_bytes_; }
    [[nodiscard]] const std::optional<proto::transfer::FileMetadata>& ActiveTransfer() const noexcept {
        return active_;
    }

    /// Drops any partial transfer. A completed, untaken file is kept.
    void Abort();

private:
    Result<ReceiveUpdate, ProtocolFailure> Complete();
    void Discard();
    void DropReceivedFile();

    std::optional<proto::transfer::FileMetadata> active_;
    std::vector<uint8_t> buffer_;
    crypto::IntegrityVerifier verifier_;
    uint64_t received_bytes_ = 0;
    uint64_t expected_bytes_ = 0;
    double progress_ = 0.0;
    std::optional<ReceivedFile> received_file_;
};
}
