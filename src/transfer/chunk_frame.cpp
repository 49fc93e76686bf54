#include "peerdrop/transfer/chunk_frame.hpp"
#include "peerdrop/crypto/sodium_interop.hpp"
#include "peerdrop/debug/key_logger.hpp"
#include "peerdrop/core/constants.hpp"
#include "peerdrop/core/format.hpp"
#include <array>
namespace peerdrop::protocol::transfer {
using crypto::SodiumInterop;

static_assert(ChunkFrame::kOverhead == Constants::AES_GCM_NONCE_SIZE + Constants::AES_GCM_TAG_SIZE);

Result<std::vector<uint8_t>, ProtocolFailure> ChunkFrame::Seal(
    const crypto::SymmetricKey& key,
    std::span<const uint8_t> plaintext,
    const uint64_t chunk_index) {
    std::array<uint8_t, Constants::AES_GCM_NONCE_SIZE> iv{};
    SodiumInterop::FillRandom(iv);
    debug::LogChunkIv(debug::Side::Unknown, chunk_index, iv);
    auto ciphertext = key.Encrypt(iv, plaintext);
    PEERDROP_TRY(ciphertext);
    const auto& body = ciphertext.Unwrap();
    std::vector<uint8_t> frame;
    frame.reserve(iv.size() + body.size());
    frame.insert(frame.end(), iv.begin(), iv.end());
    frame.insert(frame.end(), body.begin(), body.end());
    return Result<std::vector<uint8_t>, ProtocolFailure>::Ok(std::move(frame));
}

Result<std::vector<uint8_t>, ProtocolFailure> ChunkFrame::Open(
    const crypto::SymmetricKey& key,
    std::span<const uint8_t> frame) {
    if (frame.size() < kOverhead) {
        return Result<std::vector<uint8_t>, ProtocolFailure>::Err(
            ProtocolFailure::Decryption(
                compat::format("Chunk of {} bytes is shorter than IV and tag", frame.size())));
    }
    return key.Decrypt(
        frame.first(Constants::AES_GCM_NONCE_SIZE),
        frame.subspan(Constants::AES_GCM_NONCE_SIZE));
}

}
