#pragma once

#include "peerdrop/core/result.hpp"
#include "peerdrop/core/failures.hpp"
#include "peerdrop/core/constants.hpp"

#include <spdlog/common.h>
#include <cstddef>
#include <string>
#include <string_view>

namespace peerdrop::protocol::configuration {

/// Runtime settings shared by a PeerSession and its collaborators
///
/// - `chunk_size`: plaintext bytes per encrypted chunk, in
///   [kMinChunkSize, kMaxChunkSize], 16 KiB by default
/// - `app_id`: namespace for mailbox and history owner paths
/// - `log_level`: level applied to the "peerdrop" logger
///
/// @example
/// ```cpp
/// auto config = PeerConfig::FromEnvironment();
/// if (config.IsErr()) {
///     // PEERDROP_CHUNK_SIZE or PEERDROP_LOG_LEVEL was malformed
/// }
/// ```
class PeerConfig {
public:
    // =========================================================================
    // Factory Methods
    // =========================================================================

    [[nodiscard]] static PeerConfig Default() {
        return PeerConfig(kDefaultChunkSize, std::string(kDefaultAppId), spdlog::level::info);
    }

    /// Validating constructor; rejects out-of-range chunk sizes and empty app ids.
    [[nodiscard]] static Result<PeerConfig, ProtocolFailure> Create(
        size_t chunk_size,
        std::string app_id,
        spdlog::level::level_enum log_level = spdlog::level::info);

    /// Defaults overridden by PEERDROP_APP_ID, PEERDROP_LOG_LEVEL and
    /// PEERDROP_CHUNK_SIZE when those are set and non-empty.
    [[nodiscard]] static Result<PeerConfig, ProtocolFailure> FromEnvironment();

    /// Parses a level name as accepted by spdlog ("trace" ... "off").
    [[nodiscard]] static Result<spdlog::level::level_enum, ProtocolFailure> ParseLogLevel(
        std::string_view text);

    [[nodiscard]] static Result<size_t, ProtocolFailure> ParseChunkSize(std::string_view text);

    // =========================================================================
    // Accessors
    // =========================================================================

    [[nodiscard]] size_t ChunkSize() const noexcept { return chunk_size_; }
    [[nodiscard]] const std::string& AppId() const noexcept { return app_id_; }
    [[nodiscard]] spdlog::level::level_enum LogLevel() const noexcept { return log_level_; }

private:
    PeerConfig(size_t chunk_size, std::string app_id, spdlog::level::level_enum log_level)
        : chunk_size_(chunk_size), app_id_(std::move(app_id)), log_level_(log_level) {}

    size_t chunk_size_;
    std::string app_id_;
    spdlog::level::level_enum log_level_;
};

}
