#include "peerdrop/configuration/peer_config.hpp"
#include "peerdrop/core/format.hpp"

#include <charconv>
#include <cstdlib>
#include <optional>

namespace peerdrop::protocol::configuration {

namespace {
    std::optional<std::string> ReadEnvironment(std::string_view name) {
        const char* value = std::getenv(std::string(name).c_str());
        if (value == nullptr || *value == '\0') {
            return std::nullopt;
        }
        return std::string(value);
    }
}

Result<PeerConfig, ProtocolFailure> PeerConfig::Create(
    const size_t chunk_size,
    std::string app_id,
    const spdlog::level::level_enum log_level) {
    if (chunk_size < kMinChunkSize || chunk_size > kMaxChunkSize) {
        return Result<PeerConfig, ProtocolFailure>::Err(
            ProtocolFailure::InvalidInput(
                compat::format("Chunk size {} outside [{}, {}]", chunk_size, kMinChunkSize, kMaxChunkSize)));
    }
    if (app_id.empty()) {
        return Result<PeerConfig, ProtocolFailure>::Err(
            ProtocolFailure::InvalidInput("Application id must not be empty"));
    }
    return Result<PeerConfig, ProtocolFailure>::Ok(PeerConfig(chunk_size, std::move(app_id), log_level));
}

Result<spdlog::level::level_enum, ProtocolFailure> PeerConfig::ParseLogLevel(std::string_view text) {
    const std::string name(text);
    const auto level = spdlog::level::from_str(name);
    // from_str maps unknown names to off, so only accept off when asked for it.
    if (level == spdlog::level::off && name != "off") {
        return Result<spdlog::level::level_enum, ProtocolFailure>::Err(
            ProtocolFailure::InvalidInput(compat::format("Unknown log level '{}'", name)));
    }
    return Result<spdlog::level::level_enum, ProtocolFailure>::Ok(level);
}

Result<size_t, ProtocolFailure> PeerConfig::ParseChunkSize(std::string_view text) {
    size_t value = 0;
    const auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
    if (ec != std::errc() || ptr != text.data() + text.size()) {
        return Result<size_t, ProtocolFailure>::Err(
            ProtocolFailure::InvalidInput(compat::format("Chunk size '{}' is not a number", text)));
    }
    return Result<size_t, ProtocolFailure>::Ok(value);
}

Result<PeerConfig, ProtocolFailure> PeerConfig::FromEnvironment() {
    PeerConfig defaults = Default();
    size_t chunk_size = defaults.chunk_size_;
    std::string app_id = defaults.app_id_;
    spdlog::level::level_enum level = defaults.log_level_;

    if (auto value = ReadEnvironment(kEnvChunkSize)) {
        auto parsed = ParseChunkSize(*value);
        PEERDROP_TRY(parsed);
        chunk_size = parsed.Unwrap();
    }
    if (auto value = ReadEnvironment(kEnvLogLevel)) {
        auto parsed = ParseLogLevel(*value);
        PEERDROP_TRY(parsed);
        level = parsed.Unwrap();
    }
    if (auto value = ReadEnvironment(kEnvAppId)) {
        app_id = std::move(*value);
    }
    return Create(chunk_size, std::move(app_id), level);
}

}
