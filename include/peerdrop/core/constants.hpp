#pragma once
#include <cstddef>
#include <cstdint>
#include <string_view>
namespace peerdrop::protocol {
struct Constants {
    static constexpr size_t AES_KEY_SIZE = 32;
    static constexpr size_t AES_GCM_NONCE_SIZE = 12;
    static constexpr size_t AES_GCM_TAG_SIZE = 16;
    static constexpr size_t P256_COORDINATE_SIZE = 32;
    static constexpr size_t P256_UNCOMPRESSED_POINT_SIZE = 1 + 2 * P256_COORDINATE_SIZE;
    static constexpr uint8_t P256_UNCOMPRESSED_POINT_TAG = 0x04;
    static constexpr size_t P256_SHARED_SECRET_SIZE = 32;
    static constexpr size_t SHA256_DIGEST_SIZE = 32;
    static constexpr size_t SMALL_BUFFER_THRESHOLD = 1024;
    static constexpr size_t OPENSSL_ERROR_BUFFER_SIZE = 256;
};
struct OpenSSLConstants {
    static constexpr int SUCCESS = 1;
    static constexpr unsigned long NO_ERROR = 0;
    static constexpr std::string_view ALGORITHM_EC = "EC";
    static constexpr std::string_view CURVE_P256 = "P-256";
    static constexpr std::string_view GROUP_PRIME256V1 = "prime256v1";
    static constexpr std::string_view UNKNOWN_ERROR_MESSAGE = "Unknown OpenSSL error";
};
struct SodiumConstants {
    static constexpr int SUCCESS = 0;
    static constexpr int FAILURE = -1;
};
struct ErrorMessages {
    static constexpr std::string_view SODIUM_INIT_FAILED = "Failed to initialize libsodium";
    static constexpr std::string_view NOT_INITIALIZED = "Libsodium not initialized";
    static constexpr std::string_view HANDLE_DISPOSED = "Handle disposed";
    static constexpr std::string_view FAILED_TO_ALLOCATE_SECURE_MEMORY = "Failed to allocate secure memory: ";
    static constexpr std::string_view DATA_EXCEEDS_BUFFER = "Data size exceeds buffer size";
    static constexpr std::string_view AES_GCM_AUTHENTICATION_FAILED =
        "Authentication tag verification failed - data may have been tampered with";
    static constexpr std::string_view NO_SYMMETRIC_KEY = "Symmetric key not established.";
};

inline constexpr size_t kDefaultChunkSize = 16384;
inline constexpr size_t kMinChunkSize = 1024;
inline constexpr size_t kMaxChunkSize = 262144;
inline constexpr size_t kPeerIdLength = 6;
inline constexpr std::string_view kPeerIdAlphabet = "0123456789abcdefghijklmnopqrstuvwxyz";
inline constexpr std::string_view kDefaultAppId = "default-app-id";
inline constexpr std::string_view kLoggerName = "peerdrop";

inline constexpr std::string_view kMessageTypeOffer = "offer";
inline constexpr std::string_view kMessageTypeAnswer = "answer";
inline constexpr std::string_view kMessageTypeCandidate = "candidate";
inline constexpr std::string_view kFileMetadataType = "fileMetadata";
inline constexpr uint64_t kMaxAnnouncedFileSize = 1ULL << 53;
inline constexpr std::string_view kDefaultMimeType = "application/octet-stream";

inline constexpr std::string_view kEnvAppId = "PEERDROP_APP_ID";
inline constexpr std::string_view kEnvLogLevel = "PEERDROP_LOG_LEVEL";
inline constexpr std::string_view kEnvChunkSize = "PEERDROP_CHUNK_SIZE";
}
