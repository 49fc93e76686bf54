#pragma once
#include <string>
#include <string_view>
namespace peerdrop::protocol {
enum class SodiumFailureType {
    InitializationFailed,
    BufferTooSmall,
    BufferTooLarge,
    AllocationFailed,
    ComparisonFailed,
    EncodingFailed,
    InvalidOperation
};
enum class ProtocolFailureType {
    Generic,
    InvalidInput,
    InvalidState,
    KeyGeneration,
    DeriveKey,
    KeyFormat,
    CurveMismatch,
    SignalingParse,
    Encode,
    NoKeyEstablished,
    Decryption,
    VerificationMismatch,
    UnexpectedChunk,
    Transport
};
class SodiumFailure {
public:
    SodiumFailureType type;
    std::string message;
    SodiumFailure(const SodiumFailureType t, std::string msg)
        : type(t), message(std::move(msg)) {}
    static SodiumFailure InitializationFailed(std::string msg) {
        return {SodiumFailureType::InitializationFailed, std::move(msg)};
    }
    static SodiumFailure BufferTooSmall(std::string msg) {
        return {SodiumFailureType::BufferTooSmall, std::move(msg)};
    }
    static SodiumFailure BufferTooLarge(std::string msg) {
        return {SodiumFailureType::BufferTooLarge, std::move(msg)};
    }
    static SodiumFailure AllocationFailed(std::string msg) {
        return {SodiumFailureType::AllocationFailed, std::move(msg)};
    }
    static SodiumFailure ComparisonFailed(std::string msg) {
        return {SodiumFailureType::ComparisonFailed, std::move(msg)};
    }
    static SodiumFailure EncodingFailed(std::string msg) {
        return {SodiumFailureType::EncodingFailed, std::move(msg)};
    }
    static SodiumFailure InvalidOperation(std::string msg) {
        return {SodiumFailureType::InvalidOperation, std::move(msg)};
    }
};
class ProtocolFailure {
public:
    ProtocolFailureType type;
    std::string message;
    ProtocolFailure(const ProtocolFailureType t, std::string msg)
        : type(t), message(std::move(msg)) {}
    static ProtocolFailure Generic(std::string msg) {
        return {ProtocolFailureType::Generic, std::move(msg)};
    }
    static ProtocolFailure InvalidInput(std::string msg) {
        return {ProtocolFailureType::InvalidInput, std::move(msg)};
    }
    static ProtocolFailure InvalidState(std::string msg) {
        return {ProtocolFailureType::InvalidState, std::move(msg)};
    }
    static ProtocolFailure KeyGeneration(std::string msg) {
        return {ProtocolFailureType::KeyGeneration, std::move(msg)};
    }
    static ProtocolFailure DeriveKey(std::string msg) {
        return {ProtocolFailureType::DeriveKey, std::move(msg)};
    }
    /// Peer public key is malformed or not a point on the curve.
    static ProtocolFailure KeyFormat(std::string msg) {
        return {ProtocolFailureType::KeyFormat, std::move(msg)};
    }
    /// Peer public key is well formed but names a different curve.
    static ProtocolFailure CurveMismatch(std::string msg) {
        return {ProtocolFailureType::CurveMismatch, std::move(msg)};
    }
    static ProtocolFailure SignalingParse(std::string msg) {
        return {ProtocolFailureType::SignalingParse, std::move(msg)};
    }
    static ProtocolFailure Encode(std::string msg) {
        return {ProtocolFailureType::Encode, std::move(msg)};
    }
    static ProtocolFailure NoKeyEstablished(std::string msg) {
        return {ProtocolFailureType::NoKeyEstablished, std::move(msg)};
    }
    static ProtocolFailure Decryption(std::string msg) {
        return {ProtocolFailureType::Decryption, std::move(msg)};
    }
    static ProtocolFailure VerificationMismatch(std::string msg) {
        return {ProtocolFailureType::VerificationMismatch, std::move(msg)};
    }
    static ProtocolFailure UnexpectedChunk(std::string msg) {
        return {ProtocolFailureType::UnexpectedChunk, std::move(msg)};
    }
    static ProtocolFailure Transport(std::string msg) {
        return {ProtocolFailureType::Transport, std::move(msg)};
    }
    static ProtocolFailure FromSodiumFailure(const SodiumFailure& sf) {
        return Generic(sf.message);
    }
    [[nodiscard]] bool IsHandshakeFatal() const noexcept {
        return type == ProtocolFailureType::KeyFormat ||
               type == ProtocolFailureType::CurveMismatch ||
               type == ProtocolFailureType::DeriveKey ||
               type == ProtocolFailureType::KeyGeneration ||
               type == ProtocolFailureType::Transport;
    }
};

[[nodiscard]] constexpr std::string_view ToString(const ProtocolFailureType type) noexcept {
    switch (type) {
        case ProtocolFailureType::Generic: return "Generic";
        case ProtocolFailureType::InvalidInput: return "InvalidInput";
        case ProtocolFailureType::InvalidState: return "InvalidState";
        case ProtocolFailureType::KeyGeneration: return "KeyGeneration";
        case ProtocolFailureType::DeriveKey: return "DeriveKey";
        case ProtocolFailureType::KeyFormat: return "KeyFormat";
        case ProtocolFailureType::CurveMismatch: return "CurveMismatch";
        case ProtocolFailureType::SignalingParse: return "SignalingParse";
        case ProtocolFailureType::Encode: return "Encode";
        case ProtocolFailureType::NoKeyEstablished: return "NoKeyEstablished";
        case ProtocolFailureType::Decryption: return "Decryption";
        case ProtocolFailureType::VerificationMismatch: return "VerificationMismatch";
        case ProtocolFailureType::UnexpectedChunk: return "UnexpectedChunk";
        case ProtocolFailureType::Transport: return "Transport";
    }
    return "Unknown";
}
}
