#include "peerdrop/signaling/signaling_codec.hpp"
#include "peerdrop/serialization/json_codec.hpp"
#include "peerdrop/core/constants.hpp"
#include "peerdrop/core/format.hpp"
namespace peerdrop::protocol::signaling {
using proto::signaling::SignalingMessage;

std::string_view ToWireType(const MessageType type) noexcept {
    switch (type) {
        case MessageType::Offer: return kMessageTypeOffer;
        case MessageType::Answer: return kMessageTypeAnswer;
        case MessageType::Candidate: return kMessageTypeCandidate;
    }
    return kMessageTypeCandidate;
}

Result<MessageType, ProtocolFailure> ParseMessageType(std::string_view wire_type) {
    if (wire_type == kMessageTypeOffer) {
        return Result<MessageType, ProtocolFailure>::Ok(MessageType::Offer);
    }
    if (wire_type == kMessageTypeAnswer) {
        return Result<MessageType, ProtocolFailure>::Ok(MessageType::Answer);
    }
    if (wire_type == kMessageTypeCandidate) {
        return Result<MessageType, ProtocolFailure>::Ok(MessageType::Candidate);
    }
    return Result<MessageType, ProtocolFailure>::Err(
        ProtocolFailure::SignalingParse(
            compat::format("Unknown signaling message type '{}'", wire_type)));
}

namespace {
    SignalingMessage MakeMessage(
        const MessageType type,
        const std::string& sender_id,
        const std::string& target_id,
        const std::string& payload) {
        SignalingMessage message;
        message.set_type(std::string(ToWireType(type)));
        message.set_sender_id(sender_id);
        message.set_target_id(target_id);
        message.set_payload(payload);
        return message;
    }
}

SignalingMessage SignalingCodec::MakeOffer(
    const std::string& sender_id,
    const std::string& target_id,
    const std::string& description,
    const proto::crypto::PublicKeyJwk& public_key) {
    SignalingMessage message = MakeMessage(MessageType::Offer, sender_id, target_id, description);
    *message.mutable_public_key() = public_key;
    return message;
}

SignalingMessage SignalingCodec::MakeAnswer(
    const std::string& sender_id,
    const std::string& target_id,
    const std::string& description,
    const proto::crypto::PublicKeyJwk& public_key) {
    SignalingMessage message = MakeMessage(MessageType::Answer, sender_id, target_id, description);
    *message.mutable_public_key() = public_key;
    return message;
}

SignalingMessage SignalingCodec::MakeCandidate(
    const std::string& sender_id,
    const std::string& target_id,
    const std::string& candidate) {
    return MakeMessage(MessageType::Candidate, sender_id, target_id, candidate);
}

Result<std::string, ProtocolFailure> SignalingCodec::Encode(const SignalingMessage& message) {
    return serialization::ToJson(message);
}

Result<DecodedMessage, ProtocolFailure> SignalingCodec::Decode(std::string_view document) {
    SignalingMessage message;
    auto parsed = serialization::FromJson(document, message);
    if (parsed.IsErr()) {
        return Result<DecodedMessage, ProtocolFailure>::Err(
            ProtocolFailure::SignalingParse(parsed.UnwrapErr().message));
    }
    auto type = ParseMessageType(message.type());
    PEERDROP_TRY(type);
    if (message.sender_id().empty()) {
        return Result<DecodedMessage, ProtocolFailure>::Err(
            ProtocolFailure::SignalingParse("Signaling message has no senderId"));
    }
    if (type.Unwrap() != MessageType::Candidate) {
        if (message.payload().empty()) {
            return Result<DecodedMessage, ProtocolFailure>::Err(
                ProtocolFailure::SignalingParse(
                    compat::format("Signaling {} has no session description", message.type())));
        }
        if (!message.has_public_key()) {
            return Result<DecodedMessage, ProtocolFailure>::Err(
                ProtocolFailure::SignalingParse(
                    compat::format("Signaling {} has no publicKey", message.type())));
        }
    }
    return Result<DecodedMessage, ProtocolFailure>::Ok(DecodedMessage{type.Unwrap(), std::move(message)});
}

std::optional<std::string> SignalingCodec::PeekSenderId(std::string_view document) {
    proto::signaling::SignalingSender sender;
    if (serialization::FromJson(document, sender).IsErr() || sender.sender_id().empty()) {
        return std::nullopt;
    }
    return sender.sender_id();
}

}
