#pragma once
#include "peerdrop/core/result.hpp"
#include "peerdrop/core/failures.hpp"
#include "signaling/signaling.pb.h"
#include <optional>
#include <string>
#include <string_view>
namespace peerdrop::protocol::signaling {

enum class MessageType {
    Offer,
    Answer,
    Candidate
};

[[nodiscard]] std::string_view ToWireType(MessageType type) noexcept;

[[nodiscard]] Result<MessageType, ProtocolFailure> ParseMessageType(std::string_view wire_type);

/// A signaling document that passed shape validation.
struct DecodedMessage {
    MessageType type;
    proto::signaling::SignalingMessage message;
};

/**
 * JSON form of mailbox entries:
 * {"type":"offer"|"answer"|"candidate","senderId","targetId"?,"payload","publicKey"?}
 */
class SignalingCodec {
public:
    [[nodiscard]] static proto::signaling::SignalingMessage MakeOffer(
        const std::string& sender_id,
        const std::string& target_id,
        const std::string& description,
        const proto::crypto::PublicKeyJwk& public_key);

    [[nodiscard]] static proto::signaling::SignalingMessage MakeAnswer(
        const std::string& sender_id,
        const std::string& target_id,
        const std::string& description,
        const proto::crypto::PublicKeyJwk& public_key);

    [[nodiscard]] static proto::signaling::SignalingMessage MakeCandidate(
        const std::string& sender_id,
        const std::string& target_id,
        const std::string& candidate);

    [[nodiscard]] static Result<std::string, ProtocolFailure> Encode(
        const proto::signaling::SignalingMessage& message);

    /// SignalingParse when the text is not JSON, the type is unknown, the
    /// sender is missing, or an offer/answer lacks its description or key.
    [[nodiscard]] static Result<DecodedMessage, ProtocolFailure> Decode(std::string_view document);

    /// senderId of a document that is JSON, whatever its other fields hold.
    [[nodiscard]] static std::optional<std::string> PeekSenderId(std::string_view document);

private:
    SignalingCodec() = delete;
};
}
