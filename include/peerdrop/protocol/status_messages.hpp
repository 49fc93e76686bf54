#pragma once
#include <string_view>
namespace peerdrop::protocol {
struct StatusMessages {
    static constexpr std::string_view INVALID_PEER_ID = "Please enter a valid Peer ID first.";
    static constexpr std::string_view SELF_CONNECT = "You cannot connect to your own Peer ID.";
    static constexpr std::string_view CREATING_OFFER = "Creating connection offer...";
    static constexpr std::string_view OFFER_SENT = "Offer sent. Waiting for peer to accept...";
    static constexpr std::string_view CONNECT_FAILED = "Failed to connect to peer. Check the ID and try again.";
    static constexpr std::string_view OFFER_ACCEPTED = "Received offer, created answer and derived shared key.";
    static constexpr std::string_view ANSWER_ACCEPTED = "Received answer, connection established and shared key derived.";
    static constexpr std::string_view SIGNALING_FAILED = "Failed to process signaling message. See console.";
    static constexpr std::string_view CONNECTED = "Connection established. You can now send or receive files.";
    static constexpr std::string_view PEER_DISCONNECTED = "Peer disconnected. Click \"Connect\" to re-establish.";
    static constexpr std::string_view DISCONNECTED = "Disconnected.";
    static constexpr std::string_view NOT_READY_TO_SEND = "Please select a file and ensure you are connected to a peer.";
    static constexpr std::string_view NO_KEY = "Error: Symmetric key not established.";
    static constexpr std::string_view SENDING = "Encrypting and sending file...";
    static constexpr std::string_view SEND_COMPLETE = "File sent successfully!";
    static constexpr std::string_view SEND_FAILED = "Error during file transfer. Check connection and try again.";
    static constexpr std::string_view RECEIVE_VERIFIED = "File received and verified successfully!";
    static constexpr std::string_view RECEIVE_MISMATCH = "File transfer complete, but verification failed.";
    static constexpr std::string_view RECEIVE_DECRYPT_FAILED = "Error decrypting file. Transfer failed.";
};
}
