#pragma once
#include "peerdrop/core/result.hpp"
#include "peerdrop/core/failures.hpp"
#include "peerdrop/core/subscription.hpp"
#include "peerdrop/configuration/peer_config.hpp"
#include "peerdrop/interfaces/i_session_event_handler.hpp"
#include "peerdrop/interfaces/i_signaling_channel.hpp"
#include "peerdrop/interfaces/i_transfer_history.hpp"
#include "peerdrop/interfaces/i_transport.hpp"
#include "peerdrop/protocol/session_state.hpp"
#include "peerdrop/signaling/signaling_codec.hpp"
#include "peerdrop/transfer/byte_sources.hpp"
#include "peerdrop/transfer/file_receiver.hpp"
#include "peerdrop/transfer/file_sender.hpp"
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <thread>
#include <variant>
#include <vector>
namespace peerdrop::protocol {

/**
 * One endpoint of a peer-to-peer file transfer.
 *
 * Drives the offer/answer/candidate exchange over the signaling mailbox,
 * derives the shared key, binds the negotiated transport and runs both
 * halves of the chunked transfer.
 *
 * Mailbox entries and transport events are queued and handled one at a time
 * by whichever thread holds the dispatch token. Commands (Connect, SendFile,
 * Disconnect) take the same token, so they never interleave with event
 * handling. Deliveries that arrive on the token holder's own thread, such as
 * a synchronous relay echoing during a publish, are queued and handled after
 * the current step.
 */
class PeerSession : public std::enable_shared_from_this<PeerSession> {
public:
    struct Dependencies {
        std::shared_ptr<interfaces::ISignalingChannel> signaling;
        std::shared_ptr<interfaces::ITransportFactory> transports;
        std::shared_ptr<interfaces::ITransferHistory> history;
        std::shared_ptr<interfaces::ISessionEventHandler> event_handler;
    };

    [[nodiscard]] static Result<std::shared_ptr<PeerSession>, ProtocolFailure> Create(
        std::string_view local_id,
        Dependencies dependencies,
        configuration::PeerConfig config);

    ~PeerSession();

    PeerSession(const PeerSession&) = delete;
    PeerSession& operator=(const PeerSession&) = delete;

    /// Subscribes to the local mailbox. Entries already waiting are handled.
    Result<Unit, ProtocolFailure> Start();

    /// Unsubscribes and disconnects.
    void Stop();

    Result<Unit, ProtocolFailure> Connect(std::string_view peer_id);

    Result<transfer::SendSummary, ProtocolFailure> SendFile(transfer::OutgoingFile& file);

    /// Closes the transport, which also aborts any transfer in flight.
    void Disconnect();

    [[nodiscard]] const std::string& LocalId() const noexcept { return local_id_; }
    [[nodiscard]] ConnectionStatus Status();
    [[nodiscard]] SessionRole Role();
    [[nodiscard]] std::string RemotePeerId();
    [[nodiscard]] bool HasSharedKey();
    [[nodiscard]] double TransferProgress();
    [[nodiscard]] std::string LastStatusMessage();
    [[nodiscard]] std::optional<transfer::ReceivedFile> TakeReceivedFile();

    /// Fingerprint of the installed key, or nullopt when none is installed.
    [[nodiscard]] std::optional<std::string> SharedKeyFingerprint();
    /// Constant-time comparison of the installed key with `key`.
    [[nodiscard]] bool SharedKeyMatches(const crypto::SymmetricKey& key);

private:
    struct MailboxEvent {
        std::vector<interfaces::MailboxEntry> entries;
    };
    enum class TransportEventKind {
        LocalCandidate,
        Open,
        Close,
        Error,
        Text,
        Binary
    };
    struct TransportEvent {
        uint64_t epoch;
        TransportEventKind kind;
        std::string text;
        std::vector<uint8_t> data;
    };
    using SessionEvent = std::variant<MailboxEvent, TransportEvent>;

    class TransportBridge;
    friend class TransportBridge;

    PeerSession(
        std::string local_id,
        Dependencies dependencies,
        configuration::PeerConfig config);

    // Dispatch token
    void Post(SessionEvent event);
    void DrainAndRelease();
    void ReleaseToken();
    [[nodiscard]] bool HoldsToken();
    template<typename F>
    auto RunExclusive(F&& func) -> decltype(func());

    void Dispatch(SessionEvent& event);
    template<typename F>
    void Guarded(std::string_view what, F&& func);
    template<typename F>
    void NotifyHandler(std::string_view callback, F&& func);
    void HandleMailboxEntry(const interfaces::MailboxEntry& entry);
    Result<Unit, ProtocolFailure> HandleOffer(const proto::signaling::SignalingMessage& message);
    Result<Unit, ProtocolFailure> HandleAnswer(const proto::signaling::SignalingMessage& message);
    Result<Unit, ProtocolFailure> HandleCandidate(const proto::signaling::SignalingMessage& message);
    void HandleTransportEvent(TransportEvent& event);
    void HandleIncomingText(const std::string& text);
    void HandleIncomingBinary(const std::vector<uint8_t>& data);
    void PublishLocalCandidate(const std::string& candidate);

    Result<std::unique_ptr<interfaces::ITransport>, ProtocolFailure> Negotiate(
        interfaces::TransportRole role,
        uint64_t epoch,
        std::shared_ptr<interfaces::ITransportObserver>& bridge_out);
    void AbortHandshake(const ProtocolFailure& failure);
    void Teardown();
    void SetStatus(ConnectionStatus status);
    void ReportStatus(std::string_view message);
    void ReportProgress(double percent);
    void ReportTransferFailure(const ProtocolFailure& failure);
    void ReportFileReceived();

    const std::string local_id_;
    Dependencies deps_;
    configuration::PeerConfig config_;

    std::mutex dispatch_mutex_;
    std::condition_variable dispatch_cv_;
    std::deque<SessionEvent> queue_;
    bool busy_ = false;
    std::thread::id owner_;

    SessionState state_;
    std::shared_ptr<interfaces::ITransportObserver> bridge_;
    uint64_t next_epoch_ = 1;
    transfer::FileReceiver receiver_;
    Subscription mailbox_subscription_;
    double progress_ = 0.0;
    std::string last_status_message_;
};
}
