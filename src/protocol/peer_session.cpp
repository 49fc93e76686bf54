#include "peerdrop/protocol/peer_session.hpp"
#include "peerdrop/protocol/key_agreement.hpp"
#include "peerdrop/protocol/status_messages.hpp"
#include "peerdrop/crypto/sodium_interop.hpp"
#include "peerdrop/identity/peer_identity.hpp"
#include "peerdrop/logging/logger.hpp"
#include "peerdrop/core/constants.hpp"
#include "peerdrop/core/format.hpp"
#include <exception>
namespace peerdrop::protocol {
using interfaces::MailboxEntry;
using interfaces::TransportRole;
using proto::signaling::SignalingMessage;
using signaling::MessageType;
using signaling::SignalingCodec;

// ============================================================================
// Transport bridge
// ============================================================================

class PeerSession::TransportBridge final : public interfaces::ITransportObserver {
public:
    TransportBridge(std::weak_ptr<PeerSession> session, const uint64_t epoch)
        : session_(std::move(session)), epoch_(epoch) {}

    void OnLocalCandidate(const std::string& candidate) override {
        Forward(TransportEventKind::LocalCandidate, candidate, {});
    }
    void OnOpen() override { Forward(TransportEventKind::Open, {}, {}); }
    void OnClose() override { Forward(TransportEventKind::Close, {}, {}); }
    void OnError(const std::string& reason) override {
        Forward(TransportEventKind::Error, reason, {});
    }
    void OnTextMessage(const std::string& text) override {
        Forward(TransportEventKind::Text, text, {});
    }
    void OnBinaryMessage(std::vector<uint8_t> data) override {
        Forward(TransportEventKind::Binary, {}, std::move(data));
    }

private:
    void Forward(const TransportEventKind kind, std::string text, std::vector<uint8_t> data) {
        if (auto session = session_.lock()) {
            session->Post(TransportEvent{epoch_, kind, std::move(text), std::move(data)});
        }
    }

    std::weak_ptr<PeerSession> session_;
    uint64_t epoch_;
};

// ============================================================================
// Construction
// ============================================================================

PeerSession::PeerSession(
    std::string local_id,
    Dependencies dependencies,
    configuration::PeerConfig config)
    : local_id_(std::move(local_id))
    , deps_(std::move(dependencies))
    , config_(std::move(config)) {}

Result<std::shared_ptr<PeerSession>, ProtocolFailure> PeerSession::Create(
    std::string_view local_id,
    Dependencies dependencies,
    configuration::PeerConfig config) {
    auto init = crypto::SodiumInterop::Initialize()
        .MapErr([](const SodiumFailure& f) { return ProtocolFailure::FromSodiumFailure(f); });
    PEERDROP_TRY(init);
    auto id = identity::NormalizePeerId(local_id);
    PEERDROP_TRY(id);
    if (!dependencies.signaling || !dependencies.transports) {
        return Result<std::shared_ptr<PeerSession>, ProtocolFailure>::Err(
            ProtocolFailure::InvalidInput("A session needs a signaling channel and a transport factory"));
    }
    logging::SetLevel(config.LogLevel());
    return Result<std::shared_ptr<PeerSession>, ProtocolFailure>::Ok(
        std::shared_ptr<PeerSession>(new PeerSession(
            std::move(id).Unwrap(), std::move(dependencies), std::move(config))));
}

PeerSession::~PeerSession() {
    mailbox_subscription_.Cancel();
    auto transport = std::move(state_.transport);
    state_.Reset();
    if (transport) {
        transport->Close();
    }
}

// ============================================================================
// Dispatch token
// ============================================================================

bool PeerSession::HoldsToken() {
    std::lock_guard lock(dispatch_mutex_);
    return busy_ && owner_ == std::this_thread::get_id();
}

template<typename F>
auto PeerSession::RunExclusive(F&& func) -> decltype(func()) {
    if (HoldsToken()) {
        return func();
    }
    {
        std::unique_lock lock(dispatch_mutex_);
        dispatch_cv_.wait(lock, [this]() { return !busy_; });
        busy_ = true;
        owner_ = std::this_thread::get_id();
    }
    struct Release {
        PeerSession* session;
        ~Release() { session->DrainAndRelease(); }
    } release{this};
    return func();
}

void PeerSession::Post(SessionEvent event) {
    {
        std::lock_guard lock(dispatch_mutex_);
        queue_.push_back(std::move(event));
        if (busy_) {
            return;
        }
        busy_ = true;
        owner_ = std::this_thread::get_id();
    }
    DrainAndRelease();
}

void PeerSession::DrainAndRelease() {
    struct ReleaseOnThrow {
        PeerSession* session;
        bool armed = true;
        ~ReleaseOnThrow() {
            if (armed) {
                session->ReleaseToken();
            }
        }
    } guard{this};
    for (;;) {
        std::optional<SessionEvent> next;
        {
            std::lock_guard lock(dispatch_mutex_);
            if (queue_.empty()) {
                guard.armed = false;
                busy_ = false;
                owner_ = std::thread::id();
                dispatch_cv_.notify_all();
                return;
            }
            next.emplace(std::move(queue_.front()));
            queue_.pop_front();
        }
        Dispatch(*next);
    }
}

void PeerSession::ReleaseToken() {
    std::lock_guard lock(dispatch_mutex_);
    busy_ = false;
    owner_ = std::thread::id();
    dispatch_cv_.notify_all();
}

// One failing entry or event never stops the ones queued behind it.
template<typename F>
void PeerSession::Guarded(const std::string_view what, F&& func) {
    try {
        std::forward<F>(func)();
    } catch (const std::exception& ex) {
        logging::GetLogger()->error("[{}] {} handling failed: {}", local_id_, what, ex.what());
        last_status_message_ = std::string(StatusMessages::SIGNALING_FAILED);
    }
}

template<typename F>
void PeerSession::NotifyHandler(const std::string_view callback, F&& func) {
    if (!deps_.event_handler) {
        return;
    }
    try {
        std::forward<F>(func)(*deps_.event_handler);
    } catch (const std::exception& ex) {
        logging::GetLogger()->error("[{}] event handler {} threw: {}", local_id_, callback, ex.what());
    }
}

void PeerSession::Dispatch(SessionEvent& event) {
    if (auto* mailbox = std::get_if<MailboxEvent>(&event)) {
        for (const auto& entry : mailbox->entries) {
            Guarded("signaling entry", [this, &entry]() { HandleMailboxEntry(entry); });
        }
    } else {
        Guarded("transport event", [this, &event]() {
            HandleTransportEvent(std::get<TransportEvent>(event));
        });
    }
}

// ============================================================================
// Commands
// ============================================================================

Result<Unit, ProtocolFailure> PeerSession::Start() {
    return RunExclusive([this]() -> Result<Unit, ProtocolFailure> {
        if (mailbox_subscription_.IsActive()) {
            return Result<Unit, ProtocolFailure>::Ok(unit);
        }
        std::weak_ptr<PeerSession> weak_self = weak_from_this();
        auto subscription = deps_.signaling->Subscribe(local_id_,
            [weak_self](const std::vector<MailboxEntry>& entries) {
                if (auto self = weak_self.lock()) {
                    self->Post(MailboxEvent{entries});
                }
            });
        PEERDROP_TRY(subscription);
        mailbox_subscription_ = std::move(subscription).Unwrap();
        logging::GetLogger()->info("[{}] listening for signaling messages", local_id_);
        return Result<Unit, ProtocolFailure>::Ok(unit);
    });
}

void PeerSession::Stop() {
    RunExclusive([this]() {
        mailbox_subscription_.Cancel();
        Teardown();
    });
}

Result<Unit, ProtocolFailure> PeerSession::Connect(std::string_view peer_id) {
    return RunExclusive([this, peer_id]() -> Result<Unit, ProtocolFailure> {
        auto normalized = identity::NormalizePeerId(peer_id);
        if (normalized.IsErr()) {
            ReportStatus(StatusMessages::INVALID_PEER_ID);
            return std::move(normalized).PropagateErr();
        }
        const std::string remote_id = std::move(normalized).Unwrap();
        if (remote_id == local_id_) {
            ReportStatus(StatusMessages::SELF_CONNECT);
            return Result<Unit, ProtocolFailure>::Err(
                ProtocolFailure::InvalidInput(std::string(StatusMessages::SELF_CONNECT)));
        }
        if (state_.status != ConnectionStatus::Disconnected || state_.HasNegotiation()) {
            return Result<Unit, ProtocolFailure>::Err(
                ProtocolFailure::InvalidState(
                    compat::format("Cannot connect while {}", ToString(state_.status))));
        }
        ReportStatus(StatusMessages::CREATING_OFFER);

        auto fail = [this](ProtocolFailure failure) {
            logging::GetLogger()->warn("[{}] connect failed: {}", local_id_, failure.message);
            ReportStatus(StatusMessages::CONNECT_FAILED);
            return Result<Unit, ProtocolFailure>::Err(std::move(failure));
        };

        auto keypair = KeyAgreement::GenerateKeypair(debug::Side::Caller);
        if (keypair.IsErr()) {
            return fail(std::move(keypair).UnwrapErr());
        }
        const uint64_t epoch = next_epoch_++;
        std::shared_ptr<interfaces::ITransportObserver> bridge;
        auto transport = Negotiate(TransportRole::Caller, epoch, bridge);
        if (transport.IsErr()) {
            return fail(std::move(transport).UnwrapErr());
        }
        auto offer = transport.Unwrap()->CreateOffer();
        if (offer.IsErr()) {
            transport.Unwrap()->Close();
            return fail(std::move(offer).UnwrapErr());
        }
        const auto public_key = KeyAgreement::ExportPublicKey(keypair.Unwrap());

        state_.role = SessionRole::Caller;
        state_.local_keypair.emplace(std::move(keypair).Unwrap());
        state_.transport = std::move(transport).Unwrap();
        state_.transport_epoch = epoch;
        state_.remote_peer_id = remote_id;
        bridge_ = std::move(bridge);
        SetStatus(ConnectionStatus::Connecting);

        auto sent = deps_.signaling->Send(remote_id,
            SignalingCodec::MakeOffer(local_id_, remote_id, offer.Unwrap(), public_key));
        if (sent.IsErr()) {
            Teardown();
            return fail(std::move(sent).UnwrapErr());
        }
        logging::GetLogger()->info("[{}] offer {} sent to {}", local_id_, sent.Unwrap(), remote_id);
        ReportStatus(StatusMessages::OFFER_SENT);
        return Result<Unit, ProtocolFailure>::Ok(unit);
    });
}

Result<transfer::SendSummary, ProtocolFailure> PeerSession::SendFile(transfer::OutgoingFile& file) {
    return RunExclusive([this, &file]() -> Result<transfer::SendSummary, ProtocolFailure> {
        if (state_.status != ConnectionStatus::Connected || !state_.transport ||
            !state_.transport->IsOpen() || !file.source) {
            ReportStatus(StatusMessages::NOT_READY_TO_SEND);
            return Result<transfer::SendSummary, ProtocolFailure>::Err(
                ProtocolFailure::InvalidState(std::string(StatusMessages::NOT_READY_TO_SEND)));
        }
        if (!state_.shared_key) {
            ReportStatus(StatusMessages::NO_KEY);
            return Result<transfer::SendSummary, ProtocolFailure>::Err(
                ProtocolFailure::NoKeyEstablished(std::string(ErrorMessages::NO_SYMMETRIC_KEY)));
        }
        ReportStatus(StatusMessages::SENDING);
        ReportProgress(0.0);
        const transfer::FileSender sender(config_.ChunkSize(), deps_.history.get());
        auto summary = sender.Send(
            file, *state_.shared_key, *state_.transport,
            local_id_, state_.remote_peer_id,
            [this](const double percent) { ReportProgress(percent); });
        if (summary.IsErr()) {
            logging::GetLogger()->error("[{}] sending '{}' failed: {}",
                local_id_, file.name, summary.UnwrapErr().message);
            ReportStatus(StatusMessages::SEND_FAILED);
            ReportTransferFailure(summary.UnwrapErr());
            return summary;
        }
        ReportStatus(StatusMessages::SEND_COMPLETE);
        return summary;
    });
}

void PeerSession::Disconnect() {
    RunExclusive([this]() {
        if (!state_.HasNegotiation() && state_.status == ConnectionStatus::Disconnected) {
            return;
        }
        Teardown();
        ReportStatus(StatusMessages::DISCONNECTED);
    });
}

// ============================================================================
// Queries
// ============================================================================

ConnectionStatus PeerSession::Status() {
    return RunExclusive([this]() { return state_.status; });
}

SessionRole PeerSession::Role() {
    return RunExclusive([this]() { return state_.role; });
}

std::string PeerSession::RemotePeerId() {
    return RunExclusive([this]() { return state_.remote_peer_id; });
}

bool PeerSession::HasSharedKey() {
    return RunExclusive([this]() { return state_.shared_key.has_value(); });
}

double PeerSession::TransferProgress() {
    return RunExclusive([this]() { return progress_; });
}

std::string PeerSession::LastStatusMessage() {
    return RunExclusive([this]() { return last_status_message_; });
}

std::optional<transfer::ReceivedFile> PeerSession::TakeReceivedFile() {
    return RunExclusive([this]() { return receiver_.TakeReceivedFile(); });
}

std::optional<std::string> PeerSession::SharedKeyFingerprint() {
    return RunExclusive([this]() -> std::optional<std::string> {
        if (!state_.shared_key) {
            return std::nullopt;
        }
        auto fingerprint = state_.shared_key->Fingerprint();
        if (fingerprint.IsErr()) {
            logging::GetLogger()->warn("[{}] cannot fingerprint shared key: {}",
                local_id_, fingerprint.UnwrapErr().message);
            return std::nullopt;
        }
        return std::move(fingerprint).Unwrap();
    });
}

bool PeerSession::SharedKeyMatches(const crypto::SymmetricKey& key) {
    return RunExclusive([this, &key]() {
        return state_.shared_key && state_.shared_key->Matches(key);
    });
}

// ============================================================================
// Signaling
// ============================================================================

void PeerSession::HandleMailboxEntry(const MailboxEntry& entry) {
    auto logger = logging::GetLogger();
    struct DeleteAfterRead {
        PeerSession* session;
        const MailboxEntry& entry;
        ~DeleteAfterRead() {
            try {
                auto deleted = session->deps_.signaling->DeleteMessage(session->local_id_, entry.id);
                if (deleted.IsErr()) {
                    logging::GetLogger()->warn("[{}] could not delete signaling entry {}: {}",
                        session->local_id_, entry.id, deleted.UnwrapErr().message);
                }
            } catch (const std::exception& ex) {
                logging::GetLogger()->error("[{}] deleting signaling entry {} threw: {}",
                    session->local_id_, entry.id, ex.what());
            }
        }
    } delete_after_read{this, entry};

    if (SignalingCodec::PeekSenderId(entry.document) == local_id_) {
        logger->debug("[{}] dropping self-authored entry {}", local_id_, entry.id);
        return;
    }
    auto decoded = SignalingCodec::Decode(entry.document);
    if (decoded.IsErr()) {
        logger->warn("[{}] discarding signaling entry {}: {}",
            local_id_, entry.id, decoded.UnwrapErr().message);
        ReportStatus(StatusMessages::SIGNALING_FAILED);
        return;
    }
    const auto& [type, message] = decoded.Unwrap();
    Result<Unit, ProtocolFailure> outcome = Result<Unit, ProtocolFailure>::Ok(unit);
    switch (type) {
        case MessageType::Offer:
            outcome = HandleOffer(message);
            break;
        case MessageType::Answer:
            outcome = HandleAnswer(message);
            break;
        case MessageType::Candidate:
            outcome = HandleCandidate(message);
            break;
    }
    if (outcome.IsErr()) {
        const auto& failure = outcome.UnwrapErr();
        logger->warn("[{}] {} from {} rejected ({}): {}",
            local_id_, message.type(), message.sender_id(), ToString(failure.type), failure.message);
        ReportStatus(StatusMessages::SIGNALING_FAILED);
    }
}

Result<Unit, ProtocolFailure> PeerSession::HandleOffer(const SignalingMessage& message) {
    if (message.has_target_id() && !message.target_id().empty() && message.target_id() != local_id_) {
        logging::GetLogger()->debug("[{}] ignoring offer addressed to {}", local_id_, message.target_id());
        return Result<Unit, ProtocolFailure>::Ok(unit);
    }
    if (state_.status != ConnectionStatus::Disconnected || state_.HasNegotiation()) {
        return Result<Unit, ProtocolFailure>::Err(
            ProtocolFailure::InvalidState(
                compat::format("Offer from {} while {} with {}",
                    message.sender_id(), ToString(state_.status), state_.remote_peer_id)));
    }
    auto keypair = KeyAgreement::GenerateKeypair(debug::Side::Answerer);
    PEERDROP_TRY(keypair);
    auto remote_key = KeyAgreement::ImportPublicKey(message.public_key());
    PEERDROP_TRY(remote_key);
    auto shared_key = KeyAgreement::DeriveSharedKey(
        keypair.Unwrap(), remote_key.Unwrap(), debug::Side::Answerer);
    PEERDROP_TRY(shared_key);

    const uint64_t epoch = next_epoch_++;
    std::shared_ptr<interfaces::ITransportObserver> bridge;
    auto transport = Negotiate(TransportRole::Answerer, epoch, bridge);
    PEERDROP_TRY(transport);
    auto& negotiation = *transport.Unwrap();
    auto applied = negotiation.SetRemoteDescription(message.payload());
    if (applied.IsErr()) {
        negotiation.Close();
        return std::move(applied).PropagateErr();
    }
    auto answer = negotiation.CreateAnswer();
    if (answer.IsErr()) {
        negotiation.Close();
        return std::move(answer).PropagateErr();
    }
    auto sent = deps_.signaling->Send(message.sender_id(),
        SignalingCodec::MakeAnswer(local_id_, message.sender_id(), answer.Unwrap(),
            KeyAgreement::ExportPublicKey(keypair.Unwrap())));
    if (sent.IsErr()) {
        negotiation.Close();
        return std::move(sent).PropagateErr();
    }

    state_.role = SessionRole::Answerer;
    state_.local_keypair.emplace(std::move(keypair).Unwrap());
    state_.remote_public_key.emplace(std::move(remote_key).Unwrap());
    state_.shared_key.emplace(std::move(shared_key).Unwrap());
    state_.transport = std::move(transport).Unwrap();
    state_.transport_epoch = epoch;
    state_.remote_peer_id = message.sender_id();
    bridge_ = std::move(bridge);
    logging::GetLogger()->info("[{}] answered offer from {}", local_id_, message.sender_id());
    ReportStatus(StatusMessages::OFFER_ACCEPTED);
    return Result<Unit, ProtocolFailure>::Ok(unit);
}

Result<Unit, ProtocolFailure> PeerSession::HandleAnswer(const SignalingMessage& message) {
    if (message.target_id() != local_id_) {
        logging::GetLogger()->debug("[{}] ignoring answer addressed to '{}'", local_id_, message.target_id());
        return Result<Unit, ProtocolFailure>::Ok(unit);
    }
    if (state_.status != ConnectionStatus::Connecting || state_.role != SessionRole::Caller ||
        !state_.transport || !state_.local_keypair) {
        return Result<Unit, ProtocolFailure>::Err(
            ProtocolFailure::InvalidState(
                compat::format("Unexpected answer from {} while {}",
                    message.sender_id(), ToString(state_.status))));
    }
    if (message.sender_id() != state_.remote_peer_id) {
        return Result<Unit, ProtocolFailure>::Err(
            ProtocolFailure::InvalidState(
                compat::format("Answer from {} but offer went to {}",
                    message.sender_id(), state_.remote_peer_id)));
    }
    auto remote_key = KeyAgreement::ImportPublicKey(message.public_key());
    if (remote_key.IsErr()) {
        AbortHandshake(remote_key.UnwrapErr());
        return std::move(remote_key).PropagateErr();
    }
    auto shared_key = KeyAgreement::DeriveSharedKey(
        *state_.local_keypair, remote_key.Unwrap(), debug::Side::Caller);
    if (shared_key.IsErr()) {
        AbortHandshake(shared_key.UnwrapErr());
        return std::move(shared_key).PropagateErr();
    }
    state_.remote_public_key.emplace(std::move(remote_key).Unwrap());
    state_.shared_key.emplace(std::move(shared_key).Unwrap());
    auto applied = state_.transport->SetRemoteDescription(message.payload());
    if (applied.IsErr()) {
        AbortHandshake(applied.UnwrapErr());
        return applied;
    }
    ReportStatus(StatusMessages::ANSWER_ACCEPTED);
    return Result<Unit, ProtocolFailure>::Ok(unit);
}

Result<Unit, ProtocolFailure> PeerSession::HandleCandidate(const SignalingMessage& message) {
    if (message.target_id() != local_id_) {
        logging::GetLogger()->debug("[{}] ignoring candidate addressed to '{}'", local_id_, message.target_id());
        return Result<Unit, ProtocolFailure>::Ok(unit);
    }
    if (!state_.transport) {
        logging::GetLogger()->debug("[{}] candidate from {} arrived with no negotiation", local_id_,
            message.sender_id());
        return Result<Unit, ProtocolFailure>::Ok(unit);
    }
    return state_.transport->AddRemoteCandidate(message.payload());
}

void PeerSession::AbortHandshake(const ProtocolFailure& failure) {
    logging::GetLogger()->warn("[{}] handshake with {} aborted: {}",
        local_id_, state_.remote_peer_id, failure.message);
    Teardown();
    ReportStatus(StatusMessages::CONNECT_FAILED);
}

// ============================================================================
// Transport
// ============================================================================

Result<std::unique_ptr<interfaces::ITransport>, ProtocolFailure> PeerSession::Negotiate(
    const TransportRole role,
    const uint64_t epoch,
    std::shared_ptr<interfaces::ITransportObserver>& bridge_out) {
    bridge_out = std::make_shared<TransportBridge>(weak_from_this(), epoch);
    auto transport = deps_.transports->Negotiate(role, bridge_out);
    if (transport.IsErr()) {
        bridge_out.reset();
        return Result<std::unique_ptr<interfaces::ITransport>, ProtocolFailure>::Err(
            ProtocolFailure::Transport(transport.UnwrapErr().message));
    }
    return transport;
}

void PeerSession::HandleTransportEvent(TransportEvent& event) {
    auto logger = logging::GetLogger();
    if (event.epoch != state_.transport_epoch || !state_.transport) {
        logger->trace("[{}] dropping event from stale transport {}", local_id_, event.epoch);
        return;
    }
    switch (event.kind) {
        case TransportEventKind::LocalCandidate:
            PublishLocalCandidate(event.text);
            break;
        case TransportEventKind::Open:
            logger->info("[{}] data channel to {} open", local_id_, state_.remote_peer_id);
            SetStatus(ConnectionStatus::Connected);
            ReportStatus(StatusMessages::CONNECTED);
            break;
        case TransportEventKind::Error:
            logger->warn("[{}] transport error: {}", local_id_, event.text);
            [[fallthrough]];
        case TransportEventKind::Close:
            logger->info("[{}] data channel to {} closed", local_id_, state_.remote_peer_id);
            Teardown();
            ReportStatus(StatusMessages::PEER_DISCONNECTED);
            break;
        case TransportEventKind::Text:
            HandleIncomingText(event.text);
            break;
        case TransportEventKind::Binary:
            HandleIncomingBinary(event.data);
            break;
    }
}

void PeerSession::PublishLocalCandidate(const std::string& candidate) {
    if (state_.remote_peer_id.empty()) {
        return;
    }
    auto sent = deps_.signaling->Send(state_.remote_peer_id,
        SignalingCodec::MakeCandidate(local_id_, state_.remote_peer_id, candidate));
    if (sent.IsErr()) {
        logging::GetLogger()->warn("[{}] failed to publish ICE candidate: {}",
            local_id_, sent.UnwrapErr().message);
    }
}

void PeerSession::HandleIncomingText(const std::string& text) {
    auto update = receiver_.OnText(text);
    if (update.IsErr()) {
        ReportStatus(StatusMessages::RECEIVE_MISMATCH);
        ReportTransferFailure(update.UnwrapErr());
        return;
    }
    switch (update.Unwrap()) {
        case transfer::ReceiveUpdate::Ignored:
            logging::GetLogger()->debug("[{}] ignoring non-metadata text message", local_id_);
            break;
        case transfer::ReceiveUpdate::TransferStarted: {
            const auto& metadata = *receiver_.ActiveTransfer();
            ReportStatus(compat::format("Receiving file: {} ({:.2f} MB)...",
                metadata.file_name(), metadata.file_size() / (1024.0 * 1024.0)));
            ReportProgress(0.0);
            break;
        }
        case transfer::ReceiveUpdate::ChunkAccepted:
            break;
        case transfer::ReceiveUpdate::Completed:
            ReportProgress(100.0);
            ReportFileReceived();
            break;
    }
}

void PeerSession::HandleIncomingBinary(const std::vector<uint8_t>& data) {
    const crypto::SymmetricKey* key = state_.shared_key ? &*state_.shared_key : nullptr;
    auto update = receiver_.OnBinary(data, key);
    if (update.IsErr()) {
        const auto& failure = update.UnwrapErr();
        logging::GetLogger()->warn("[{}] chunk rejected ({}): {}",
            local_id_, ToString(failure.type), failure.message);
        switch (failure.type) {
            case ProtocolFailureType::NoKeyEstablished:
                ReportStatus(StatusMessages::NO_KEY);
                break;
            case ProtocolFailureType::VerificationMismatch:
                ReportStatus(StatusMessages::RECEIVE_MISMATCH);
                break;
            case ProtocolFailureType::UnexpectedChunk:
                break;
            default:
                ReportStatus(StatusMessages::RECEIVE_DECRYPT_FAILED);
                break;
        }
        ReportTransferFailure(failure);
        return;
    }
    ReportProgress(receiver_.Progress());
    if (update.Unwrap() == transfer::ReceiveUpdate::Completed) {
        ReportFileReceived();
    }
}

void PeerSession::ReportFileReceived() {
    ReportStatus(StatusMessages::RECEIVE_VERIFIED);
    const auto* file = receiver_.PeekReceivedFile();
    if (file != nullptr) {
        NotifyHandler("OnFileReceived", [file](interfaces::ISessionEventHandler& handler) {
            handler.OnFileReceived(file->name, file->content.size());
        });
    }
}

// ============================================================================
// State transitions
// ============================================================================

void PeerSession::Teardown() {
    const ConnectionStatus previous = state_.status;
    auto transport = std::move(state_.transport);
    receiver_.Abort();
    state_.Reset();
    bridge_.reset();
    if (transport) {
        transport->Close();
    }
    if (previous != ConnectionStatus::Disconnected) {
        NotifyHandler("OnConnectionStatusChanged", [](interfaces::ISessionEventHandler& handler) {
            handler.OnConnectionStatusChanged(ConnectionStatus::Disconnected);
        });
    }
}

void PeerSession::SetStatus(const ConnectionStatus status) {
    if (state_.status == status) {
        return;
    }
    state_.status = status;
    logging::GetLogger()->debug("[{}] status -> {}", local_id_, ToString(status));
    NotifyHandler("OnConnectionStatusChanged", [status](interfaces::ISessionEventHandler& handler) {
        handler.OnConnectionStatusChanged(status);
    });
}

void PeerSession::ReportStatus(const std::string_view message) {
    last_status_message_ = std::string(message);
    logging::GetLogger()->info("[{}] {}", local_id_, message);
    NotifyHandler("OnStatusMessage", [this](interfaces::ISessionEventHandler& handler) {
        handler.OnStatusMessage(last_status_message_);
    });
}

void PeerSession::ReportProgress(const double percent) {
    progress_ = percent;
    NotifyHandler("OnTransferProgress", [percent](interfaces::ISessionEventHandler& handler) {
        handler.OnTransferProgress(percent);
    });
}

void PeerSession::ReportTransferFailure(const ProtocolFailure& failure) {
    NotifyHandler("OnTransferFailed", [&failure](interfaces::ISessionEventHandler& handler) {
        handler.OnTransferFailed(failure);
    });
}

}
