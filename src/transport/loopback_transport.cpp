#include "peerdrop/transport/loopback_transport.hpp"
#include "peerdrop/logging/logger.hpp"
#include "peerdrop/core/format.hpp"
namespace peerdrop::protocol::transport {
using interfaces::ITransport;
using interfaces::ITransportObserver;
using interfaces::TransportRole;

namespace {
    constexpr std::string_view kOfferPrefix = "loopback:offer:";
    constexpr std::string_view kAnswerPrefix = "loopback:answer:";
    constexpr std::string_view kCandidatePrefix = "candidate:";
    constexpr uint16_t kBasePort = 50000;
}

struct LoopbackTransportFactory::Endpoint {
    std::string id;
    TransportRole role;
    std::weak_ptr<ITransportObserver> observer;
    std::weak_ptr<Endpoint> remote;
    bool description_created = false;
    bool open = false;
    bool closed = false;
    std::vector<std::string> remote_candidates;
};

struct LoopbackTransportFactory::Registry {
    mutable std::mutex mutex;
    std::map<std::string, std::weak_ptr<Endpoint>> endpoints;
    uint64_t next_id = 1;
};

namespace {
    using Endpoint = LoopbackTransportFactory::Endpoint;
    using Registry = LoopbackTransportFactory::Registry;

    std::string HostCandidate(const Endpoint& endpoint, const uint64_t index) {
        return compat::format("candidate:{} 1 udp 2130706431 127.0.0.1 {} typ host",
            endpoint.id, kBasePort + index % 10000);
    }

    void NotifyClosed(const std::shared_ptr<ITransportObserver>& observer, const std::string* error) {
        if (!observer) {
            return;
        }
        if (error) {
            observer->OnError(*error);
        }
        observer->OnClose();
    }

    class LoopbackTransport final : public ITransport {
    public:
        LoopbackTransport(std::shared_ptr<Registry> registry, std::shared_ptr<Endpoint> endpoint, uint64_t index)
            : registry_(std::move(registry)), endpoint_(std::move(endpoint)), index_(index) {}

        ~LoopbackTransport() override {
            CloseWith(nullptr);
        }

        Result<std::string, ProtocolFailure> CreateOffer() override {
            return CreateDescription(TransportRole::Caller, kOfferPrefix);
        }

        Result<std::string, ProtocolFailure> CreateAnswer() override {
            {
                std::lock_guard lock(registry_->mutex);
                if (endpoint_->remote.expired()) {
                    return Result<std::string, ProtocolFailure>::Err(
                        ProtocolFailure::Transport("Cannot create answer before the offer is applied"));
                }
            }
            return CreateDescription(TransportRole::Answerer, kAnswerPrefix);
        }

        Result<Unit, ProtocolFailure> SetRemoteDescription(const std::string& description) override {
            const std::string_view expected_prefix =
                endpoint_->role == TransportRole::Caller ? kAnswerPrefix : kOfferPrefix;
            if (description.rfind(expected_prefix, 0) != 0) {
                return Result<Unit, ProtocolFailure>::Err(
                    ProtocolFailure::Transport(
                        compat::format("Unexpected remote description '{}'", description)));
            }
            const std::string remote_id = description.substr(expected_prefix.size());
            std::shared_ptr<ITransportObserver> local_observer;
            std::shared_ptr<ITransportObserver> remote_observer;
            {
                std::lock_guard lock(registry_->mutex);
                if (endpoint_->closed) {
                    return Result<Unit, ProtocolFailure>::Err(
                        ProtocolFailure::Transport("Transport is closed"));
                }
                auto it = registry_->endpoints.find(remote_id);
                std::shared_ptr<Endpoint> remote = it == registry_->endpoints.end() ? nullptr : it->second.lock();
                if (!remote || remote->closed) {
                    return Result<Unit, ProtocolFailure>::Err(
                        ProtocolFailure::Transport(
                            compat::format("No negotiation context '{}'", remote_id)));
                }
                if (endpoint_->role == TransportRole::Answerer) {
                    endpoint_->remote = remote;
                    return Result<Unit, ProtocolFailure>::Ok(unit);
                }
                if (remote->remote.lock() != endpoint_) {
                    return Result<Unit, ProtocolFailure>::Err(
                        ProtocolFailure::Transport("Answer does not belong to this offer"));
                }
                endpoint_->remote = remote;
                endpoint_->open = true;
                remote->open = true;
                local_observer = endpoint_->observer.lock();
                remote_observer = remote->observer.lock();
            }
            logging::GetLogger()->debug("loopback link {} <-> {} open", endpoint_->id, remote_id);
            if (remote_observer) {
                remote_observer->OnOpen();
            }
            if (local_observer) {
                local_observer->OnOpen();
            }
            return Result<Unit, ProtocolFailure>::Ok(unit);
        }

        Result<Unit, ProtocolFailure> AddRemoteCandidate(const std::string& candidate) override {
            if (candidate.rfind(kCandidatePrefix, 0) != 0) {
                return Result<Unit, ProtocolFailure>::Err(
                    ProtocolFailure::Transport(
                        compat::format("Malformed ICE candidate '{}'", candidate)));
            }
            std::lock_guard lock(registry_->mutex);
            if (endpoint_->closed) {
                return Result<Unit, ProtocolFailure>::Err(
                    ProtocolFailure::Transport("Transport is closed"));
            }
            endpoint_->remote_candidates.push_back(candidate);
            return Result<Unit, ProtocolFailure>::Ok(unit);
        }

        Result<Unit, ProtocolFailure> SendText(const std::string& text) override {
            auto peer = OpenPeerObserver();
            PEERDROP_TRY(peer);
            if (auto observer = peer.Unwrap()) {
                observer->OnTextMessage(text);
            }
            return Result<Unit, ProtocolFailure>::Ok(unit);
        }

        Result<Unit, ProtocolFailure> SendBinary(std::span<const uint8_t> data) override {
            auto peer = OpenPeerObserver();
            PEERDROP_TRY(peer);
            if (auto observer = peer.Unwrap()) {
                observer->OnBinaryMessage(std::vector<uint8_t>(data.begin(), data.end()));
            }
            return Result<Unit, ProtocolFailure>::Ok(unit);
        }

        [[nodiscard]] bool IsOpen() const override {
            std::lock_guard lock(registry_->mutex);
            return endpoint_->open && !endpoint_->closed;
        }

        void Close() override {
            CloseWith(nullptr);
        }

        void CloseWith(const std::string* error) {
            CloseEndpoint(registry_, endpoint_, error);
        }

        static void CloseEndpoint(
            const std::shared_ptr<Registry>& registry,
            const std::shared_ptr<Endpoint>& endpoint,
            const std::string* error) {
            std::shared_ptr<ITransportObserver> local_observer;
            std::shared_ptr<ITransportObserver> remote_observer;
            {
                std::lock_guard lock(registry->mutex);
                if (endpoint->closed) {
                    return;
                }
                endpoint->closed = true;
                endpoint->open = false;
                local_observer = endpoint->observer.lock();
                if (auto remote = endpoint->remote.lock(); remote && !remote->closed &&
                    remote->remote.lock() == endpoint) {
                    remote->closed = true;
                    remote->open = false;
                    remote_observer = remote->observer.lock();
                    registry->endpoints.erase(remote->id);
                }
                registry->endpoints.erase(endpoint->id);
            }
            NotifyClosed(remote_observer, error);
            NotifyClosed(local_observer, error);
        }

    private:
        Result<std::string, ProtocolFailure> CreateDescription(
            const TransportRole required_role,
            const std::string_view prefix) {
            std::shared_ptr<ITransportObserver> observer;
            {
                std::lock_guard lock(registry_->mutex);
                if (endpoint_->role != required_role) {
                    return Result<std::string, ProtocolFailure>::Err(
                        ProtocolFailure::Transport("Description does not match negotiation role"));
                }
                if (endpoint_->closed) {
                    return Result<std::string, ProtocolFailure>::Err(
                        ProtocolFailure::Transport("Transport is closed"));
                }
                endpoint_->description_created = true;
                observer = endpoint_->observer.lock();
            }
            if (observer) {
                observer->OnLocalCandidate(HostCandidate(*endpoint_, index_));
            }
            return Result<std::string, ProtocolFailure>::Ok(compat::format("{}{}", prefix, endpoint_->id));
        }

        Result<std::shared_ptr<ITransportObserver>, ProtocolFailure> OpenPeerObserver() const {
            std::lock_guard lock(registry_->mutex);
            auto remote = endpoint_->remote.lock();
            if (!endpoint_->open || endpoint_->closed || !remote) {
                return Result<std::shared_ptr<ITransportObserver>, ProtocolFailure>::Err(
                    ProtocolFailure::Transport("Data channel is not open"));
            }
            return Result<std::shared_ptr<ITransportObserver>, ProtocolFailure>::Ok(remote->observer.lock());
        }

        std::shared_ptr<Registry> registry_;
        std::shared_ptr<Endpoint> endpoint_;
        uint64_t index_;
    };
}

LoopbackTransportFactory::LoopbackTransportFactory()
    : registry_(std::make_shared<Registry>()) {}

LoopbackTransportFactory::~LoopbackTransportFactory() = default;

Result<std::unique_ptr<ITransport>, ProtocolFailure> LoopbackTransportFactory::Negotiate(
    const TransportRole role,
    std::shared_ptr<ITransportObserver> observer) {
    if (!observer) {
        return Result<std::unique_ptr<ITransport>, ProtocolFailure>::Err(
            ProtocolFailure::InvalidInput("Transport observer is required"));
    }
    auto endpoint = std::make_shared<Endpoint>();
    uint64_t index = 0;
    {
        std::lock_guard lock(registry_->mutex);
        index = registry_->next_id++;
        endpoint->id = compat::format("lb-{}", index);
        endpoint->role = role;
        endpoint->observer = observer;
        registry_->endpoints[endpoint->id] = endpoint;
    }
    return Result<std::unique_ptr<ITransport>, ProtocolFailure>::Ok(
        std::make_unique<LoopbackTransport>(registry_, std::move(endpoint), index));
}

void LoopbackTransportFactory::DropAllLinks(const std::string& reason) {
    std::vector<std::shared_ptr<Endpoint>> open_endpoints;
    {
        std::lock_guard lock(registry_->mutex);
        for (const auto& [id, weak] : registry_->endpoints) {
            if (auto endpoint = weak.lock(); endpoint && endpoint->open && !endpoint->closed &&
                endpoint->role == TransportRole::Caller) {
                open_endpoints.push_back(endpoint);
            }
        }
    }
    for (const auto& endpoint : open_endpoints) {
        LoopbackTransport::CloseEndpoint(registry_, endpoint, &reason);
    }
}

size_t LoopbackTransportFactory::OpenLinkCount() const {
    std::lock_guard lock(registry_->mutex);
    size_t count = 0;
    for (const auto& [id, weak] : registry_->endpoints) {
        if (auto endpoint = weak.lock(); endpoint && endpoint->open && !endpoint->closed &&
            endpoint->role == TransportRole::Caller) {
            ++count;
        }
    }
    return count;
}

}
