#include <catch2/catch_test_macros.hpp>
#include "peerdrop/transport/loopback_transport.hpp"
#include <memory>
#include <string>
#include <vector>
using namespace peerdrop::protocol;
using namespace peerdrop::protocol::transport;
using interfaces::TransportRole;

namespace {
class RecordingObserver final : public interfaces::ITransportObserver {
public:
    void OnLocalCandidate(const std::string& candidate) override { candidates.push_back(candidate); }
    void OnOpen() override { ++opened; }
    void OnClose() override { ++closed; }
    void OnError(const std::string& reason) override { errors.push_back(reason); }
    void OnTextMessage(const std::string& text) override { texts.push_back(text); }
    void OnBinaryMessage(std::vector<uint8_t> data) override { frames.push_back(std::move(data)); }

    std::vector<std::string> candidates;
    std::vector<std::string> errors;
    std::vector<std::string> texts;
    std::vector<std::vector<uint8_t>> frames;
    int opened = 0;
    int closed = 0;
};

struct Link {
    std::shared_ptr<RecordingObserver> caller_events = std::make_shared<RecordingObserver>();
    std::shared_ptr<RecordingObserver> answerer_events = std::make_shared<RecordingObserver>();
    std::unique_ptr<interfaces::ITransport> caller;
    std::unique_ptr<interfaces::ITransport> answerer;
};

Link Establish(LoopbackTransportFactory& factory) {
    Link link;
    link.caller = factory.Negotiate(TransportRole::Caller, link.caller_events).Unwrap();
    link.answerer = factory.Negotiate(TransportRole::Answerer, link.answerer_events).Unwrap();
    auto offer = link.caller->CreateOffer().Unwrap();
    REQUIRE(link.answerer->SetRemoteDescription(offer).IsOk());
    auto answer = link.answerer->CreateAnswer().Unwrap();
    REQUIRE(link.caller->SetRemoteDescription(answer).IsOk());
    return link;
}
}

TEST_CASE("LoopbackTransport - Negotiation", "[loopback][transport]") {
    LoopbackTransportFactory factory;

    SECTION("Offer and answer open both ends") {
        auto link = Establish(factory);
        REQUIRE(link.caller->IsOpen());
        REQUIRE(link.answerer->IsOpen());
        REQUIRE(link.caller_events->opened == 1);
        REQUIRE(link.answerer_events->opened == 1);
        REQUIRE(factory.OpenLinkCount() == 1);
    }
    SECTION("Each description announces a host candidate") {
        auto link = Establish(factory);
        REQUIRE(link.caller_events->candidates.size() == 1);
        REQUIRE(link.caller_events->candidates[0].rfind("candidate:", 0) == 0);
        REQUIRE(link.answerer->AddRemoteCandidate(link.caller_events->candidates[0]).IsOk());
        REQUIRE(link.answerer->AddRemoteCandidate("garbage").IsErr());
    }
    SECTION("Answer before offer is applied fails") {
        auto events = std::make_shared<RecordingObserver>();
        auto answerer = factory.Negotiate(TransportRole::Answerer, events).Unwrap();
        REQUIRE(answerer->CreateAnswer().IsErr());
    }
    SECTION("Unknown description fails") {
        auto events = std::make_shared<RecordingObserver>();
        auto caller = factory.Negotiate(TransportRole::Caller, events).Unwrap();
        (void)caller->CreateOffer().Unwrap();
        REQUIRE(caller->SetRemoteDescription("loopback:answer:lb-999").IsErr());
        REQUIRE(caller->SetRemoteDescription("v=0 sdp").IsErr());
        REQUIRE_FALSE(caller->IsOpen());
    }
}

TEST_CASE("LoopbackTransport - Messaging", "[loopback][transport]") {
    LoopbackTransportFactory factory;
    auto link = Establish(factory);

    REQUIRE(link.caller->SendText("hello").IsOk());
    const std::vector<uint8_t> frame = {1, 2, 3};
    REQUIRE(link.caller->SendBinary(frame).IsOk());
    REQUIRE(link.answerer->SendText("back").IsOk());

    REQUIRE(link.answerer_events->texts == std::vector<std::string>{"hello"});
    REQUIRE(link.answerer_events->frames.size() == 1);
    REQUIRE(link.answerer_events->frames[0] == frame);
    REQUIRE(link.caller_events->texts == std::vector<std::string>{"back"});
}

TEST_CASE("LoopbackTransport - Closing", "[loopback][transport]") {
    LoopbackTransportFactory factory;
    auto link = Establish(factory);

    SECTION("Close notifies both ends once") {
        link.caller->Close();
        link.caller->Close();
        REQUIRE(link.caller_events->closed == 1);
        REQUIRE(link.answerer_events->closed == 1);
        REQUIRE_FALSE(link.answerer->IsOpen());
        REQUIRE(link.answerer->SendText("late").IsErr());
        REQUIRE(factory.OpenLinkCount() == 0);
    }
    SECTION("Dropping links reports an error first") {
        factory.DropAllLinks("network lost");
        REQUIRE(link.caller_events->errors == std::vector<std::string>{"network lost"});
        REQUIRE(link.answerer_events->errors == std::vector<std::string>{"network lost"});
        REQUIRE(link.caller_events->closed == 1);
        REQUIRE(link.answerer_events->closed == 1);
    }
    SECTION("Destroying one end closes the link") {
        link.answerer.reset();
        REQUIRE(link.caller_events->closed == 1);
        REQUIRE_FALSE(link.caller->IsOpen());
    }
}
