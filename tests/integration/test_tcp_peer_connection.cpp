#include <gtest/gtest.h>
#include "peerdrop/network/tcp_peer_connection.hpp"
#include <utility> // Boost 1.74 awaitable.hpp uses std::exchange without including it
#include <boost/asio.hpp>
#include <chrono>

using namespace peerdrop::network;
using peerdrop::core::ErrorCode;

namespace {
    template<typename Predicate>
    bool run_until(boost::asio::io_context& io_context, Predicate done,
                   std::chrono::milliseconds timeout = std::chrono::seconds(5)) {
        auto deadline = std::chrono::steady_clock::now() + timeout;
        while (!done() && std::chrono::steady_clock::now() < deadline) {
            io_context.restart();
            io_context.run_one_for(std::chrono::milliseconds(10));
        }
        return done();
    }
}

class TcpPeerConnectionTest : public ::testing::Test {
protected:
    void SetUp() override {
        options.listen_address = "127.0.0.1";
        options.listen_port = 0;
        options.connect_timeout = std::chrono::milliseconds(500);

        offerer = std::make_shared<TcpPeerConnection>(io_context, options);
        answerer = std::make_shared<TcpPeerConnection>(io_context, options);

        offerer->set_candidate_handler([this](const IceCandidate& candidate) {
            offerer_candidates.push_back(candidate);
        });
        answerer->set_data_channel_handler([this](std::shared_ptr<DataChannel> channel) {
            answerer_channel = channel;
            answerer_channel->set_message_handler([this](ChannelMessage message) {
                answerer_inbox.push_back(std::move(message));
            });
        });
    }

    void TearDown() override {
        offerer->close();
        answerer->close();
    }

    // Offer/answer exchange followed by the offerer's candidates
    void negotiate() {
        offerer_channel = offerer->create_data_channel("fileTransfer");
        offerer_channel->set_message_handler([this](ChannelMessage message) {
            offerer_inbox.push_back(std::move(message));
        });

        SessionDescription offer;
        ASSERT_TRUE(offerer->create_offer(offer));
        ASSERT_TRUE(answerer->set_remote_description(offer));

        SessionDescription answer;
        ASSERT_TRUE(answerer->create_answer(answer));
        ASSERT_TRUE(offerer->set_remote_description(answer));

        ASSERT_TRUE(run_until(io_context, [this]() { return !offerer_candidates.empty(); }));
        for (const auto& candidate : offerer_candidates) {
            ASSERT_TRUE(answerer->add_remote_candidate(candidate));
        }
    }

    bool both_open() {
        return offerer_channel && offerer_channel->is_open() && answerer_channel && answerer_channel->is_open();
    }

    boost::asio::io_context io_context;
    TcpPeerOptions options;
    std::shared_ptr<TcpPeerConnection> offerer;
    std::shared_ptr<TcpPeerConnection> answerer;
    std::shared_ptr<DataChannel> offerer_channel;
    std::shared_ptr<DataChannel> answerer_channel;
    std::vector<IceCandidate> offerer_candidates;
    std::vector<ChannelMessage> offerer_inbox;
    std::vector<ChannelMessage> answerer_inbox;
};

TEST_F(TcpPeerConnectionTest, OfferAnnouncesListeningEndpoint) {
    SessionDescription offer;
    ASSERT_TRUE(offerer->create_offer(offer));
    EXPECT_EQ(offer.type, SdpType::OFFER);
    EXPECT_EQ(offerer->state(), PeerConnectionState::CONNECTING);

    auto endpoint = offerer->local_endpoint();
    ASSERT_TRUE(endpoint.has_value());
    EXPECT_NE(endpoint->port(), 0);

    ASSERT_TRUE(run_until(io_context, [this]() { return !offerer_candidates.empty(); }));
    ASSERT_EQ(offerer_candidates.size(), 1u);
    EXPECT_EQ(offerer_candidates[0].candidate, format_tcp_candidate(*endpoint));
}

TEST_F(TcpPeerConnectionTest, EncryptedChannelRoundTrip) {
    negotiate();
    ASSERT_TRUE(run_until(io_context, [this]() { return both_open(); }));

    EXPECT_EQ(offerer->state(), PeerConnectionState::CONNECTED);
    EXPECT_EQ(answerer->state(), PeerConnectionState::CONNECTED);
    EXPECT_EQ(answerer_channel->label(), "fileTransfer");

    std::vector<std::uint8_t> chunk(16384);
    for (std::size_t i = 0; i < chunk.size(); ++i) {
        chunk[i] = static_cast<std::uint8_t>(i * 7);
    }

    ASSERT_TRUE(offerer_channel->send_text(R"({"type":"metadata"})"));
    ASSERT_TRUE(offerer_channel->send_binary(chunk));
    ASSERT_TRUE(answerer_channel->send_text("reply"));

    ASSERT_TRUE(run_until(io_context, [this]() {
        return answerer_inbox.size() == 2 && offerer_inbox.size() == 1;
    }));

    EXPECT_EQ(std::get<std::string>(answerer_inbox[0]), R"({"type":"metadata"})");
    EXPECT_EQ(std::get<std::vector<std::uint8_t>>(answerer_inbox[1]), chunk);
    EXPECT_EQ(std::get<std::string>(offerer_inbox[0]), "reply");
}

TEST_F(TcpPeerConnectionTest, CandidateBeforeDescriptionIsQueued) {
    offerer->create_data_channel("fileTransfer");
    SessionDescription offer;
    ASSERT_TRUE(offerer->create_offer(offer));
    ASSERT_TRUE(run_until(io_context, [this]() { return !offerer_candidates.empty(); }));

    // Endpoint is remembered and dialled once the offer is applied
    ASSERT_TRUE(answerer->add_remote_candidate(offerer_candidates[0]));
    EXPECT_FALSE(answerer->has_remote_description());

    ASSERT_TRUE(answerer->set_remote_description(offer));
    SessionDescription answer;
    ASSERT_TRUE(answerer->create_answer(answer));
    ASSERT_TRUE(offerer->set_remote_description(answer));

    EXPECT_TRUE(run_until(io_context, [this]() {
        return offerer->state() == PeerConnectionState::CONNECTED &&
               answerer->state() == PeerConnectionState::CONNECTED;
    }));
}

TEST_F(TcpPeerConnectionTest, ForeignKeyIsRejected) {
    offerer->create_data_channel("fileTransfer");
    SessionDescription offer;
    ASSERT_TRUE(offerer->create_offer(offer));

    // The offerer expects `answerer`, but a stranger with the same offer dials
    auto stranger = std::make_shared<TcpPeerConnection>(io_context, options);
    ASSERT_TRUE(answerer->set_remote_description(offer));
    ASSERT_TRUE(stranger->set_remote_description(offer));
    SessionDescription answer;
    ASSERT_TRUE(answerer->create_answer(answer));
    ASSERT_TRUE(offerer->set_remote_description(answer));

    ASSERT_TRUE(run_until(io_context, [this]() { return !offerer_candidates.empty(); }));
    ASSERT_TRUE(stranger->add_remote_candidate(offerer_candidates[0]));

    ASSERT_TRUE(run_until(io_context, [&stranger]() {
        return stranger->state() == PeerConnectionState::FAILED;
    }));
    EXPECT_EQ(offerer->state(), PeerConnectionState::CONNECTING);
    stranger->close();
}

TEST_F(TcpPeerConnectionTest, RemoteCloseDisconnects) {
    negotiate();
    ASSERT_TRUE(run_until(io_context, [this]() { return both_open(); }));

    bool closed = false;
    answerer_channel->set_close_handler([&closed]() { closed = true; });
    std::vector<PeerConnectionState> states;
    answerer->set_state_handler([&states](PeerConnectionState state) { states.push_back(state); });

    offerer_channel->close();
    EXPECT_FALSE(offerer_channel->is_open());
    EXPECT_EQ(offerer->state(), PeerConnectionState::CLOSED);

    ASSERT_TRUE(run_until(io_context, [&closed]() { return closed; }));
    EXPECT_FALSE(answerer_channel->is_open());
    ASSERT_FALSE(states.empty());
    EXPECT_EQ(states.back(), PeerConnectionState::DISCONNECTED);
    EXPECT_FALSE(answerer_channel->send_text("late"));
}

TEST_F(TcpPeerConnectionTest, UnreachableCandidateTimesOut) {
    offerer->create_data_channel("fileTransfer");
    SessionDescription offer;
    ASSERT_TRUE(offerer->create_offer(offer));
    ASSERT_TRUE(answerer->set_remote_description(offer));

    std::vector<PeerConnectionState> states;
    answerer->set_state_handler([&states](PeerConnectionState state) { states.push_back(state); });

    // Nobody listens on the discard port of the loopback
    ASSERT_TRUE(answerer->add_remote_candidate(IceCandidate{"tcp 127.0.0.1 9"}));
    ASSERT_TRUE(run_until(io_context, [this]() { return answerer->state() == PeerConnectionState::FAILED; }));
    EXPECT_EQ(states.back(), PeerConnectionState::FAILED);
}

TEST_F(TcpPeerConnectionTest, RejectsMalformedInput) {
    EXPECT_EQ(answerer->set_remote_description({SdpType::OFFER, "not json"}).error, ErrorCode::MALFORMED_PAYLOAD);
    EXPECT_EQ(answerer->set_remote_description({SdpType::OFFER, R"({"version":1,"public_key":"abcd"})"}).error,
              ErrorCode::MALFORMED_PAYLOAD);
    EXPECT_EQ(answerer->add_remote_candidate(IceCandidate{"udp 10.0.0.1 9000"}).error,
              ErrorCode::MALFORMED_PAYLOAD);

    SessionDescription answer;
    EXPECT_EQ(answerer->create_answer(answer).error, ErrorCode::INVALID_STATE);

    SessionDescription offer;
    ASSERT_TRUE(offerer->create_offer(offer));
    EXPECT_EQ(offerer->set_remote_description(offer).error, ErrorCode::INVALID_STATE);
}

TEST_F(TcpPeerConnectionTest, SendBeforeOpenFails) {
    auto channel = offerer->create_data_channel("fileTransfer");
    EXPECT_EQ(channel->state(), DataChannelState::CONNECTING);
    EXPECT_FALSE(channel->send_text("too early"));
    EXPECT_EQ(channel->buffered_amount(), 0u);
}

TEST(TcpCandidateTest, FormatAndParse) {
    tcp::endpoint endpoint(boost::asio::ip::make_address("192.168.1.20"), 40123);
    auto line = format_tcp_candidate(endpoint);
    EXPECT_EQ(line, "tcp 192.168.1.20 40123");

    auto parsed = parse_tcp_candidate(line);
    ASSERT_TRUE(parsed.has_value());
    EXPECT_EQ(*parsed, endpoint);

    EXPECT_FALSE(parse_tcp_candidate("tcp 192.168.1.20").has_value());
    EXPECT_FALSE(parse_tcp_candidate("tcp 192.168.1.20 0").has_value());
    EXPECT_FALSE(parse_tcp_candidate("tcp 192.168.1.20 70000").has_value());
    EXPECT_FALSE(parse_tcp_candidate("tcp not-an-address 80").has_value());
    EXPECT_FALSE(parse_tcp_candidate("candidate:1 1 udp 2122260223 10.0.0.1 9000 typ host").has_value());
}

TEST(TcpCandidateTest, LocalAddressesEndWithLoopback) {
    auto addresses = local_interface_addresses();
    ASSERT_FALSE(addresses.empty());
    EXPECT_TRUE(addresses.back().is_loopback());
}
