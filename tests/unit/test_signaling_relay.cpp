#include <gtest/gtest.h>
#include "peerdrop/signaling/local_signaling_client.hpp"
#include "peerdrop/signaling/signaling_relay.hpp"
#include <boost/asio/io_context.hpp>

using namespace peerdrop::signaling;
using peerdrop::core::ErrorCode;

class SignalingRelayTest : public ::testing::Test {
protected:
    SignalingRelayTest() : relay(store), client(io_context, relay) {}
    
    boost::asio::io_context io_context;
    SessionStore store;
    SignalingRelay relay;
    LocalSignalingClient client;
};

TEST_F(SignalingRelayTest, MessagesCrossToTheOtherRole) {
    auto id = relay.create_session();
    ASSERT_TRUE(relay.join_session(id));
    
    ASSERT_TRUE(relay.send(id, PeerRole::INITIATOR, Offer{"offer"}));
    ASSERT_TRUE(relay.send(id, PeerRole::JOINER, Answer{"answer"}));
    
    std::vector<SignalingMessage> messages;
    ASSERT_TRUE(relay.receive(id, PeerRole::JOINER, messages));
    ASSERT_EQ(messages.size(), 1u);
    EXPECT_TRUE(std::holds_alternative<Offer>(messages[0]));
    
    ASSERT_TRUE(relay.receive(id, PeerRole::INITIATOR, messages));
    ASSERT_EQ(messages.size(), 1u);
    EXPECT_TRUE(std::holds_alternative<Answer>(messages[0]));
}

TEST_F(SignalingRelayTest, SenderNeverSeesItsOwnMessages) {
    auto id = relay.create_session();
    ASSERT_TRUE(relay.send(id, PeerRole::INITIATOR, Candidate{"c1"}));
    
    std::vector<SignalingMessage> messages;
    ASSERT_TRUE(relay.receive(id, PeerRole::INITIATOR, messages));
    EXPECT_TRUE(messages.empty());
}

TEST_F(SignalingRelayTest, UnknownSession) {
    std::vector<SignalingMessage> messages;
    EXPECT_EQ(relay.join_session("NOPE23").error, ErrorCode::SESSION_NOT_FOUND);
    EXPECT_EQ(relay.send("NOPE23", PeerRole::INITIATOR, Offer{"x"}).error, ErrorCode::SESSION_NOT_FOUND);
    EXPECT_EQ(relay.receive("NOPE23", PeerRole::JOINER, messages).error, ErrorCode::SESSION_NOT_FOUND);
}

TEST_F(SignalingRelayTest, CountsSessions) {
    EXPECT_EQ(relay.session_count(), 0u);
    relay.create_session();
    relay.create_session();
    EXPECT_EQ(relay.session_count(), 2u);
    EXPECT_EQ(relay.expire_idle(), 0u);
}

TEST_F(SignalingRelayTest, LocalClientDelegates) {
    std::string id;
    client.async_create_session([&](peerdrop::core::Result result, std::string session_id) {
        ASSERT_TRUE(result);
        id = session_id;
    });
    io_context.run();
    io_context.restart();
    ASSERT_FALSE(id.empty());
    EXPECT_TRUE(store.contains(id));

    std::vector<ErrorCode> joins;
    for (int i = 0; i < 2; ++i) {
        client.async_join_session(id, [&](peerdrop::core::Result result) { joins.push_back(result.error); });
    }
    client.async_send(id, PeerRole::JOINER, Answer{"a"}, [](peerdrop::core::Result result) {
        EXPECT_TRUE(result);
    });
    std::vector<SignalingMessage> messages;
    client.async_receive(id, PeerRole::INITIATOR,
                         [&](peerdrop::core::Result result, std::vector<SignalingMessage> received) {
                             EXPECT_TRUE(result);
                             messages = std::move(received);
                         });
    io_context.run();

    ASSERT_EQ(joins.size(), 2u);
    EXPECT_EQ(joins[0], ErrorCode::SUCCESS);
    EXPECT_EQ(joins[1], ErrorCode::SESSION_FULL);
    ASSERT_EQ(messages.size(), 1u);
    EXPECT_EQ(message_payload(messages[0]), "a");
}

TEST_F(SignalingRelayTest, LocalClientNeverCompletesInline) {
    bool completed = false;
    client.async_join_session("NOPE23", [&](peerdrop::core::Result result) {
        EXPECT_EQ(result.error, ErrorCode::SESSION_NOT_FOUND);
        completed = true;
    });
    EXPECT_FALSE(completed);

    io_context.run();
    EXPECT_TRUE(completed);
}
