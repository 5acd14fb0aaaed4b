#include <gtest/gtest.h>
#include "peerdrop/core/utils.hpp"
#include "peerdrop/network/tcp_peer_connection.hpp"
#include "peerdrop/session/peer_session.hpp"
#include "peerdrop/signaling/http_signaling_client.hpp"
#include "peerdrop/signaling/relay_server.hpp"
#include <filesystem>
#include <fstream>
#include <iterator>

using namespace peerdrop;
using session::PeerSession;
using session::SessionState;

namespace {
    template<typename Predicate>
    bool run_until(boost::asio::io_context& io_context, Predicate done,
                   std::chrono::milliseconds timeout = std::chrono::seconds(10)) {
        auto deadline = std::chrono::steady_clock::now() + timeout;
        while (!done() && std::chrono::steady_clock::now() < deadline) {
            io_context.restart();
            io_context.run_one_for(std::chrono::milliseconds(10));
        }
        return done();
    }
}

class EndToEndTest : public ::testing::Test {
protected:
    void SetUp() override {
        signaling::RelayOptions relay_options;
        relay_options.bind_address = "127.0.0.1";
        relay_options.port = 0;
        relay_options.threads = 1;

        relay = std::make_unique<signaling::SignalingRelay>(store);
        server = std::make_unique<signaling::RelayServer>(*relay, relay_options);
        ASSERT_TRUE(server->start());

        signaling::HttpSignalingOptions client_options;
        client_options.url = "http://127.0.0.1:" + std::to_string(server->port());
        client_options.timeout = std::chrono::milliseconds(2000);

        network::TcpPeerOptions peer_options;
        peer_options.listen_address = "127.0.0.1";
        peer_options.connect_timeout = std::chrono::milliseconds(3000);

        session::BootstrapOptions bootstrap;
        bootstrap.poll_interval = std::chrono::milliseconds(20);

        auto factory = std::make_shared<network::TcpPeerConnectionFactory>(io_context, peer_options);
        sender = std::make_shared<PeerSession>(io_context,
            std::make_shared<signaling::HttpSignalingClient>(io_context, client_options), factory, bootstrap);
        receiver = std::make_shared<PeerSession>(io_context,
            std::make_shared<signaling::HttpSignalingClient>(io_context, client_options), factory, bootstrap);

        work_dir = std::filesystem::temp_directory_path() /
                   (std::string("peerdrop_e2e_") + ::testing::UnitTest::GetInstance()->current_test_info()->name());
        std::filesystem::create_directories(work_dir);
    }

    void TearDown() override {
        sender.reset();
        receiver.reset();
        server->stop();
        std::filesystem::remove_all(work_dir);
    }

    // Runs a bootstrap call until the relay has answered it
    template<typename Start>
    core::Result bootstrap(Start start) {
        core::Result outcome(core::ErrorCode::CANCELLED);
        bool done = false;
        auto accepted = start([&](const core::Result& result) {
            outcome = result;
            done = true;
        });
        if (!accepted) {
            return accepted;
        }
        EXPECT_TRUE(run_until(io_context, [&]() { return done; }));
        return outcome;
    }

    void connect() {
        ASSERT_TRUE(bootstrap([this](auto on_ready) { return sender->create_session(on_ready); }));
        ASSERT_EQ(sender->session_id().size(), 6u);
        ASSERT_TRUE(bootstrap([this](auto on_ready) {
            return receiver->join_session(sender->session_id(), on_ready);
        }));
        ASSERT_TRUE(run_until(io_context, [this]() {
            return sender->is_connected() && receiver->is_connected();
        }));
    }

    boost::asio::io_context io_context;
    signaling::SessionStore store;
    std::unique_ptr<signaling::SignalingRelay> relay;
    std::unique_ptr<signaling::RelayServer> server;
    std::shared_ptr<PeerSession> sender;
    std::shared_ptr<PeerSession> receiver;
    std::filesystem::path work_dir;
};

TEST_F(EndToEndTest, FileArrivesIntact) {
    auto source = work_dir / "payload.bin";
    std::vector<std::uint8_t> data(40000);
    for (std::size_t i = 0; i < data.size(); ++i) {
        data[i] = static_cast<std::uint8_t>((i * 31) ^ (i >> 8));
    }
    ASSERT_TRUE(core::utils::FileUtils::write_binary_file(source, data));

    connect();

    bool sent = false;
    ASSERT_TRUE(sender->send_file(source, [&sent](const transfer::TransferMetadata& metadata, const core::Result& result) {
        EXPECT_EQ(metadata.size, 40000u);
        EXPECT_TRUE(result);
        sent = true;
    }));

    ASSERT_TRUE(run_until(io_context, [this]() { return receiver->received_files().size() == 1; }));
    EXPECT_TRUE(sent);

    const auto& file = receiver->received_files()[0];
    EXPECT_EQ(file.name, "payload.bin");
    EXPECT_EQ(file.size, 40000u);
    EXPECT_EQ(file.mime_type, "application/octet-stream");
    EXPECT_EQ(file.data, data);

    auto downloads = work_dir / "downloads";
    std::filesystem::path saved;
    ASSERT_TRUE(receiver->download_file(file, downloads, &saved));
    std::ifstream in(saved, std::ios::binary);
    std::vector<std::uint8_t> written((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    EXPECT_EQ(written, data);
}

TEST_F(EndToEndTest, SeveralFilesInOrder) {
    connect();

    ASSERT_TRUE(sender->send_buffer("a.txt", "text/plain", {'a'}));
    ASSERT_TRUE(sender->send_buffer("empty.bin", "", {}));
    ASSERT_TRUE(sender->send_buffer("b.txt", "text/plain", std::vector<std::uint8_t>(20000, 'b')));

    ASSERT_TRUE(run_until(io_context, [this]() { return receiver->received_files().size() == 3; }));
    EXPECT_EQ(receiver->received_files()[0].name, "a.txt");
    EXPECT_EQ(receiver->received_files()[1].name, "empty.bin");
    EXPECT_TRUE(receiver->received_files()[1].data.empty());
    EXPECT_EQ(receiver->received_files()[2].size, 20000u);
}

TEST_F(EndToEndTest, BothDirections) {
    connect();

    ASSERT_TRUE(receiver->send_buffer("back.txt", "text/plain", {'o', 'k'}));
    ASSERT_TRUE(run_until(io_context, [this]() { return sender->received_files().size() == 1; }));
    EXPECT_EQ(sender->received_files()[0].name, "back.txt");
}

TEST_F(EndToEndTest, PeerLeavingFailsTheOther) {
    connect();

    receiver->reset();
    EXPECT_EQ(receiver->state(), SessionState::IDLE);

    ASSERT_TRUE(run_until(io_context, [this]() { return sender->state() == SessionState::FAILED; }));
    EXPECT_FALSE(sender->error().empty());

    sender->reset();
    EXPECT_EQ(sender->state(), SessionState::IDLE);
}

TEST_F(EndToEndTest, UnknownCodeFails) {
    auto result = bootstrap([this](auto on_ready) { return receiver->join_session("QQQQQQ", on_ready); });
    EXPECT_EQ(result.error, core::ErrorCode::SESSION_NOT_FOUND);
    EXPECT_EQ(receiver->state(), SessionState::FAILED);
}

TEST_F(EndToEndTest, RelayDownFailsCreate) {
    server->stop();

    auto result = bootstrap([this](auto on_ready) { return sender->create_session(on_ready); });
    EXPECT_EQ(result.error, core::ErrorCode::TRANSPORT_ERROR);
    EXPECT_EQ(sender->state(), SessionState::FAILED);
}

TEST_F(EndToEndTest, SilentRelayDoesNotBlockTheSession) {
    using tcp = boost::asio::ip::tcp;
    tcp::acceptor silent(io_context, tcp::endpoint(boost::asio::ip::make_address("127.0.0.1"), 0));
    tcp::socket held(io_context);
    silent.async_accept(held, [](const boost::system::error_code&) {});

    signaling::HttpSignalingOptions options;
    options.url = "http://127.0.0.1:" + std::to_string(silent.local_endpoint().port());
    options.timeout = std::chrono::milliseconds(300);
    auto stalled = std::make_shared<PeerSession>(io_context,
        std::make_shared<signaling::HttpSignalingClient>(io_context, options),
        std::make_shared<network::TcpPeerConnectionFactory>(io_context, network::TcpPeerOptions{}));

    bool ready = false;
    ASSERT_TRUE(stalled->create_session([&](const core::Result&) { ready = true; }));
    EXPECT_EQ(stalled->state(), SessionState::CONNECTING);

    int ticks = 0;
    boost::asio::steady_timer ticker(io_context);
    std::function<void()> tick = [&]() {
        ticker.expires_after(std::chrono::milliseconds(20));
        ticker.async_wait([&](const boost::system::error_code& ec) {
            if (!ec && !ready) {
                ++ticks;
                tick();
            }
        });
    };
    tick();

    ASSERT_TRUE(run_until(io_context, [&]() { return ready; }));
    EXPECT_GE(ticks, 3);
    EXPECT_EQ(stalled->state(), SessionState::FAILED);
    EXPECT_NE(stalled->error().find("Could not create session"), std::string::npos);
    ticker.cancel();
}
