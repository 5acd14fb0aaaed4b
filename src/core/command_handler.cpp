#include "peerdrop/core/command_handler.hpp"
#include "peerdrop/core/config.hpp"
#include "peerdrop/core/logger.hpp"
#include "peerdrop/core/utils.hpp"
#include "peerdrop/network/tcp_peer_connection.hpp"
#include "peerdrop/session/peer_session.hpp"
#include "peerdrop/signaling/http_signaling_client.hpp"
#include "peerdrop/signaling/relay_server.hpp"
#include "peerdrop/signaling/session_store.hpp"
#include "peerdrop/signaling/signaling_relay.hpp"
#include <boost/asio/signal_set.hpp>
#include <filesystem>
#include <iostream>
#include <csignal>

namespace peerdrop::core {

namespace {
    std::shared_ptr<session::PeerSession> make_peer_session(boost::asio::io_context& io_context) {
        auto& config = Config::instance();

        auto signaling = std::make_shared<signaling::HttpSignalingClient>(
            io_context, signaling::HttpSignalingOptions::from_config(config));
        auto connections = std::make_shared<network::TcpPeerConnectionFactory>(
            io_context, network::TcpPeerOptions::from_config(config));

        return std::make_shared<session::PeerSession>(
            io_context, signaling, connections,
            session::BootstrapOptions::from_config(config),
            transfer::TransferOptions::from_config(config));
    }

    void print_progress(const transfer::TransferProgress& progress) {
        std::cout << "\r  " << (progress.direction == transfer::TransferDirection::SENDING ? "Sending " : "Receiving ")
                  << progress.file_name << ": " << static_cast<int>(progress.progress) << "% ("
                  << utils::StringUtils::format_bytes(progress.transferred_size) << " / "
                  << utils::StringUtils::format_bytes(progress.total_size) << ")" << std::flush;
        if (progress.transferred_size >= progress.total_size) {
            std::cout << "\n";
        }
    }
}

// RelayCommandHandler Implementation
CommandResult RelayCommandHandler::execute(const std::vector<std::string>& args) {
    if (args.size() != 1) {
        return CommandResult::error("Usage: " + get_usage());
    }

    auto options = signaling::RelayOptions::from_config(Config::instance());

    signaling::SessionStore store(options.store);
    signaling::SignalingRelay relay(store);
    signaling::RelayServer server(relay, options);

    if (!server.start()) {
        return CommandResult::error("Failed to start relay on " + options.bind_address + ":" +
                                    std::to_string(options.port));
    }

    std::cout << "Relay listening on " << options.bind_address << ":" << server.port() << "\n";
    std::cout << "Press Ctrl+C to stop\n";

    boost::asio::io_context io_context;
    boost::asio::signal_set signals(io_context, SIGINT, SIGTERM);
    signals.async_wait([&server](const boost::system::error_code& ec, int signal_number) {
        if (!ec) {
            LOG_INFO("Received signal {}, stopping relay", signal_number);
            server.stop();
        }
    });
    io_context.run();

    return CommandResult::ok("Relay stopped");
}

// SendCommandHandler Implementation
CommandResult SendCommandHandler::execute(const std::vector<std::string>& args) {
    if (args.size() < 2) {
        return CommandResult::error("Usage: " + get_usage());
    }

    std::vector<std::filesystem::path> files(args.begin() + 1, args.end());
    for (const auto& file : files) {
        if (!utils::FileUtils::is_file(file)) {
            return CommandResult::error("File does not exist: " + file.string());
        }
    }

    boost::asio::io_context io_context;
    auto session = make_peer_session(io_context);

    std::size_t completed = 0;
    std::string failure;
    bool interrupted = false;

    auto send_all = [&]() {
        for (const auto& file : files) {
            auto result = session->send_file(file, [&](const transfer::TransferMetadata& metadata,
                                                       const Result& result) {
                if (!result) {
                    failure = "Sending " + metadata.name + " failed: " + result.describe();
                    io_context.stop();
                    return;
                }
                std::cout << "Sent " << metadata.name << " ("
                          << utils::StringUtils::format_bytes(metadata.size) << ")\n";
                ++completed;
                if (completed == files.size()) {
                    std::cout << "All files sent, waiting for the receiver to finish...\n";
                }
            });
            if (!result) {
                failure = "Cannot send " + file.string() + ": " + result.describe();
                io_context.stop();
                return;
            }
        }
    };

    session->set_progress_callback(print_progress);
    session->set_state_callback([&](session::SessionState state) {
        switch (state) {
            case session::SessionState::CONNECTED:
                std::cout << "Receiver connected\n";
                send_all();
                break;
            case session::SessionState::FAILED:
                // The receiver hangs up once it has everything
                if (completed < files.size()) {
                    failure = session->error();
                }
                io_context.stop();
                break;
            default:
                break;
        }
    });

    boost::asio::signal_set signals(io_context, SIGINT, SIGTERM);
    signals.async_wait([&](const boost::system::error_code& ec, int) {
        if (!ec) {
            interrupted = true;
            io_context.stop();
        }
    });

    // A relay failure also moves the session to FAILED, which stops the loop
    auto result = session->create_session([&](const Result& created) {
        if (!created) {
            return;
        }
        std::cout << "Session code: " << session->session_id() << "\n";
        std::cout << "Waiting for the receiver to join...\n";
        LOG_INFO("Waiting for receiver on session {}", session->session_id());
    });
    if (!result) {
        session->reset();
        return CommandResult::error("Failed to create session: " + result.describe());
    }

    io_context.run();
    session->reset();

    if (interrupted) {
        return CommandResult::error("Interrupted", 130);
    }
    if (!failure.empty()) {
        return CommandResult::error(failure);
    }
    return CommandResult::ok("Sent " + std::to_string(completed) + " file(s)");
}

// ReceiveCommandHandler Implementation
CommandResult ReceiveCommandHandler::execute(const std::vector<std::string>& args) {
    if (args.size() != 2) {
        return CommandResult::error("Usage: " + get_usage());
    }

    auto& config = Config::instance();
    std::string code = utils::StringUtils::trim(args[1]);
    std::filesystem::path output = config.get_string("transfer.download_dir", ".");
    int expected = config.get_int("receive.count", 1);
    if (expected < 1) {
        return CommandResult::error("File count must be at least 1");
    }

    boost::asio::io_context io_context;
    auto session = make_peer_session(io_context);

    int saved = 0;
    std::string failure;
    bool interrupted = false;

    session->set_progress_callback(print_progress);
    session->set_file_callback([&](const transfer::ReceivedFile& file) {
        std::filesystem::path path;
        auto result = session->download_file(file, output, &path);
        if (!result) {
            failure = result.describe();
            io_context.stop();
            return;
        }
        std::cout << "Saved " << file.name << " to " << path.string() << "\n";
        if (++saved >= expected) {
            io_context.stop();
        }
    });
    session->set_state_callback([&](session::SessionState state) {
        switch (state) {
            case session::SessionState::CONNECTED:
                std::cout << "Connected to sender\n";
                break;
            case session::SessionState::FAILED:
                failure = session->error();
                io_context.stop();
                break;
            default:
                break;
        }
    });

    boost::asio::signal_set signals(io_context, SIGINT, SIGTERM);
    signals.async_wait([&](const boost::system::error_code& ec, int) {
        if (!ec) {
            interrupted = true;
            io_context.stop();
        }
    });

    auto result = session->join_session(code, [&](const Result& joined) {
        if (joined) {
            std::cout << "Joined session " << code << ", waiting for files...\n";
        }
    });
    if (!result) {
        session->reset();
        return CommandResult::error("Failed to join session " + code + ": " + result.describe());
    }

    io_context.run();
    session->reset();

    if (interrupted) {
        return CommandResult::error("Interrupted", 130);
    }
    if (!failure.empty()) {
        return CommandResult::error(failure);
    }
    return CommandResult::ok("Received " + std::to_string(saved) + " file(s)");
}

}
