#include "peerdrop/signaling/relay_server.hpp"
#include "peerdrop/core/logger.hpp"
#include "peerdrop/core/utils.hpp"
#include <boost/beast/core.hpp>
#include <boost/beast/version.hpp>
#include <nlohmann/json.hpp>
#include <algorithm>

namespace peerdrop::signaling {

namespace beast = boost::beast;
namespace net = boost::asio;
using tcp = net::ip::tcp;
using core::utils::StringUtils;

namespace {
    constexpr auto READ_TIMEOUT = std::chrono::seconds(30);

    http::status status_for(core::ErrorCode code) {
        switch (code) {
            case core::ErrorCode::SESSION_NOT_FOUND: return http::status::not_found;
            case core::ErrorCode::SESSION_FULL: return http::status::conflict;
            case core::ErrorCode::MALFORMED_PAYLOAD: return http::status::bad_request;
            default: return http::status::internal_server_error;
        }
    }

    // Value of `key` in an a=b&c=d query string
    std::optional<std::string> query_value(const std::string& query, const std::string& key) {
        if (query.empty()) {
            return std::nullopt;
        }
        for (const auto& pair : StringUtils::split(query, '&')) {
            auto eq = pair.find('=');
            auto name = pair.substr(0, eq);
            if (name != key) {
                continue;
            }
            if (eq == std::string::npos) {
                return std::string();
            }
            return StringUtils::url_decode(pair.substr(eq + 1));
        }
        return std::nullopt;
    }

    std::optional<PeerRole> role_from_query(const std::string& query, PeerRole fallback, bool& out_valid) {
        out_valid = true;
        auto value = query_value(query, "role");
        if (!value) {
            return fallback;
        }
        auto role = parse_role(*value);
        if (!role) {
            out_valid = false;
        }
        return role;
    }
}

// One keep-alive HTTP connection. Handlers run on the session's strand.
class RelayServer::HttpSession : public std::enable_shared_from_this<HttpSession> {
public:
    HttpSession(tcp::socket socket, RelayServer& server)
        : stream_(std::move(socket))
        , server_(server) {
    }

    void start() {
        net::dispatch(stream_.get_executor(),
                      beast::bind_front_handler(&HttpSession::do_read, shared_from_this()));
    }

private:
    void do_read() {
        request_ = {};
        stream_.expires_after(READ_TIMEOUT);
        http::async_read(stream_, buffer_, request_,
                         beast::bind_front_handler(&HttpSession::on_read, shared_from_this()));
    }

    void on_read(beast::error_code ec, std::size_t) {
        if (ec == http::error::end_of_stream) {
            do_close();
            return;
        }
        if (ec) {
            if (ec != net::error::operation_aborted && ec != beast::error::timeout) {
                LOG_DEBUG("HTTP read error: {}", ec.message());
            }
            return;
        }

        try {
            response_ = server_.handle_request(request_);
        } catch (const std::exception& e) {
            LOG_ERROR("Failed to handle {}: {}", std::string(request_.target()), e.what());
            response_ = HttpResponse{http::status::internal_server_error, request_.version()};
            response_.set(http::field::access_control_allow_origin, "*");
        }
        response_.keep_alive(request_.keep_alive());
        response_.prepare_payload();

        http::async_write(stream_, response_,
                          beast::bind_front_handler(&HttpSession::on_write, shared_from_this()));
    }

    void on_write(beast::error_code ec, std::size_t) {
        if (ec) {
            LOG_DEBUG("HTTP write error: {}", ec.message());
            return;
        }
        if (!response_.keep_alive()) {
            do_close();
            return;
        }
        do_read();
    }

    void do_close() {
        beast::error_code ec;
        stream_.socket().shutdown(tcp::socket::shutdown_send, ec);
    }

    beast::tcp_stream stream_;
    beast::flat_buffer buffer_;
    HttpRequest request_;
    HttpResponse response_;
    RelayServer& server_;
};

RelayServer::RelayServer(SignalingRelay& relay, RelayOptions options)
    : relay_(relay)
    , options_(std::move(options))
    , io_context_(static_cast<int>(std::max<std::size_t>(1, options_.threads)))
    , acceptor_(io_context_)
    , sweep_timer_(io_context_)
    , running_(false)
    , bound_port_(0) {
}

RelayServer::~RelayServer() {
    stop();
}

bool RelayServer::start() {
    if (running_) {
        LOG_WARN("Relay server already running");
        return false;
    }

    try {
        tcp::endpoint endpoint(net::ip::make_address(options_.bind_address), options_.port);
        acceptor_.open(endpoint.protocol());
        acceptor_.set_option(net::socket_base::reuse_address(true));
        acceptor_.bind(endpoint);
        acceptor_.listen(net::socket_base::max_listen_connections);
        bound_port_ = acceptor_.local_endpoint().port();
    } catch (const std::exception& e) {
        LOG_ERROR("Failed to start relay server on {}:{}: {}", options_.bind_address, options_.port, e.what());
        boost::system::error_code ec;
        acceptor_.close(ec);
        return false;
    }

    running_ = true;
    io_context_.restart();
    do_accept();
    schedule_sweep();

    auto thread_count = std::max<std::size_t>(1, options_.threads);
    threads_.reserve(thread_count);
    for (std::size_t i = 0; i < thread_count; ++i) {
        threads_.emplace_back([this]() {
            while (running_) {
                try {
                    io_context_.run();
                    break;
                } catch (const std::exception& e) {
                    LOG_ERROR("Relay IO context error: {}", e.what());
                }
            }
        });
    }

    LOG_INFO("Signaling relay listening on {}:{} with {} thread(s)",
             options_.bind_address, bound_port_, thread_count);
    return true;
}

void RelayServer::stop() {
    if (!running_.exchange(false)) {
        return;
    }

    LOG_INFO("Stopping signaling relay on port {}", bound_port_);
    io_context_.stop();

    for (auto& thread : threads_) {
        if (thread.joinable()) {
            thread.join();
        }
    }
    threads_.clear();

    boost::system::error_code ec;
    acceptor_.close(ec);
    sweep_timer_.cancel();
}

void RelayServer::do_accept() {
    acceptor_.async_accept(net::make_strand(io_context_),
        [this](beast::error_code ec, tcp::socket socket) {
            if (!running_) {
                return;
            }
            if (ec) {
                LOG_WARN("Relay accept error: {}", ec.message());
            } else {
                std::make_shared<HttpSession>(std::move(socket), *this)->start();
            }
            do_accept();
        });
}

void RelayServer::schedule_sweep() {
    sweep_timer_.expires_after(options_.sweep_interval);
    sweep_timer_.async_wait([this](const boost::system::error_code& ec) {
        if (ec || !running_) {
            return;
        }
        relay_.expire_idle();
        schedule_sweep();
    });
}

HttpResponse RelayServer::handle_request(const HttpRequest& request) {
    std::string target(request.target());
    std::string path = target;
    std::string query;

    auto question = target.find('?');
    if (question != std::string::npos) {
        path = target.substr(0, question);
        query = target.substr(question + 1);
    }

    LOG_DEBUG("{} {}", std::string(request.method_string()), target);

    if (request.method() == http::verb::options) {
        return make_response(request, http::status::no_content, "");
    }

    if (path == "/api/health" && request.method() == http::verb::get) {
        return handle_health(request);
    }
    if (path == "/api/session/create" && request.method() == http::verb::post) {
        return handle_create(request);
    }

    // /api/session/{id}/join, /api/session/{id}/signal/{send|receive}
    auto segments = StringUtils::split(path, '/');
    if (segments.size() >= 5 && segments[0].empty() && segments[1] == "api" && segments[2] == "session") {
        auto session_id = StringUtils::path_decode(segments[3]);
        if (!session_id || session_id->empty()) {
            return make_error(request, core::Result(core::ErrorCode::MALFORMED_PAYLOAD, "Invalid session id"));
        }

        if (segments.size() == 5 && segments[4] == "join" && request.method() == http::verb::post) {
            return handle_join(request, *session_id);
        }
        if (segments.size() == 6 && segments[4] == "signal") {
            if (segments[5] == "send" && request.method() == http::verb::post) {
                return handle_send(request, *session_id, query);
            }
            if (segments[5] == "receive" && request.method() == http::verb::get) {
                return handle_receive(request, *session_id, query);
            }
        }
    }

    nlohmann::json body = {{"error", "not_found"}, {"message", "No route for " + path}};
    return make_response(request, http::status::not_found, body.dump());
}

HttpResponse RelayServer::make_response(const HttpRequest& request, http::status status, std::string body) const {
    HttpResponse response{status, request.version()};
    response.set(http::field::server, BOOST_BEAST_VERSION_STRING);
    response.set(http::field::access_control_allow_origin, "*");
    response.set(http::field::access_control_allow_methods, "GET, POST, OPTIONS");
    response.set(http::field::access_control_allow_headers, "Content-Type");
    if (!body.empty()) {
        response.set(http::field::content_type, "application/json");
    }
    response.keep_alive(request.keep_alive());
    response.body() = std::move(body);
    response.prepare_payload();
    return response;
}

HttpResponse RelayServer::make_error(const HttpRequest& request, const core::Result& result) const {
    nlohmann::json body = {
        {"error", core::to_string(result.error)},
        {"message", result.message}
    };
    return make_response(request, status_for(result.error), body.dump());
}

HttpResponse RelayServer::handle_create(const HttpRequest& request) {
    auto session_id = relay_.create_session();
    nlohmann::json body = {{"session_id", session_id}};
    return make_response(request, http::status::ok, body.dump());
}

HttpResponse RelayServer::handle_join(const HttpRequest& request, const std::string& session_id) {
    auto result = relay_.join_session(session_id);
    if (!result) {
        return make_error(request, result);
    }
    return make_response(request, http::status::ok, "{}");
}

HttpResponse RelayServer::handle_send(const HttpRequest& request, const std::string& session_id,
                                      const std::string& query) {
    bool valid = true;
    auto sender = role_from_query(query, PeerRole::INITIATOR, valid);
    if (!valid || !sender) {
        return make_error(request, core::Result(core::ErrorCode::MALFORMED_PAYLOAD, "Invalid role"));
    }

    auto message = decode_message(request.body());
    if (!message) {
        return make_error(request, core::Result(core::ErrorCode::MALFORMED_PAYLOAD, "Invalid signaling message"));
    }

    auto result = relay_.send(session_id, *sender, std::move(*message));
    if (!result) {
        return make_error(request, result);
    }
    return make_response(request, http::status::ok, "{}");
}

HttpResponse RelayServer::handle_receive(const HttpRequest& request, const std::string& session_id,
                                         const std::string& query) {
    bool valid = true;
    auto role = role_from_query(query, PeerRole::JOINER, valid);
    if (!valid || !role) {
        return make_error(request, core::Result(core::ErrorCode::MALFORMED_PAYLOAD, "Invalid role"));
    }

    std::vector<SignalingMessage> messages;
    auto result = relay_.receive(session_id, *role, messages);
    if (!result) {
        return make_error(request, result);
    }
    return make_response(request, http::status::ok, encode_messages(messages));
}

HttpResponse RelayServer::handle_health(const HttpRequest& request) {
    nlohmann::json body = {
        {"status", "ok"},
        {"sessions", relay_.session_count()}
    };
    return make_response(request, http::status::ok, body.dump());
}

}
