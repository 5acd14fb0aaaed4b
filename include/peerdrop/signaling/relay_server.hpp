#pragma once

#include "peerdrop/signaling/signaling_relay.hpp"
#include <utility> // Boost 1.74 awaitable.hpp uses std::exchange without including it
#include <boost/asio.hpp>
#include <boost/beast/http.hpp>
#include <atomic>
#include <memory>
#include <thread>
#include <vector>

namespace peerdrop::signaling {

namespace http = boost::beast::http;

using HttpRequest = http::request<http::string_body>;
using HttpResponse = http::response<http::string_body>;

// HTTP/1.1 front end of a SignalingRelay:
//   POST /api/session/create
//   POST /api/session/{id}/join
//   POST /api/session/{id}/signal/send?role=initiator|joiner
//   GET  /api/session/{id}/signal/receive?role=initiator|joiner
//   GET  /api/health
// Every response allows any origin.
class RelayServer {
public:
    RelayServer(SignalingRelay& relay, RelayOptions options);
    ~RelayServer();

    RelayServer(const RelayServer&) = delete;
    RelayServer& operator=(const RelayServer&) = delete;

    bool start();
    void stop();

    bool is_running() const { return running_; }

    // Bound port, useful when the configured port was 0
    std::uint16_t port() const { return bound_port_; }

    HttpResponse handle_request(const HttpRequest& request);

private:
    class HttpSession;

    void do_accept();
    void schedule_sweep();

    HttpResponse make_response(const HttpRequest& request, http::status status, std::string body) const;
    HttpResponse make_error(const HttpRequest& request, const core::Result& result) const;

    HttpResponse handle_create(const HttpRequest& request);
    HttpResponse handle_join(const HttpRequest& request, const std::string& session_id);
    HttpResponse handle_send(const HttpRequest& request, const std::string& session_id, const std::string& query);
    HttpResponse handle_receive(const HttpRequest& request, const std::string& session_id, const std::string& query);
    HttpResponse handle_health(const HttpRequest& request);

    SignalingRelay& relay_;
    RelayOptions options_;

    boost::asio::io_context io_context_;
    boost::asio::ip::tcp::acceptor acceptor_;
    boost::asio::steady_timer sweep_timer_;
    std::vector<std::thread> threads_;

    std::atomic<bool> running_;
    std::uint16_t bound_port_;
};

}
