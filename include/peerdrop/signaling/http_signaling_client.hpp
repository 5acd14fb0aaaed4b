#pragma once

#include "peerdrop/core/config.hpp"
#include "peerdrop/signaling/signaling_client.hpp"
#include <boost/asio/io_context.hpp>
#include <boost/beast/http/verb.hpp>
#include <chrono>
#include <functional>
#include <optional>
#include <string>

namespace peerdrop::signaling {

struct HttpSignalingOptions {
    std::string url = "http://127.0.0.1:8080";
    std::chrono::milliseconds timeout{5000};

    static HttpSignalingOptions from_config(const core::Config& config);
};

// Parsed "http://host[:port][/prefix]"
struct RelayEndpoint {
    std::string host;
    std::string port = "80";
    std::string prefix;

    static std::optional<RelayEndpoint> parse(const std::string& url);
};

// Relay access over HTTP/1.1 on the caller's io_context. Each call opens
// a connection and performs one request; resolving, connecting, writing
// and reading together get at most `timeout`.
class HttpSignalingClient : public SignalingClient {
public:
    HttpSignalingClient(boost::asio::io_context& io_context, HttpSignalingOptions options);

    void async_create_session(SessionHandler handler) override;
    void async_join_session(const std::string& session_id, ResultHandler handler) override;
    void async_send(const std::string& session_id, PeerRole sender,
                    const SignalingMessage& message, ResultHandler handler) override;
    void async_receive(const std::string& session_id, PeerRole role,
                       MessagesHandler handler) override;

    const HttpSignalingOptions& options() const { return options_; }

private:
    using BodyHandler = std::function<void(core::Result, std::string body)>;

    void perform(boost::beast::http::verb method, const std::string& target,
                 const std::string& body, BodyHandler handler);

    static core::Result error_from_response(unsigned status, const std::string& body);

    boost::asio::io_context& io_context_;
    HttpSignalingOptions options_;
    std::optional<RelayEndpoint> endpoint_;
};

}
