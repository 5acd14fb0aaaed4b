#include "peerdrop/signaling/http_signaling_client.hpp"
#include "peerdrop/core/logger.hpp"
#include "peerdrop/core/utils.hpp"
#include <utility> // Boost 1.74 awaitable.hpp uses std::exchange without including it
#include <boost/asio.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/version.hpp>
#include <nlohmann/json.hpp>
#include <functional>
#include <memory>

namespace peerdrop::signaling {

namespace beast = boost::beast;
namespace http = beast::http;
namespace net = boost::asio;
using tcp = net::ip::tcp;
using core::utils::StringUtils;

HttpSignalingOptions HttpSignalingOptions::from_config(const core::Config& config) {
    HttpSignalingOptions options;
    options.url = config.get_string("signaling.url", options.url);
    options.timeout = std::chrono::milliseconds(
        config.get_int("signaling.timeout_ms", static_cast<int>(options.timeout.count())));
    return options;
}

std::optional<RelayEndpoint> RelayEndpoint::parse(const std::string& url) {
    const std::string scheme = "http://";
    if (!StringUtils::starts_with(StringUtils::to_lower(url), scheme)) {
        return std::nullopt;
    }

    auto rest = url.substr(scheme.size());
    RelayEndpoint endpoint;

    auto slash = rest.find('/');
    auto authority = rest.substr(0, slash);
    if (slash != std::string::npos) {
        endpoint.prefix = rest.substr(slash);
        while (!endpoint.prefix.empty() && endpoint.prefix.back() == '/') {
            endpoint.prefix.pop_back();
        }
    }

    auto colon = authority.rfind(':');
    if (colon != std::string::npos) {
        endpoint.host = authority.substr(0, colon);
        endpoint.port = authority.substr(colon + 1);
        if (endpoint.port.empty() ||
            endpoint.port.find_first_not_of("0123456789") != std::string::npos) {
            return std::nullopt;
        }
    } else {
        endpoint.host = authority;
    }

    if (endpoint.host.empty()) {
        return std::nullopt;
    }
    return endpoint;
}

namespace {

// One relay round trip. Keeps itself alive through its pending operations
// and reports exactly once.
class RelayExchange : public std::enable_shared_from_this<RelayExchange> {
public:
    using Response = http::response<http::string_body>;
    using Handler = std::function<void(beast::error_code, Response)>;

    RelayExchange(net::io_context& io_context, http::request<http::string_body> request,
                  std::chrono::milliseconds timeout, Handler handler)
        : resolver_(io_context)
        , stream_(io_context)
        , deadline_(io_context)
        , request_(std::move(request))
        , timeout_(timeout)
        , handler_(std::move(handler)) {}

    void start(const std::string& host, const std::string& port) {
        deadline_.expires_after(timeout_);
        deadline_.async_wait([self = shared_from_this()](beast::error_code ec) {
            self->on_deadline(ec);
        });

        resolver_.async_resolve(host, port,
            [self = shared_from_this()](beast::error_code ec, tcp::resolver::results_type results) {
                self->on_resolve(ec, std::move(results));
            });
    }

private:
    void on_resolve(beast::error_code ec, tcp::resolver::results_type results) {
        if (ec || timed_out_) {
            finish(ec);
            return;
        }
        stream_.async_connect(results, [self = shared_from_this()](beast::error_code ec, const tcp::endpoint&) {
            self->on_connect(ec);
        });
    }

    void on_connect(beast::error_code ec) {
        if (ec || timed_out_) {
            finish(ec);
            return;
        }
        http::async_write(stream_, request_, [self = shared_from_this()](beast::error_code ec, std::size_t) {
            self->on_write(ec);
        });
    }

    void on_write(beast::error_code ec) {
        if (ec || timed_out_) {
            finish(ec);
            return;
        }
        http::async_read(stream_, buffer_, response_, [self = shared_from_this()](beast::error_code ec, std::size_t) {
            self->finish(ec);
        });
    }

    void on_deadline(beast::error_code ec) {
        if (ec || finished_) {
            return;
        }
        // Whatever step is pending completes with operation_aborted
        timed_out_ = true;
        resolver_.cancel();
        stream_.cancel();
    }

    void finish(beast::error_code ec) {
        if (finished_) {
            return;
        }
        finished_ = true;
        deadline_.cancel();
        if (timed_out_) {
            ec = net::error::timed_out;
        }

        beast::error_code ignored;
        stream_.socket().shutdown(tcp::socket::shutdown_both, ignored);
        stream_.close();

        auto handler = std::move(handler_);
        handler(ec, std::move(response_));
    }

    tcp::resolver resolver_;
    beast::tcp_stream stream_;
    net::steady_timer deadline_;
    beast::flat_buffer buffer_;
    http::request<http::string_body> request_;
    Response response_;
    std::chrono::milliseconds timeout_;
    Handler handler_;
    bool timed_out_ = false;
    bool finished_ = false;
};

}

HttpSignalingClient::HttpSignalingClient(net::io_context& io_context, HttpSignalingOptions options)
    : io_context_(io_context)
    , options_(std::move(options))
    , endpoint_(RelayEndpoint::parse(options_.url)) {

    if (!endpoint_) {
        LOG_ERROR("Invalid relay URL '{}'", options_.url);
    }
}

void HttpSignalingClient::async_create_session(SessionHandler handler) {
    perform(http::verb::post, "/api/session/create", "",
        [handler = std::move(handler)](core::Result result, std::string body) {
            if (!result) {
                handler(std::move(result), std::string());
                return;
            }

            std::string session_id;
            try {
                session_id = nlohmann::json::parse(body).at("session_id").get<std::string>();
            } catch (const nlohmann::json::exception& e) {
                handler(core::Result(core::ErrorCode::MALFORMED_PAYLOAD,
                                     std::string("Unexpected create response: ") + e.what()),
                        std::string());
                return;
            }
            handler(core::Result(), std::move(session_id));
        });
}

void HttpSignalingClient::async_join_session(const std::string& session_id, ResultHandler handler) {
    perform(http::verb::post, "/api/session/" + StringUtils::url_encode(session_id) + "/join", "",
        [handler = std::move(handler)](core::Result result, std::string) {
            handler(std::move(result));
        });
}

void HttpSignalingClient::async_send(const std::string& session_id, PeerRole sender,
                                     const SignalingMessage& message, ResultHandler handler) {
    auto target = "/api/session/" + StringUtils::url_encode(session_id) +
                  "/signal/send?role=" + to_string(sender);
    perform(http::verb::post, target, encode_message(message),
        [handler = std::move(handler)](core::Result result, std::string) {
            handler(std::move(result));
        });
}

void HttpSignalingClient::async_receive(const std::string& session_id, PeerRole role,
                                        MessagesHandler handler) {
    auto target = "/api/session/" + StringUtils::url_encode(session_id) +
                  "/signal/receive?role=" + to_string(role);
    perform(http::verb::get, target, "",
        [handler = std::move(handler)](core::Result result, std::string body) {
            if (!result) {
                handler(std::move(result), {});
                return;
            }

            auto messages = decode_messages(body);
            if (!messages) {
                handler(core::Result(core::ErrorCode::MALFORMED_PAYLOAD, "Unexpected receive response"), {});
                return;
            }
            handler(core::Result(), std::move(*messages));
        });
}

void HttpSignalingClient::perform(http::verb method, const std::string& target,
                                  const std::string& body, BodyHandler handler) {
    if (!endpoint_) {
        net::post(io_context_, [handler = std::move(handler), url = options_.url]() {
            handler(core::Result(core::ErrorCode::TRANSPORT_ERROR, "Invalid relay URL '" + url + "'"),
                    std::string());
        });
        return;
    }

    http::request<http::string_body> request{method, endpoint_->prefix + target, 11};
    request.set(http::field::host, endpoint_->host);
    request.set(http::field::user_agent, BOOST_BEAST_VERSION_STRING);
    if (!body.empty()) {
        request.set(http::field::content_type, "application/json");
        request.body() = body;
    }
    request.prepare_payload();

    auto label = std::string(http::to_string(method)) + " " + target;
    auto exchange = std::make_shared<RelayExchange>(io_context_, std::move(request), options_.timeout,
        [handler = std::move(handler), label](beast::error_code ec, RelayExchange::Response response) {
            if (ec) {
                LOG_DEBUG("{} failed: {}", label, ec.message());
                handler(core::Result(core::ErrorCode::TRANSPORT_ERROR, "Relay request failed: " + ec.message()),
                        std::string());
                return;
            }

            auto status = response.result_int();
            if (status != 200) {
                handler(error_from_response(status, response.body()), response.body());
                return;
            }
            handler(core::Result(), std::move(response.body()));
        });
    exchange->start(endpoint_->host, endpoint_->port);
}

core::Result HttpSignalingClient::error_from_response(unsigned status, const std::string& body) {
    std::string message = "HTTP " + std::to_string(status);
    try {
        auto j = nlohmann::json::parse(body);
        if (j.is_object() && j.contains("message")) {
            message = j["message"].get<std::string>();
        }
    } catch (const nlohmann::json::exception&) {
        // Keep the status line as message
    }

    switch (status) {
        case 404: return core::Result(core::ErrorCode::SESSION_NOT_FOUND, message);
        case 409: return core::Result(core::ErrorCode::SESSION_FULL, message);
        case 400: return core::Result(core::ErrorCode::MALFORMED_PAYLOAD, message);
        default: return core::Result(core::ErrorCode::TRANSPORT_ERROR, message);
    }
}

}
