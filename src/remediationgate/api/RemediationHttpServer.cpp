#include "api/RemediationHttpServer.hpp"

#include "easylogging++.h"

#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/thread_pool.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>

#include <chrono>
#include <memory>
#include <thread>

namespace asio = boost::asio;
namespace beast = boost::beast;
namespace http = beast::http;
using tcp = asio::ip::tcp;

namespace api {

namespace {
constexpr std::uint64_t kMaxRequestBytes = 4 * 1024 * 1024;

void ServeConnection(tcp::socket& socket, DecisionEndpoints& endpoints) {
    beast::flat_buffer buffer;
    http::request_parser<http::string_body> parser;
    parser.body_limit(kMaxRequestBytes);

    beast::error_code ec;
    http::read(socket, buffer, parser, ec);

    HttpReply reply;
    unsigned version = 11;
    if (ec == http::error::body_limit) {
        reply = ErrorReply(413, "input_error", "request body exceeds " + std::to_string(kMaxRequestBytes) + " bytes");
    } else if (ec) {
        VLOG(1) << "Dropping connection with unreadable request: " << ec.message();
        return;
    } else {
        const auto& req = parser.get();
        version = req.version();
        const auto method = req.method_string();
        const auto target = req.target();
        reply = RouteRequest(endpoints, std::string(method.data(), method.size()),
            std::string(target.data(), target.size()), req.body());
        VLOG(1) << req.method_string() << " " << req.target() << " -> " << reply.status;
    }

    http::response<http::string_body> res;
    res.version(version);
    res.result(reply.status);
    res.set(http::field::server, "remediationgate");
    res.set(http::field::content_type, "application/json");
    res.keep_alive(false);
    res.body() = std::move(reply.body);
    res.prepare_payload();

    http::write(socket, res, ec);
    if (ec) {
        VLOG(1) << "Failed to write response: " << ec.message();
        return;
    }

    socket.shutdown(tcp::socket::shutdown_send, ec);
    if (ec && ec != beast::errc::not_connected) {
        VLOG(1) << "Shutdown after response reported: " << ec.message();
    }
}

} // namespace

HttpReply RouteRequest(
    DecisionEndpoints& endpoints, const std::string& method, const std::string& target, const std::string& body) {
    const auto path = target.substr(0, target.find('?'));

    if (path == "/recommend") {
        return method == "POST" ? endpoints.Recommend(body)
                                : ErrorReply(405, "method_not_allowed", "use POST for /recommend");
    }
    if (path == "/batch") {
        return method == "POST" ? endpoints.Batch(body) : ErrorReply(405, "method_not_allowed", "use POST for /batch");
    }
    if (path == "/health") {
        return method == "GET" ? endpoints.Health() : ErrorReply(405, "method_not_allowed", "use GET for /health");
    }

    return ErrorReply(404, "not_found", "no route for " + path);
}

RemediationHttpServer::RemediationHttpServer(
    std::string address, uint16_t port, bool bindToIp, DecisionEndpoints* endpoints, uint32_t workers)
    : address_{std::move(address)}
    , port_{port}
    , bindToIp_{bindToIp}
    , endpoints_{endpoints}
    , workers_{workers == 0 ? 1 : workers} {}

void RemediationHttpServer::Run() {
    asio::io_context ioc;
    tcp::endpoint endpoint = bindToIp_ ? tcp::endpoint{asio::ip::make_address(address_), port_}
                                       : tcp::endpoint{tcp::v4(), port_};

    tcp::acceptor acceptor{ioc};
    acceptor.open(endpoint.protocol());
    acceptor.set_option(tcp::acceptor::reuse_address(true));
    acceptor.bind(endpoint);
    acceptor.listen();
    acceptor.non_blocking(true);

    asio::thread_pool pool{workers_};

    LOG(INFO) << "Listening for decision requests on " << endpoint.address().to_string() << ":" << port_;

    while (running_.load()) {
        auto socket = std::make_shared<tcp::socket>(ioc);
        beast::error_code ec;
        acceptor.accept(*socket, ec);

        if (ec == asio::error::would_block || ec == asio::error::try_again) {
            std::this_thread::sleep_for(std::chrono::milliseconds(50));
            continue;
        }
        if (ec) {
            LOG(WARNING) << "Accept failed: " << ec.message();
            continue;
        }

        asio::post(pool, [socket, this]() {
            try {
                ServeConnection(*socket, *endpoints_);
            } catch (const std::exception& e) {
                LOG(ERROR) << "Connection handler failed: " << e.what();
            }
        });
    }

    LOG(INFO) << "Listener stopped; waiting for in-flight requests";
    pool.join();
}

void RemediationHttpServer::Stop() {
    running_ = false;
}

} // namespace api
