#include "OllamaGenerationBackend.hpp"

#include "PromptBuilder.hpp"
#include "RemediationResult.hpp"

#include "easylogging++.h"

#include <boost/asio/connect.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>

#include <nlohmann/json.hpp>

#include <stdexcept>
#include <utility>

namespace beast = boost::beast;
namespace http = beast::http;
namespace net = boost::asio;
using tcp = net::ip::tcp;

namespace {
constexpr std::uint64_t kMaxResponseBytes = 8 * 1024 * 1024;
constexpr size_t kErrorBodyPreview = 256;

[[noreturn]] void ThrowGenerationError(const std::string& message) {
    throw RemediationResultException(RemediationResultCode::GENERATION_FAILED, message);
}

[[noreturn]] void ThrowGenerationTimeout(const std::string& message) {
    throw RemediationResultException(RemediationResultCode::GENERATION_TIMEOUT, message);
}

const char* ChatTarget(ChatApi api) {
    return api == ChatApi::Native ? "/api/chat" : "/v1/chat/completions";
}

} // namespace

ChatApi ParseChatApi(const std::string& name) {
    if (name == "native") {
        return ChatApi::Native;
    }
    if (name == "openai") {
        return ChatApi::OpenAiCompatible;
    }

    throw std::invalid_argument("unsupported generation_api '" + name + "'; expected native or openai");
}

OllamaGenerationBackend::OllamaGenerationBackend(std::string host, uint16_t port, std::string model, ChatApi api)
    : host_{std::move(host)}
    , port_{port}
    , model_{std::move(model)}
    , api_{api} {}

std::string OllamaGenerationBackend::Generate(const Prompt& prompt, std::chrono::milliseconds timeout) {
    const auto body = Exchange("POST", ChatTarget(api_), BuildRequestBody(prompt), timeout);
    return ParseResponseBody(body);
}

std::string OllamaGenerationBackend::BackendName() const {
    return "ollama:" + model_ + "@" + host_ + ":" + std::to_string(port_);
}

void OllamaGenerationBackend::Ping(std::chrono::milliseconds timeout) {
    Exchange("GET", "/api/tags", "", timeout);
}

std::string OllamaGenerationBackend::BuildRequestBody(const Prompt& prompt) const {
    nlohmann::ordered_json request;
    request["model"] = model_;
    request["messages"] = nlohmann::ordered_json::array({
        {{"role", "system"}, {"content", prompt.systemInstructions}},
        {{"role", "user"}, {"content", prompt.userContent}},
    });
    request["stream"] = false;
    return request.dump(-1, ' ', false, nlohmann::ordered_json::error_handler_t::replace);
}

std::string OllamaGenerationBackend::ParseResponseBody(const std::string& body) const {
    nlohmann::json response;
    try {
        response = nlohmann::json::parse(body);
    } catch (const nlohmann::json::parse_error& e) {
        ThrowGenerationError(std::string{"malformed response: "} + e.what());
    }

    if (!response.is_object()) {
        ThrowGenerationError("malformed response: expected a JSON object");
    }

    auto error = response.find("error");
    if (error != response.end() && !error->is_null()) {
        ThrowGenerationError("backend error: " + (error->is_string() ? error->get<std::string>() : error->dump()));
    }

    const nlohmann::json* message = nullptr;
    if (api_ == ChatApi::Native) {
        auto iter = response.find("message");
        if (iter != response.end()) {
            message = &*iter;
        }
    } else {
        auto choices = response.find("choices");
        if (choices != response.end() && choices->is_array() && !choices->empty()) {
            auto iter = choices->front().find("message");
            if (iter != choices->front().end()) {
                message = &*iter;
            }
        }
    }

    if (!message || !message->is_object()) {
        ThrowGenerationError("malformed response: no assistant message");
    }

    auto content = message->find("content");
    if (content == message->end() || !content->is_string()) {
        ThrowGenerationError("malformed response: assistant message has no text content");
    }

    return content->get<std::string>();
}

std::string OllamaGenerationBackend::Exchange(const std::string& method, const std::string& target,
    const std::string& body, std::chrono::milliseconds timeout) {
    const auto endpoint = host_ + ":" + std::to_string(port_);

    net::io_context ioc;
    tcp::resolver resolver{ioc};
    beast::tcp_stream stream{ioc};

    http::request<http::string_body> req{method == "GET" ? http::verb::get : http::verb::post, target, 11};
    req.set(http::field::host, endpoint);
    req.set(http::field::user_agent, "remediationgate/1.0");
    if (!body.empty()) {
        req.set(http::field::content_type, "application/json");
        req.body() = body;
    }
    req.prepare_payload();

    beast::flat_buffer buffer;
    http::response_parser<http::string_body> parser;
    parser.body_limit(kMaxResponseBytes);

    beast::error_code failure;
    bool finished = false;

    stream.expires_after(timeout);
    resolver.async_resolve(host_, std::to_string(port_),
        [&](beast::error_code resolveError, tcp::resolver::results_type results) {
            if (resolveError) {
                failure = resolveError;
                finished = true;
                return;
            }
            stream.async_connect(results, [&](beast::error_code connectError, const tcp::endpoint&) {
                if (connectError) {
                    failure = connectError;
                    finished = true;
                    return;
                }
                http::async_write(stream, req, [&](beast::error_code writeError, std::size_t) {
                    if (writeError) {
                        failure = writeError;
                        finished = true;
                        return;
                    }
                    http::async_read(stream, buffer, parser, [&](beast::error_code readError, std::size_t) {
                        failure = readError;
                        finished = true;
                    });
                });
            });
        });

    ioc.run_for(timeout);

    if (!finished) {
        resolver.cancel();
        stream.cancel();
        ioc.run();
        ThrowGenerationTimeout("no response from " + endpoint + " within " + std::to_string(timeout.count()) + " ms");
    }

    if (failure == beast::error::timeout) {
        ThrowGenerationTimeout("no response from " + endpoint + " within " + std::to_string(timeout.count()) + " ms");
    }
    if (failure) {
        ThrowGenerationError(endpoint + ": " + failure.message());
    }

    beast::error_code shutdownError;
    stream.socket().shutdown(tcp::socket::shutdown_both, shutdownError);
    if (shutdownError && shutdownError != beast::errc::not_connected) {
        VLOG(1) << "Shutdown of connection to " << endpoint << " reported: " << shutdownError.message();
    }

    const auto& response = parser.get();
    if (response.result_int() < 200 || response.result_int() >= 300) {
        ThrowGenerationError(endpoint + " answered HTTP " + std::to_string(response.result_int()) + ": "
            + response.body().substr(0, kErrorBodyPreview));
    }

    return response.body();
}
