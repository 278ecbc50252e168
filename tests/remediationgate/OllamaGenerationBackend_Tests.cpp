#include "catch.hpp"

#include "OllamaGenerationBackend.hpp"
#include "PromptBuilder.hpp"
#include "RemediationResult.hpp"

#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>

#include <nlohmann/json.hpp>

#include <chrono>
#include <thread>

namespace {

namespace beast = boost::beast;
namespace http = beast::http;
using tcp = boost::asio::ip::tcp;

Prompt SamplePrompt() {
    Prompt prompt;
    prompt.systemInstructions = "system text";
    prompt.userContent = "user text";
    return prompt;
}

// Serves exactly one canned response and records the request it answered.
class OneShotServer {
public:
    OneShotServer(unsigned status, std::string body)
        : acceptor_{ioc_, tcp::endpoint{boost::asio::ip::make_address("127.0.0.1"), 0}} {
        thread_ = std::thread([this, status, body]() {
            tcp::socket socket{ioc_};
            acceptor_.accept(socket);

            beast::flat_buffer buffer;
            http::request<http::string_body> req;
            http::read(socket, buffer, req);
            target_.assign(req.target().data(), req.target().size());
            requestBody_ = req.body();

            http::response<http::string_body> res{static_cast<http::status>(status), req.version()};
            res.set(http::field::content_type, "application/json");
            res.body() = body;
            res.prepare_payload();
            http::write(socket, res);

            beast::error_code ec;
            socket.shutdown(tcp::socket::shutdown_both, ec);
        });
    }

    ~OneShotServer() {
        if (thread_.joinable()) {
            thread_.join();
        }
    }

    uint16_t Port() const { return acceptor_.local_endpoint().port(); }

    void Join() { thread_.join(); }

    const std::string& Target() const { return target_; }
    const std::string& RequestBody() const { return requestBody_; }

private:
    boost::asio::io_context ioc_;
    tcp::acceptor acceptor_;
    std::thread thread_;
    std::string target_;
    std::string requestBody_;
};

RemediationResultCode FailureOf(OllamaGenerationBackend& backend, std::chrono::milliseconds timeout) {
    try {
        backend.Generate(SamplePrompt(), timeout);
    } catch (const RemediationResultException& e) {
        return e.Code();
    }
    return RemediationResultCode::SUCCESS;
}

} // namespace

SCENARIO("chat api names are parsed strictly", "[generation]") {
    REQUIRE(ParseChatApi("native") == ChatApi::Native);
    REQUIRE(ParseChatApi("openai") == ChatApi::OpenAiCompatible);
    REQUIRE_THROWS_AS(ParseChatApi("grpc"), std::invalid_argument);
}

SCENARIO("the request carries the system and user messages", "[generation]") {
    OllamaGenerationBackend backend{"127.0.0.1", 11434, "gpt-oss:20b", ChatApi::Native};

    auto request = nlohmann::json::parse(backend.BuildRequestBody(SamplePrompt()));

    REQUIRE(request["model"] == "gpt-oss:20b");
    REQUIRE(request["stream"] == false);
    REQUIRE(request["messages"].size() == 2);
    REQUIRE(request["messages"][0]["role"] == "system");
    REQUIRE(request["messages"][0]["content"] == "system text");
    REQUIRE(request["messages"][1]["role"] == "user");
    REQUIRE(request["messages"][1]["content"] == "user text");
}

SCENARIO("the assistant message is read from either api shape", "[generation]") {
    OllamaGenerationBackend native{"127.0.0.1", 11434, "m", ChatApi::Native};
    OllamaGenerationBackend openai{"127.0.0.1", 11434, "m", ChatApi::OpenAiCompatible};

    REQUIRE(native.ParseResponseBody(R"({"message":{"role":"assistant","content":"Isolate the host."},"done":true})")
        == "Isolate the host.");
    REQUIRE(openai.ParseResponseBody(R"({"choices":[{"message":{"role":"assistant","content":"Block it."}}]})")
        == "Block it.");

    REQUIRE_THROWS_AS(native.ParseResponseBody("not json"), RemediationResultException);
    REQUIRE_THROWS_AS(native.ParseResponseBody(R"({"error":"model not found"})"), RemediationResultException);
    REQUIRE_THROWS_AS(native.ParseResponseBody(R"({"message":{"content":42}})"), RemediationResultException);
    REQUIRE_THROWS_AS(openai.ParseResponseBody(R"({"choices":[]})"), RemediationResultException);
}

SCENARIO("a generation round trip over http", "[generation]") {
    OneShotServer server{200, R"({"message":{"role":"assistant","content":"Update signatures."},"done":true})"};
    OllamaGenerationBackend backend{"127.0.0.1", server.Port(), "gpt-oss:20b", ChatApi::Native};

    auto text = backend.Generate(SamplePrompt(), std::chrono::milliseconds{5000});
    server.Join();

    REQUIRE(text == "Update signatures.");
    REQUIRE(server.Target() == "/api/chat");
    REQUIRE(nlohmann::json::parse(server.RequestBody())["model"] == "gpt-oss:20b");
}

SCENARIO("a non-2xx answer is a generation error", "[generation]") {
    OneShotServer server{500, R"({"error":"out of memory"})"};
    OllamaGenerationBackend backend{"127.0.0.1", server.Port(), "m", ChatApi::Native};

    REQUIRE(FailureOf(backend, std::chrono::milliseconds{5000}) == RemediationResultCode::GENERATION_FAILED);
}

SCENARIO("a silent server is a generation timeout", "[generation]") {
    boost::asio::io_context ioc;
    tcp::acceptor silent{ioc, tcp::endpoint{boost::asio::ip::make_address("127.0.0.1"), 0}};
    OllamaGenerationBackend backend{"127.0.0.1", silent.local_endpoint().port(), "m", ChatApi::Native};

    const auto started = std::chrono::steady_clock::now();
    REQUIRE(FailureOf(backend, std::chrono::milliseconds{200}) == RemediationResultCode::GENERATION_TIMEOUT);
    REQUIRE(std::chrono::steady_clock::now() - started < std::chrono::seconds{5});
}

SCENARIO("an unreachable server is a generation error", "[generation]") {
    uint16_t closedPort;
    {
        boost::asio::io_context ioc;
        tcp::acceptor scratchAcceptor{ioc, tcp::endpoint{boost::asio::ip::make_address("127.0.0.1"), 0}};
        closedPort = scratchAcceptor.local_endpoint().port();
    }

    OllamaGenerationBackend backend{"127.0.0.1", closedPort, "m", ChatApi::Native};
    REQUIRE(FailureOf(backend, std::chrono::milliseconds{2000}) == RemediationResultCode::GENERATION_FAILED);
}
