#pragma once

#include "GenerationBackend.hpp"

#include <cstdint>
#include <string>

enum class ChatApi {
    Native,
    OpenAiCompatible,
};

ChatApi ParseChatApi(const std::string& name);

// Chat completion against an Ollama server over plain HTTP/1.1.
class OllamaGenerationBackend final : public IGenerationBackend {
public:
    OllamaGenerationBackend(std::string host, uint16_t port, std::string model, ChatApi api);

    std::string Generate(const Prompt& prompt, std::chrono::milliseconds timeout) override;
    std::string BackendName() const override;

    // GET /api/tags; throws RemediationResultException when the server is
    // unreachable or answers with a non-2xx status.
    void Ping(std::chrono::milliseconds timeout);

    std::string BuildRequestBody(const Prompt& prompt) const;

    // Extracts the assistant message; throws GENERATION_FAILED on a body
    // that does not carry one.
    std::string ParseResponseBody(const std::string& body) const;

private:
    std::string Exchange(const std::string& method, const std::string& target, const std::string& body,
        std::chrono::milliseconds timeout);

    std::string host_;
    uint16_t port_;
    std::string model_;
    ChatApi api_;
};
