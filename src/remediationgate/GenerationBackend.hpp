#pragma once

#include <chrono>
#include <string>

struct Prompt;

// Text oracle producing a remediation recommendation for a prompt.
//
// Implementations must return within `timeout` or throw
// RemediationResultException(GENERATION_TIMEOUT); any other failure is reported
// as RemediationResultException(GENERATION_FAILED).
class IGenerationBackend {
public:
    virtual ~IGenerationBackend() = default;

    virtual std::string Generate(const Prompt& prompt, std::chrono::milliseconds timeout) = 0;
    virtual std::string BackendName() const = 0;
};
