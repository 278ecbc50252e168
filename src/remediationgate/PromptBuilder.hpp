#pragma once

#include <string>

struct ThreatRecord;

struct Prompt {
    std::string systemInstructions;
    std::string userContent;
};

// Deterministic; embeds the complete threat record. Throws
// RemediationResultException(INPUT_INVALID) if the record cannot be serialized.
Prompt BuildPrompt(const ThreatRecord& threat);
