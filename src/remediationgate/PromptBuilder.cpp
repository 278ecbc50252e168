#include "PromptBuilder.hpp"

#include "RemediationResult.hpp"
#include "ThreatRecord.hpp"

namespace {
constexpr char kSystemInstructions[] = "You are a cybersecurity assistant specialized in AV/EDR.";

constexpr char kRecommendationRequest[] =
    "Provide a concise recommendation that includes what to do, why it matters, and if it is "
    "destructive (mention 'delete', 'remove', 'kill', etc.). "
    "Return the recommendation in a single paragraph.";
} // namespace

Prompt BuildPrompt(const ThreatRecord& threat) {
    ValidateThreatRecord(threat);

    std::string threatData;
    try {
        threatData = ToJson(threat).dump(2);
    } catch (const nlohmann::json::type_error& e) {
        throw RemediationResultException(
            RemediationResultCode::INPUT_INVALID, std::string{"threat data is not serializable: "} + e.what());
    }

    Prompt prompt;
    prompt.systemInstructions = kSystemInstructions;
    prompt.userContent = "Threat Data:\n" + threatData + "\n\n" + kRecommendationRequest;
    return prompt;
}
