#include "policy/ApprovalGate.hpp"

#include "audit/AuditLog.hpp"
#include "GenerationBackend.hpp"
#include "policy/DestructiveClassifier.hpp"
#include "PromptBuilder.hpp"
#include "ThreatRecord.hpp"

#include "easylogging++.h"

namespace policy {

namespace {
constexpr char kDeniedNote[] = "Destructive action denied: caller must confirm before submission.";
constexpr char kConfirmedNote[] = "Destructive action approved on prior caller confirmation.";

std::string Trim(const std::string& text) {
    const auto first = text.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) {
        return "";
    }
    const auto last = text.find_last_not_of(" \t\r\n");
    return text.substr(first, last - first + 1);
}
} // namespace

ApprovalGate::ApprovalGate(IGenerationBackend* backend, audit::IAuditLog* auditLog,
    const DestructiveClassifier* classifier, std::chrono::milliseconds generationTimeout)
    : backend_{backend}
    , auditLog_{auditLog}
    , classifier_{classifier}
    , generationTimeout_{generationTimeout} {}

DecisionRecord ApprovalGate::Decide(const ThreatRecord& threat, bool priorConfirmation) {
    Prompt prompt;
    try {
        prompt = BuildPrompt(threat);
    } catch (const RemediationResultException& e) {
        LogFailureAndThrow(threat, e.Code(), std::string{"Invalid threat data: "} + e.what());
    }

    std::string recommendation;
    try {
        recommendation = Trim(backend_->Generate(prompt, generationTimeout_));
    } catch (const RemediationResultException& e) {
        if (e.Code() == RemediationResultCode::GENERATION_TIMEOUT) {
            LogFailureAndThrow(threat, e.Code(), std::string{"Model generation timed out: "} + e.what());
        }
        LogFailureAndThrow(
            threat, RemediationResultCode::GENERATION_FAILED, std::string{"Model generation failed: "} + e.what());
    } catch (const std::exception& e) {
        LogFailureAndThrow(
            threat, RemediationResultCode::GENERATION_FAILED, std::string{"Model generation failed: "} + e.what());
    }

    if (recommendation.empty()) {
        LogFailureAndThrow(
            threat, RemediationResultCode::GENERATION_FAILED, "Model generation failed: empty recommendation");
    }
    Transition(threat.id, GateState::Generated);

    DecisionRecord record;
    record.threatId = threat.id;
    record.recommendation = recommendation;
    record.destructive = classifier_->IsDestructive(recommendation);
    Transition(threat.id, GateState::Classified);

    if (!record.destructive) {
        Transition(threat.id, GateState::AutoApproved);
        record.approved = true;
        Transition(threat.id, GateState::Approved);
    } else {
        Transition(threat.id, GateState::PendingConfirmation);
        if (priorConfirmation) {
            record.approved = true;
            record.notes = kConfirmedNote;
            Transition(threat.id, GateState::Approved);
        } else {
            LOG(WARNING) << "Destructive action requested for threat " << threat.id << ": " << recommendation
                         << ". Awaiting manual confirmation.";
            record.approved = false;
            record.notes = kDeniedNote;
            Transition(threat.id, GateState::Denied);
        }
    }

    record.timestamp = std::chrono::system_clock::now();
    Commit(record);

    return record;
}

void ApprovalGate::Transition(const std::string& threatId, GateState state) const {
    VLOG(1) << "Threat " << threatId << " -> " << ToString(state);
}

void ApprovalGate::LogFailureAndThrow(
    const ThreatRecord& threat, RemediationResultCode code, const std::string& notes) {
    LOG(ERROR) << "Decision for threat " << threat.id << " failed: " << notes;
    Transition(threat.id, GateState::Failed);

    DecisionRecord record;
    record.threatId = threat.id;
    record.destructive = false;
    record.approved = false;
    record.notes = notes;
    record.timestamp = std::chrono::system_clock::now();
    Commit(record);

    throw RemediationResultException(code, notes);
}

void ApprovalGate::Commit(const DecisionRecord& record) {
    try {
        auditLog_->Append(record);
    } catch (const RemediationResultException& e) {
        LOG(ERROR) << "Audit append for threat " << record.threatId << " failed: " << e.what();
        throw;
    } catch (const std::exception& e) {
        LOG(ERROR) << "Audit append for threat " << record.threatId << " failed: " << e.what();
        throw RemediationResultException(RemediationResultCode::AUDIT_WRITE_FAILED, e.what());
    }

    Transition(record.threatId, GateState::Logged);
}

} // namespace policy
