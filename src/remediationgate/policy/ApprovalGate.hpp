#pragma once

#include "DecisionRecord.hpp"
#include "RemediationResult.hpp"
#include "policy/GateState.hpp"

#include <chrono>
#include <string>

class IGenerationBackend;
struct ThreatRecord;

namespace audit {
class IAuditLog;
}

namespace policy {

class DestructiveClassifier;

// Decides whether a generated recommendation may proceed.
//
// A recommendation that is not destructive is approved. A destructive one is
// approved only when the caller asserted prior confirmation at submission;
// otherwise it is denied. Every call appends exactly one record to the audit
// log before returning or throwing:
//
//   * denial             -> returns the record with approved == false
//   * generation failure -> logs {destructive=false, approved=false, notes},
//                           throws GENERATION_FAILED or GENERATION_TIMEOUT
//   * bad threat data    -> logs the failure, throws INPUT_INVALID
//   * audit failure      -> throws AUDIT_WRITE_FAILED, nothing is approved
class ApprovalGate {
public:
    ApprovalGate(IGenerationBackend* backend, audit::IAuditLog* auditLog, const DestructiveClassifier* classifier,
        std::chrono::milliseconds generationTimeout);

    DecisionRecord Decide(const ThreatRecord& threat, bool priorConfirmation);

    std::chrono::milliseconds GenerationTimeout() const { return generationTimeout_; }

private:
    void Transition(const std::string& threatId, GateState state) const;
    [[noreturn]] void LogFailureAndThrow(const ThreatRecord& threat, RemediationResultCode code, const std::string& notes);
    void Commit(const DecisionRecord& record);

    IGenerationBackend* backend_;
    audit::IAuditLog* auditLog_;
    const DestructiveClassifier* classifier_;
    std::chrono::milliseconds generationTimeout_;
};

} // namespace policy
