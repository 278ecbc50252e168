#pragma once

#include <cstdint>
#include <string>

struct DecisionRecord;

namespace audit {

struct ChainVerification {
    bool intact = true;
    uint64_t entriesChecked = 0;
    // Sequence of the first entry that failed verification, 0 when intact.
    uint64_t firstBrokenSequence = 0;
    std::string reason;
};

// Append-only store of decision records.
//
// Append() either durably persists the whole record or throws
// RemediationResultException(AUDIT_WRITE_FAILED). Concurrent callers are
// serialized; records are never interleaved.
class IAuditLog {
public:
    virtual ~IAuditLog() = default;

    virtual void Append(const DecisionRecord& record) = 0;
    virtual ChainVerification VerifyChain() = 0;
    virtual std::string SinkName() const = 0;
};

} // namespace audit
