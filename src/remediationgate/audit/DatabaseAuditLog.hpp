#pragma once

#include "audit/AuditLog.hpp"

#include <cstdint>
#include <memory>
#include <mutex>
#include <string>

class IDatabaseConnection;

namespace audit {

// Audit chain stored in the decision_audit table, one transaction per entry.
class DatabaseAuditLog final : public IAuditLog {
public:
    // Validates the schema and resumes the chain from the highest sequence.
    explicit DatabaseAuditLog(std::unique_ptr<IDatabaseConnection> db);
    ~DatabaseAuditLog() override;

    void Append(const DecisionRecord& record) override;
    ChainVerification VerifyChain() override;
    std::string SinkName() const override;

    uint64_t LastSequence() const;

private:
    void ResumeChain();

    std::unique_ptr<IDatabaseConnection> db_;
    mutable std::mutex mutex_;
    uint64_t lastSequence_ = 0;
    std::string lastHash_;
};

} // namespace audit
