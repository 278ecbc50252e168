#pragma once

#include "audit/AuditLog.hpp"

#include <sys/types.h>

#include <cstdint>
#include <mutex>
#include <string>

namespace audit {

// NDJSON audit file, one sealed entry per line. The file is opened with
// O_APPEND and every line is flushed with fsync before Append() returns. A
// failed write or fsync truncates the file back to its previous length, so the
// chain state in memory always matches the last complete line on disk.
class FileAuditLog final : public IAuditLog {
public:
    // Creates the file (mode 0600) and missing parent directories, then
    // resumes the chain from the last line. Throws
    // RemediationResultException(AUDIT_WRITE_FAILED) if the file cannot be
    // opened or its last line is not a complete entry.
    explicit FileAuditLog(std::string path);
    ~FileAuditLog() override;

    FileAuditLog(const FileAuditLog&) = delete;
    FileAuditLog& operator=(const FileAuditLog&) = delete;

    void Append(const DecisionRecord& record) override;
    ChainVerification VerifyChain() override;
    std::string SinkName() const override;

    uint64_t LastSequence() const;

private:
    void ResumeChain();
    void Rewind(off_t offset);

    std::string path_;
    int fd_ = -1;
    mutable std::mutex mutex_;
    uint64_t lastSequence_ = 0;
    std::string lastHash_;
    bool unusable_ = false;
};

} // namespace audit
