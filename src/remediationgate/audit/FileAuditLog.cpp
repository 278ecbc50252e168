#include "audit/FileAuditLog.hpp"

#include "audit/AuditChain.hpp"
#include "DecisionRecord.hpp"
#include "RemediationResult.hpp"

#include "easylogging++.h"

#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <utility>

namespace audit {

namespace {

[[noreturn]] void ThrowAuditError(const std::string& message) {
    throw RemediationResultException(RemediationResultCode::AUDIT_WRITE_FAILED, message);
}

std::string ErrnoText(int error) {
    return std::strerror(error);
}

} // namespace

FileAuditLog::FileAuditLog(std::string path)
    : path_{std::move(path)}
    , lastHash_{kGenesisHash} {
    const auto parent = std::filesystem::path{path_}.parent_path();
    if (!parent.empty()) {
        std::error_code ec;
        std::filesystem::create_directories(parent, ec);
        if (ec) {
            ThrowAuditError("cannot create audit directory " + parent.string() + ": " + ec.message());
        }
    }

    fd_ = ::open(path_.c_str(), O_WRONLY | O_CREAT | O_APPEND | O_CLOEXEC, S_IRUSR | S_IWUSR);
    if (fd_ < 0) {
        ThrowAuditError("cannot open audit log " + path_ + ": " + ErrnoText(errno));
    }

    try {
        ResumeChain();
    } catch (...) {
        ::close(fd_);
        fd_ = -1;
        throw;
    }

    LOG(INFO) << "Audit log " << path_ << " opened at sequence " << lastSequence_;
}

FileAuditLog::~FileAuditLog() {
    if (fd_ >= 0) {
        ::close(fd_);
    }
}

void FileAuditLog::ResumeChain() {
    std::ifstream in{path_, std::ios::binary};
    if (!in) {
        ThrowAuditError("cannot read audit log " + path_);
    }

    std::string content{std::istreambuf_iterator<char>{in}, std::istreambuf_iterator<char>{}};
    if (content.empty()) {
        return;
    }
    if (content.back() != '\n') {
        ThrowAuditError("audit log " + path_ + " ends with a partial record; repair it before restarting");
    }

    content.pop_back();
    const auto lineStart = content.find_last_of('\n');
    const std::string lastLine = lineStart == std::string::npos ? content : content.substr(lineStart + 1);

    try {
        const auto entry = SealedEntryFromJson(nlohmann::ordered_json::parse(lastLine));
        lastSequence_ = entry.sequence;
        lastHash_ = entry.recordHash;
    } catch (const std::exception& e) {
        ThrowAuditError("audit log " + path_ + " has an unreadable last entry: " + e.what());
    }
}

void FileAuditLog::Append(const DecisionRecord& record) {
    std::lock_guard<std::mutex> lock(mutex_);

    if (unusable_) {
        ThrowAuditError("audit log " + path_ + " holds a partial record from an earlier failure; repair it before restarting");
    }

    SealedEntry entry;
    std::string line;
    try {
        entry = SealEntry(lastSequence_ + 1, record, lastHash_);
        line = DumpCompact(ToJson(entry)) + "\n";
    } catch (const std::exception& e) {
        ThrowAuditError(std::string{"cannot seal audit entry: "} + e.what());
    }

    const off_t offset = ::lseek(fd_, 0, SEEK_END);
    if (offset < 0) {
        ThrowAuditError("cannot locate end of audit log " + path_ + ": " + ErrnoText(errno));
    }

    ssize_t written;
    do {
        written = ::write(fd_, line.data(), line.size());
    } while (written < 0 && errno == EINTR);

    if (written < 0) {
        const int error = errno;
        Rewind(offset);
        ThrowAuditError("audit write to " + path_ + " failed: " + ErrnoText(error));
    }
    if (static_cast<size_t>(written) != line.size()) {
        Rewind(offset);
        ThrowAuditError("audit write to " + path_ + " was truncated after " + std::to_string(written) + " bytes");
    }
    if (::fsync(fd_) != 0) {
        const int error = errno;
        Rewind(offset);
        ThrowAuditError("audit fsync of " + path_ + " failed: " + ErrnoText(error));
    }

    lastSequence_ = entry.sequence;
    lastHash_ = entry.recordHash;
}

// Cuts the file back to the end of the last complete entry. If that fails the
// tail is unknown and no further entry may be chained onto it.
void FileAuditLog::Rewind(off_t offset) {
    int result;
    do {
        result = ::ftruncate(fd_, offset);
    } while (result != 0 && errno == EINTR);

    if (result != 0) {
        unusable_ = true;
        LOG(ERROR) << "Cannot remove failed entry from audit log " << path_ << ": " << ErrnoText(errno)
                   << "; refusing further appends";
        return;
    }

    if (::fsync(fd_) != 0) {
        LOG(WARNING) << "fsync after removing failed entry from audit log " << path_ << " failed: " << ErrnoText(errno);
    }
}

ChainVerification FileAuditLog::VerifyChain() {
    std::lock_guard<std::mutex> lock(mutex_);

    ChainVerifier verifier;
    std::ifstream in{path_, std::ios::binary};
    if (!in) {
        verifier.Fail(1, "cannot read audit log " + path_);
        return verifier.Result();
    }

    std::string line;
    uint64_t lineNumber = 0;
    while (std::getline(in, line) && verifier.Result().intact) {
        ++lineNumber;
        try {
            verifier.Next(SealedEntryFromJson(nlohmann::ordered_json::parse(line)));
        } catch (const std::exception& e) {
            verifier.Fail(lineNumber, std::string{"unreadable entry: "} + e.what());
        }
    }

    return verifier.Result();
}

std::string FileAuditLog::SinkName() const { return "file:" + path_; }

uint64_t FileAuditLog::LastSequence() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return lastSequence_;
}

} // namespace audit
