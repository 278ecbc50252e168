#include "catch.hpp"

#include "TestDoubles.hpp"

#include "audit/AuditChain.hpp"
#include "audit/FileAuditLog.hpp"

#include <sys/resource.h>

#include <algorithm>
#include <csignal>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <sstream>
#include <thread>
#include <vector>

namespace {

std::string ReadAll(const std::string& path) {
    std::ifstream in{path, std::ios::binary};
    return std::string{std::istreambuf_iterator<char>{in}, std::istreambuf_iterator<char>{}};
}

void WriteAll(const std::string& path, const std::string& content) {
    std::ofstream out{path, std::ios::binary | std::ios::trunc};
    out << content;
}

size_t CountLines(const std::string& content) {
    return static_cast<size_t>(std::count(content.begin(), content.end(), '\n'));
}

// Lowers the soft file size limit of the process so the next write past it
// comes back short, and puts the old limit back on destruction.
class FileSizeLimit {
public:
    explicit FileSizeLimit(rlim_t bytes) {
        previousHandler_ = std::signal(SIGXFSZ, SIG_IGN);
        REQUIRE(::getrlimit(RLIMIT_FSIZE, &previous_) == 0);
        rlimit lowered = previous_;
        lowered.rlim_cur = bytes;
        REQUIRE(::setrlimit(RLIMIT_FSIZE, &lowered) == 0);
    }

    ~FileSizeLimit() {
        ::setrlimit(RLIMIT_FSIZE, &previous_);
        std::signal(SIGXFSZ, previousHandler_);
    }

private:
    rlimit previous_{};
    void (*previousHandler_)(int) = SIG_DFL;
};

} // namespace

SCENARIO("the file audit log appends one sealed line per record", "[audit]") {
    ScratchDirectory scratch;
    const auto path = scratch.File("nested/dir/audit.log");

    audit::FileAuditLog log{path};
    log.Append(MakeDecision("pup-017", false, true));
    log.Append(MakeDecision("malware-001", true, false));

    REQUIRE(log.LastSequence() == 2);
    REQUIRE(log.SinkName() == "file:" + path);

    std::istringstream lines{ReadAll(path)};
    std::string line;
    std::vector<nlohmann::ordered_json> entries;
    while (std::getline(lines, line)) {
        entries.push_back(nlohmann::ordered_json::parse(line));
    }

    REQUIRE(entries.size() == 2);
    REQUIRE(entries[0]["sequence"] == 1);
    REQUIRE(entries[0]["previous_hash"] == audit::kGenesisHash);
    REQUIRE(entries[0]["notes"].is_null());
    REQUIRE(entries[1]["threat_id"] == "malware-001");
    REQUIRE(entries[1]["previous_hash"] == entries[0]["record_hash"]);

    auto verification = log.VerifyChain();
    REQUIRE(verification.intact);
    REQUIRE(verification.entriesChecked == 2);

    const auto perms = std::filesystem::status(path).permissions();
    REQUIRE((perms & (std::filesystem::perms::group_all | std::filesystem::perms::others_all))
        == std::filesystem::perms::none);
}

SCENARIO("a reopened file audit log continues the chain", "[audit]") {
    ScratchDirectory scratch;
    const auto path = scratch.File("audit.log");

    {
        audit::FileAuditLog log{path};
        log.Append(MakeDecision("first", false, true));
        log.Append(MakeDecision("second", false, true));
    }

    audit::FileAuditLog reopened{path};
    REQUIRE(reopened.LastSequence() == 2);

    reopened.Append(MakeDecision("third", false, true));
    REQUIRE(reopened.LastSequence() == 3);

    auto verification = reopened.VerifyChain();
    REQUIRE(verification.intact);
    REQUIRE(verification.entriesChecked == 3);
}

SCENARIO("an edited entry breaks the chain", "[audit]") {
    ScratchDirectory scratch;
    const auto path = scratch.File("audit.log");

    audit::FileAuditLog log{path};
    log.Append(MakeDecision("pup-017", false, true));
    log.Append(MakeDecision("malware-001", true, false));
    log.Append(MakeDecision("pup-018", false, true));

    auto content = ReadAll(path);
    const auto flag = content.find("\"approved\":false");
    REQUIRE(flag != std::string::npos);
    content.replace(flag, std::string{"\"approved\":false"}.size(), "\"approved\":true");
    WriteAll(path, content);

    auto verification = log.VerifyChain();
    REQUIRE_FALSE(verification.intact);
    REQUIRE(verification.firstBrokenSequence == 2);
    REQUIRE(verification.entriesChecked == 1);
}

SCENARIO("a partial last line keeps the log closed", "[audit]") {
    ScratchDirectory scratch;
    const auto path = scratch.File("audit.log");

    {
        audit::FileAuditLog log{path};
        log.Append(MakeDecision("pup-017", false, true));
    }

    WriteAll(path, ReadAll(path) + "{\"sequence\":2,\"timest");

    try {
        audit::FileAuditLog reopened{path};
        FAIL("expected the partial record to be refused");
    } catch (const RemediationResultException& e) {
        REQUIRE(e.Code() == RemediationResultCode::AUDIT_WRITE_FAILED);
    }
}

SCENARIO("the hash covers every payload field", "[audit]") {
    auto record = MakeDecision("malware-001", true, false);
    auto sealed = audit::SealEntry(1, record, audit::kGenesisHash);

    REQUIRE(sealed.recordHash.size() == 64);
    REQUIRE(audit::ComputeRecordHash(audit::kGenesisHash, sealed.payload) == sealed.recordHash);

    auto altered = sealed.payload;
    altered["notes"] = nullptr;
    REQUIRE(audit::ComputeRecordHash(audit::kGenesisHash, altered) != sealed.recordHash);

    auto restored = audit::SealedEntryFromJson(audit::ToJson(sealed));
    REQUIRE(restored.sequence == 1);
    REQUIRE(restored.recordHash == sealed.recordHash);
    REQUIRE(audit::ComputeRecordHash(restored.previousHash, restored.payload) == sealed.recordHash);
}

SCENARIO("a failed append leaves no partial line behind", "[audit]") {
    ScratchDirectory scratch;
    const auto path = scratch.File("audit.log");

    GIVEN("a log with one entry") {
        audit::FileAuditLog log{path};
        log.Append(MakeDecision("pup-017", false, true));
        const auto before = ReadAll(path);

        WHEN("the next write only gets part of the line onto disk") {
            {
                FileSizeLimit limit{static_cast<rlim_t>(before.size() + 16)};
                try {
                    log.Append(MakeDecision("malware-001", true, false));
                    FAIL("expected the short write to be reported");
                } catch (const RemediationResultException& e) {
                    REQUIRE(e.Code() == RemediationResultCode::AUDIT_WRITE_FAILED);
                }
            }

            THEN("the file is cut back to the last complete entry") {
                REQUIRE(ReadAll(path) == before);
                REQUIRE(log.LastSequence() == 1);
            }

            THEN("the next append continues the chain and survives a reopen") {
                log.Append(MakeDecision("pup-018", false, true));
                REQUIRE(log.LastSequence() == 2);

                audit::FileAuditLog reopened{path};
                REQUIRE(reopened.LastSequence() == 2);

                auto verification = reopened.VerifyChain();
                REQUIRE(verification.intact);
                REQUIRE(verification.entriesChecked == 2);
            }
        }
    }
}

SCENARIO("concurrent appends to one file never interleave", "[audit]") {
    constexpr size_t kThreads = 8;
    constexpr size_t kAppendsPerThread = 25;

    ScratchDirectory scratch;
    const auto path = scratch.File("audit.log");
    audit::FileAuditLog log{path};

    std::vector<std::thread> writers;
    for (size_t t = 0; t < kThreads; ++t) {
        writers.emplace_back([&log, t]() {
            for (size_t i = 0; i < kAppendsPerThread; ++i) {
                log.Append(MakeDecision("threat-" + std::to_string(t) + "-" + std::to_string(i), i % 2 == 0, i % 3 == 0));
            }
        });
    }
    for (auto& writer : writers) {
        writer.join();
    }

    const auto total = kThreads * kAppendsPerThread;
    REQUIRE(log.LastSequence() == total);
    REQUIRE(CountLines(ReadAll(path)) == total);

    auto verification = log.VerifyChain();
    REQUIRE(verification.intact);
    REQUIRE(verification.entriesChecked == total);
}
