#pragma once

#include "audit/AuditLog.hpp"

#include <nlohmann/json.hpp>

#include <cstdint>
#include <string>

struct DecisionRecord;

namespace audit {

// previous_hash of the first entry in a chain.
extern const char* const kGenesisHash;

struct SealedEntry {
    uint64_t sequence = 0;
    // sequence, timestamp, threat_id, recommendation, destructive, approved, notes
    nlohmann::ordered_json payload;
    std::string previousHash;
    std::string recordHash;
};

nlohmann::ordered_json CanonicalPayload(uint64_t sequence, const DecisionRecord& record);

// Single-line form; invalid UTF-8 is replaced with U+FFFD.
std::string DumpCompact(const nlohmann::ordered_json& json);

// Lower-case hex SHA-256 over previousHash, '\n', and the compact payload.
std::string ComputeRecordHash(const std::string& previousHash, const nlohmann::ordered_json& payload);

SealedEntry SealEntry(uint64_t sequence, const DecisionRecord& record, const std::string& previousHash);

// Payload fields followed by previous_hash and record_hash.
nlohmann::ordered_json ToJson(const SealedEntry& entry);

// Throws std::invalid_argument when a field is missing or mistyped.
SealedEntry SealedEntryFromJson(const nlohmann::ordered_json& json);

// Feeds stored entries in order and remembers the first inconsistency.
class ChainVerifier {
public:
    void Next(const SealedEntry& entry);
    void Fail(uint64_t sequence, const std::string& reason);

    const ChainVerification& Result() const { return result_; }

private:
    ChainVerification result_;
    uint64_t expectedSequence_ = 1;
    std::string expectedPreviousHash_ = kGenesisHash;
};

} // namespace audit
