#include "audit/AuditChain.hpp"

#include "DecisionRecord.hpp"

#include <openssl/evp.h>

#include <array>
#include <stdexcept>

namespace audit {

const char* const kGenesisHash = "0000000000000000000000000000000000000000000000000000000000000000";

namespace {

std::string ToHex(const unsigned char* data, unsigned int length) {
    static const std::array<char, 16> kHex = {'0', '1', '2', '3', '4', '5', '6', '7',
        '8', '9', 'a', 'b', 'c', 'd', 'e', 'f'};

    std::string out;
    out.reserve(length * 2);
    for (unsigned int i = 0; i < length; ++i) {
        out.push_back(kHex[(data[i] >> 4) & 0x0F]);
        out.push_back(kHex[data[i] & 0x0F]);
    }
    return out;
}

const nlohmann::ordered_json& Field(const nlohmann::ordered_json& json, const char* key) {
    auto iter = json.find(key);
    if (iter == json.end()) {
        throw std::invalid_argument(std::string{"audit entry is missing '"} + key + "'");
    }
    return *iter;
}

std::string TextField(const nlohmann::ordered_json& json, const char* key) {
    const auto& value = Field(json, key);
    if (!value.is_string()) {
        throw std::invalid_argument(std::string{"audit entry field '"} + key + "' must be a string");
    }
    return value.get<std::string>();
}

bool FlagField(const nlohmann::ordered_json& json, const char* key) {
    const auto& value = Field(json, key);
    if (!value.is_boolean()) {
        throw std::invalid_argument(std::string{"audit entry field '"} + key + "' must be a boolean");
    }
    return value.get<bool>();
}

} // namespace

std::string DumpCompact(const nlohmann::ordered_json& json) {
    return json.dump(-1, ' ', false, nlohmann::ordered_json::error_handler_t::replace);
}

nlohmann::ordered_json CanonicalPayload(uint64_t sequence, const DecisionRecord& record) {
    nlohmann::ordered_json payload;
    payload["sequence"] = sequence;
    payload["timestamp"] = FormatTimestamp(record.timestamp);
    payload["threat_id"] = record.threatId;
    payload["recommendation"] = record.recommendation;
    payload["destructive"] = record.destructive;
    payload["approved"] = record.approved;
    if (record.notes) {
        payload["notes"] = *record.notes;
    } else {
        payload["notes"] = nullptr;
    }
    return payload;
}

std::string ComputeRecordHash(const std::string& previousHash, const nlohmann::ordered_json& payload) {
    const std::string material = previousHash + "\n" + DumpCompact(payload);

    std::array<unsigned char, EVP_MAX_MD_SIZE> digest{};
    unsigned int digestLength = 0;
    if (EVP_Digest(material.data(), material.size(), digest.data(), &digestLength, EVP_sha256(), nullptr) != 1) {
        throw std::runtime_error("SHA-256 digest of audit entry failed");
    }

    return ToHex(digest.data(), digestLength);
}

SealedEntry SealEntry(uint64_t sequence, const DecisionRecord& record, const std::string& previousHash) {
    SealedEntry entry;
    entry.sequence = sequence;
    entry.payload = CanonicalPayload(sequence, record);
    entry.previousHash = previousHash;
    entry.recordHash = ComputeRecordHash(previousHash, entry.payload);
    return entry;
}

nlohmann::ordered_json ToJson(const SealedEntry& entry) {
    auto json = entry.payload;
    json["previous_hash"] = entry.previousHash;
    json["record_hash"] = entry.recordHash;
    return json;
}

SealedEntry SealedEntryFromJson(const nlohmann::ordered_json& json) {
    if (!json.is_object()) {
        throw std::invalid_argument("audit entry must be a JSON object");
    }

    const auto& sequence = Field(json, "sequence");
    if (!sequence.is_number_unsigned()) {
        throw std::invalid_argument("audit entry field 'sequence' must be an unsigned integer");
    }

    SealedEntry entry;
    entry.sequence = sequence.get<uint64_t>();
    entry.payload["sequence"] = entry.sequence;
    entry.payload["timestamp"] = TextField(json, "timestamp");
    entry.payload["threat_id"] = TextField(json, "threat_id");
    entry.payload["recommendation"] = TextField(json, "recommendation");
    entry.payload["destructive"] = FlagField(json, "destructive");
    entry.payload["approved"] = FlagField(json, "approved");

    const auto& notes = Field(json, "notes");
    if (!notes.is_null() && !notes.is_string()) {
        throw std::invalid_argument("audit entry field 'notes' must be a string or null");
    }
    entry.payload["notes"] = notes;

    entry.previousHash = TextField(json, "previous_hash");
    entry.recordHash = TextField(json, "record_hash");
    return entry;
}

void ChainVerifier::Next(const SealedEntry& entry) {
    if (!result_.intact) {
        return;
    }

    if (entry.sequence != expectedSequence_) {
        Fail(entry.sequence,
            "expected sequence " + std::to_string(expectedSequence_) + " but found " + std::to_string(entry.sequence));
        return;
    }
    if (entry.previousHash != expectedPreviousHash_) {
        Fail(entry.sequence, "previous_hash does not match the preceding entry");
        return;
    }
    if (ComputeRecordHash(entry.previousHash, entry.payload) != entry.recordHash) {
        Fail(entry.sequence, "record_hash does not match entry contents");
        return;
    }

    ++result_.entriesChecked;
    ++expectedSequence_;
    expectedPreviousHash_ = entry.recordHash;
}

void ChainVerifier::Fail(uint64_t sequence, const std::string& reason) {
    if (!result_.intact) {
        return;
    }

    result_.intact = false;
    result_.firstBrokenSequence = sequence;
    result_.reason = reason;
}

} // namespace audit
