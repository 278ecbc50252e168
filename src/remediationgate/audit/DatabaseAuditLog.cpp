#include "audit/DatabaseAuditLog.hpp"

#include "audit/AuditChain.hpp"
#include "Database.hpp"
#include "DatabaseBootstrap.hpp"
#include "DecisionRecord.hpp"
#include "RemediationResult.hpp"

#include "easylogging++.h"

namespace audit {

namespace {

[[noreturn]] void ThrowAuditError(const std::string& message) {
    throw RemediationResultException(RemediationResultCode::AUDIT_WRITE_FAILED, message);
}

SealedEntry ReadEntry(StatementHandle& stmt) {
    SealedEntry entry;
    entry.sequence = static_cast<uint64_t>(stmt->ColumnInt(0));
    entry.payload["sequence"] = entry.sequence;
    entry.payload["timestamp"] = stmt->ColumnText(1);
    entry.payload["threat_id"] = stmt->ColumnText(2);
    entry.payload["recommendation"] = stmt->ColumnText(3);
    entry.payload["destructive"] = stmt->ColumnInt(4) != 0;
    entry.payload["approved"] = stmt->ColumnInt(5) != 0;
    if (stmt->ColumnIsNull(6)) {
        entry.payload["notes"] = nullptr;
    } else {
        entry.payload["notes"] = stmt->ColumnText(6);
    }
    entry.previousHash = stmt->ColumnText(7);
    entry.recordHash = stmt->ColumnText(8);
    return entry;
}

} // namespace

DatabaseAuditLog::DatabaseAuditLog(std::unique_ptr<IDatabaseConnection> db)
    : db_{std::move(db)}
    , lastHash_{kGenesisHash} {
    try {
        const auto validation = EnsureAuditSchemaOrThrow(*db_);
        LOG(INFO) << "Audit database backend: " << db_->BackendName() << ", schema version "
                  << validation.currentVersion << " (required " << validation.requiredVersion << ")";
        ResumeChain();
    } catch (const DatabaseException& e) {
        ThrowAuditError(std::string{"audit database unavailable: "} + e.what());
    }

    LOG(INFO) << "Audit chain resumed at sequence " << lastSequence_;
}

DatabaseAuditLog::~DatabaseAuditLog() = default;

void DatabaseAuditLog::ResumeChain() {
    StatementHandle stmt{db_->Prepare(
        "SELECT entry_sequence, record_hash FROM decision_audit ORDER BY entry_sequence DESC LIMIT 1")};

    if (stmt->Step() == StatementStepResult::Row) {
        lastSequence_ = static_cast<uint64_t>(stmt->ColumnInt(0));
        lastHash_ = stmt->ColumnText(1);
    }
}

void DatabaseAuditLog::Append(const DecisionRecord& record) {
    std::lock_guard<std::mutex> lock(mutex_);

    try {
        const auto entry = SealEntry(lastSequence_ + 1, record, lastHash_);

        TransactionScope transaction{db_->BeginTransaction()};

        StatementHandle stmt{db_->Prepare(
            "INSERT INTO decision_audit (entry_sequence, recorded_at, threat_id, recommendation, destructive, "
            "approved, notes, previous_hash, record_hash) VALUES (@sequence, @recorded_at, @threat_id, "
            "@recommendation, @destructive, @approved, @notes, @previous_hash, @record_hash)")};

        int sequenceIdx = stmt->BindParameterIndex("@sequence");
        int recordedAtIdx = stmt->BindParameterIndex("@recorded_at");
        int threatIdIdx = stmt->BindParameterIndex("@threat_id");
        int recommendationIdx = stmt->BindParameterIndex("@recommendation");
        int destructiveIdx = stmt->BindParameterIndex("@destructive");
        int approvedIdx = stmt->BindParameterIndex("@approved");
        int notesIdx = stmt->BindParameterIndex("@notes");
        int previousHashIdx = stmt->BindParameterIndex("@previous_hash");
        int recordHashIdx = stmt->BindParameterIndex("@record_hash");

        stmt->BindInt(sequenceIdx, static_cast<int64_t>(entry.sequence));
        stmt->BindText(recordedAtIdx, entry.payload.at("timestamp").get<std::string>());
        stmt->BindText(threatIdIdx, record.threatId);
        stmt->BindText(recommendationIdx, record.recommendation);
        stmt->BindInt(destructiveIdx, record.destructive ? 1 : 0);
        stmt->BindInt(approvedIdx, record.approved ? 1 : 0);
        if (record.notes) {
            stmt->BindText(notesIdx, *record.notes);
        } else {
            stmt->BindNull(notesIdx);
        }
        stmt->BindText(previousHashIdx, entry.previousHash);
        stmt->BindText(recordHashIdx, entry.recordHash);

        stmt.ExpectDone("audit insert");
        transaction.Commit();

        lastSequence_ = entry.sequence;
        lastHash_ = entry.recordHash;
    } catch (const DatabaseException& e) {
        ThrowAuditError(std::string{"audit insert failed: "} + e.what());
    } catch (const std::exception& e) {
        ThrowAuditError(std::string{"cannot seal audit entry: "} + e.what());
    }
}

ChainVerification DatabaseAuditLog::VerifyChain() {
    std::lock_guard<std::mutex> lock(mutex_);

    ChainVerifier verifier;
    try {
        StatementHandle stmt{db_->Prepare(
            "SELECT entry_sequence, recorded_at, threat_id, recommendation, destructive, approved, notes, "
            "previous_hash, record_hash FROM decision_audit ORDER BY entry_sequence")};

        while (verifier.Result().intact && stmt->Step() == StatementStepResult::Row) {
            verifier.Next(ReadEntry(stmt));
        }
    } catch (const DatabaseException& e) {
        verifier.Fail(verifier.Result().entriesChecked + 1, std::string{"cannot read audit table: "} + e.what());
    }

    return verifier.Result();
}

std::string DatabaseAuditLog::SinkName() const { return "database:" + db_->BackendName(); }

uint64_t DatabaseAuditLog::LastSequence() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return lastSequence_;
}

} // namespace audit
