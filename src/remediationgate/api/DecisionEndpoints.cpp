#include "api/DecisionEndpoints.hpp"

#include "DecisionRecord.hpp"
#include "ThreatRecord.hpp"
#include "policy/ApprovalGate.hpp"
#include "policy/BatchOrchestrator.hpp"

#include "easylogging++.h"

#include <nlohmann/json.hpp>

#include <chrono>
#include <vector>

namespace api {

namespace {

using ordered_json = nlohmann::ordered_json;

std::string Dump(const ordered_json& json) {
    return json.dump(-1, ' ', false, ordered_json::error_handler_t::replace);
}

ordered_json ParseEnvelope(const std::string& body) {
    ordered_json envelope;
    try {
        envelope = ordered_json::parse(body);
    } catch (const nlohmann::json::parse_error& e) {
        throw RemediationResultException(
            RemediationResultCode::INPUT_INVALID, std::string{"malformed JSON body: "} + e.what());
    }

    if (!envelope.is_object()) {
        throw RemediationResultException(RemediationResultCode::INPUT_INVALID, "request body must be a JSON object");
    }

    return envelope;
}

// Best effort id for error bodies; the threat may be malformed.
std::string ThreatIdOf(const ordered_json& threat) {
    if (!threat.is_object()) {
        return "";
    }

    auto id = threat.find("threat_id");
    if (id == threat.end() || !id->is_string()) {
        return "";
    }

    return id->get<std::string>();
}

} // namespace

HttpReply ErrorReply(unsigned status, const std::string& kind, const std::string& detail, const std::string& threatId) {
    ordered_json error;
    error["kind"] = kind;
    error["detail"] = detail;
    if (!threatId.empty()) {
        error["threat_id"] = threatId;
    }

    return HttpReply{status, Dump(error)};
}

HttpReply ErrorReply(RemediationResultCode code, const std::string& detail, const std::string& threatId) {
    return ErrorReply(HttpStatusFor(code), ToString(code), detail, threatId);
}

DecisionEndpoints::DecisionEndpoints(policy::ApprovalGate* gate, policy::BatchOrchestrator* orchestrator,
    std::string auditSink, std::string generationBackend)
    : gate_{gate}
    , orchestrator_{orchestrator}
    , auditSink_{std::move(auditSink)}
    , generationBackend_{std::move(generationBackend)} {}

HttpReply DecisionEndpoints::Recommend(const std::string& body) {
    std::string threatId;

    try {
        auto envelope = ParseEnvelope(body);
        auto threatJson = envelope.find("threat");
        if (threatJson == envelope.end()) {
            throw RemediationResultException(RemediationResultCode::INPUT_INVALID, "request has no threat");
        }
        threatId = ThreatIdOf(*threatJson);

        bool confirm = false;
        auto confirmJson = envelope.find("confirm");
        if (confirmJson != envelope.end() && !confirmJson->is_null()) {
            if (!confirmJson->is_boolean()) {
                throw RemediationResultException(RemediationResultCode::INPUT_INVALID, "confirm must be a boolean");
            }
            confirm = confirmJson->get<bool>();
        }

        auto threat = ThreatRecordFromJson(*threatJson);
        auto record = gate_->Decide(threat, confirm);

        if (record.destructive && !record.approved) {
            return ErrorReply(RemediationResultCode::CONFIRMATION_REQUIRED,
                record.notes.value_or("destructive action requires confirmation"), record.threatId);
        }

        return HttpReply{200, Dump(ToJson(record))};
    } catch (const RemediationResultException& e) {
        return ErrorReply(e.Code(), e.what(), threatId);
    } catch (const std::exception& e) {
        LOG(ERROR) << "Unhandled error while serving /recommend: " << e.what();
        return ErrorReply(500, "internal_error", e.what(), threatId);
    }
}

HttpReply DecisionEndpoints::Batch(const std::string& body) {
    ordered_json list;
    try {
        auto envelope = ParseEnvelope(body);

        auto threatsJson = envelope.find("threats");
        if (threatsJson == envelope.end() || !threatsJson->is_array()) {
            throw RemediationResultException(RemediationResultCode::INPUT_INVALID, "threats must be a JSON array");
        }
        list = std::move(*threatsJson);
    } catch (const RemediationResultException& e) {
        return ErrorReply(e.Code(), e.what());
    }

    // Items that do not parse get a report entry of their own and never
    // reach the gate; the rest run as one batch and are merged back by index.
    BatchReport report(list.size());
    std::vector<ThreatRecord> threats;
    std::vector<size_t> positions;
    for (size_t i = 0; i < list.size(); ++i) {
        try {
            threats.push_back(ThreatRecordFromJson(list[i]));
            positions.push_back(i);
        } catch (const RemediationResultException& e) {
            LOG(WARNING) << "Batch item " << i << " rejected: " << e.what();
            auto& rejected = report[i];
            rejected.threatId = ThreatIdOf(list[i]);
            rejected.destructive = false;
            rejected.approved = false;
            rejected.notes = std::string{"Failed: "} + e.what();
            rejected.timestamp = std::chrono::system_clock::now();
        }
    }

    try {
        auto decided = orchestrator_->RunBatch(threats);
        for (size_t i = 0; i < decided.size(); ++i) {
            report[positions[i]] = std::move(decided[i]);
        }
    } catch (const std::exception& e) {
        LOG(ERROR) << "Unhandled error while serving /batch: " << e.what();
        return ErrorReply(500, "internal_error", e.what());
    }

    return HttpReply{200, Dump(ToJson(report))};
}

HttpReply DecisionEndpoints::Health() const {
    ordered_json health;
    health["status"] = "ok";
    health["audit_sink"] = auditSink_;
    health["generation_backend"] = generationBackend_;
    return HttpReply{200, Dump(health)};
}

} // namespace api
