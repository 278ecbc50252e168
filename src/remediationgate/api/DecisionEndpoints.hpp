#pragma once

#include "RemediationResult.hpp"

#include <string>

namespace policy {
class ApprovalGate;
class BatchOrchestrator;
}

namespace api {

struct HttpReply {
    unsigned status;
    std::string body;
};

// JSON request handlers behind the HTTP listener. Each handler turns a
// request body into a status code and a JSON body and never throws for a
// domain error; those become {"kind", "detail", "threat_id"?} bodies.
class DecisionEndpoints {
public:
    DecisionEndpoints(policy::ApprovalGate* gate, policy::BatchOrchestrator* orchestrator, std::string auditSink,
        std::string generationBackend);

    // POST /recommend: {"threat": {...}, "confirm": false}
    HttpReply Recommend(const std::string& body);

    // POST /batch: {"threats": [...]}
    HttpReply Batch(const std::string& body);

    // GET /health
    HttpReply Health() const;

private:
    policy::ApprovalGate* gate_;
    policy::BatchOrchestrator* orchestrator_;
    std::string auditSink_;
    std::string generationBackend_;
};

HttpReply ErrorReply(unsigned status, const std::string& kind, const std::string& detail,
    const std::string& threatId = "");

HttpReply ErrorReply(RemediationResultCode code, const std::string& detail, const std::string& threatId = "");

} // namespace api
