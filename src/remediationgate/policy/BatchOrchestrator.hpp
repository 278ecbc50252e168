#pragma once

#include "DecisionRecord.hpp"

#include <cstdint>
#include <vector>

struct ThreatRecord;

namespace policy {

class ApprovalGate;

// Runs the approval gate over a batch without prior confirmation, so a
// destructive recommendation is never approved in bulk. The report holds one
// record per threat at the threat's input index; an item that fails gets an
// unapproved placeholder and the remaining items still run.
class BatchOrchestrator {
public:
    // concurrency <= 1 processes items sequentially on the calling thread.
    BatchOrchestrator(ApprovalGate* gate, uint32_t concurrency);

    BatchReport RunBatch(const std::vector<ThreatRecord>& threats);

private:
    DecisionRecord ProcessItem(const ThreatRecord& threat, size_t index);

    ApprovalGate* gate_;
    uint32_t concurrency_;
};

} // namespace policy
