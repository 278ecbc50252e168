#include "policy/BatchOrchestrator.hpp"

#include "policy/ApprovalGate.hpp"
#include "RemediationResult.hpp"
#include "ThreatRecord.hpp"

#include "easylogging++.h"

#include <boost/asio/post.hpp>
#include <boost/asio/thread_pool.hpp>

#include <algorithm>

namespace policy {

namespace {

DecisionRecord Placeholder(const ThreatRecord& threat, const std::string& notes) {
    DecisionRecord record;
    record.threatId = threat.id;
    record.destructive = false;
    record.approved = false;
    record.notes = notes;
    record.timestamp = std::chrono::system_clock::now();
    return record;
}

} // namespace

BatchOrchestrator::BatchOrchestrator(ApprovalGate* gate, uint32_t concurrency)
    : gate_{gate}
    , concurrency_{concurrency} {}

BatchReport BatchOrchestrator::RunBatch(const std::vector<ThreatRecord>& threats) {
    BatchReport report(threats.size());

    LOG(INFO) << "Processing batch of " << threats.size() << " threats";

    const auto workers = std::min<size_t>(concurrency_, threats.size());
    if (workers <= 1) {
        for (size_t i = 0; i < threats.size(); ++i) {
            report[i] = ProcessItem(threats[i], i);
        }
    } else {
        boost::asio::thread_pool pool{workers};
        for (size_t i = 0; i < threats.size(); ++i) {
            boost::asio::post(pool, [this, &threats, &report, i]() { report[i] = ProcessItem(threats[i], i); });
        }
        pool.join();
    }

    const auto approved = std::count_if(
        report.begin(), report.end(), [](const DecisionRecord& record) { return record.approved; });
    LOG(INFO) << "Batch complete: " << approved << " of " << report.size() << " approved";

    return report;
}

DecisionRecord BatchOrchestrator::ProcessItem(const ThreatRecord& threat, size_t index) {
    try {
        auto record = gate_->Decide(threat, false);
        if (!record.approved) {
            LOG(WARNING) << "Batch threat " << threat.id << " (item " << index << ") denied: "
                         << record.notes.value_or("");
        }
        return record;
    } catch (const RemediationResultException& e) {
        LOG(WARNING) << "Batch threat " << threat.id << " (item " << index << ") failed: " << e.what();
        return Placeholder(threat, std::string{"Failed: "} + e.what());
    } catch (const std::exception& e) {
        LOG(ERROR) << "Unexpected error on batch threat " << threat.id << " (item " << index << "): " << e.what();
        return Placeholder(threat, std::string{"Unexpected error: "} + e.what());
    } catch (...) {
        LOG(ERROR) << "Unexpected non-standard exception on batch threat " << threat.id << " (item " << index << ")";
        return Placeholder(threat, "Unexpected error: unknown exception");
    }
}

} // namespace policy
