#include "catch.hpp"

#include "TestDoubles.hpp"

#include "ThreatRecord.hpp"
#include "policy/ApprovalGate.hpp"
#include "policy/DestructiveClassifier.hpp"

#include <chrono>

namespace {

ThreatRecord MakeThreat(const std::string& id, const std::string& description) {
    ThreatRecord threat;
    threat.id = id;
    threat.description = description;
    return threat;
}

struct GateFixture {
    ScriptedGenerationBackend backend;
    RecordingAuditLog auditLog;
    policy::DestructiveClassifier classifier;
    policy::ApprovalGate gate{&backend, &auditLog, &classifier, std::chrono::milliseconds{1000}};
};

} // namespace

SCENARIO("a destructive recommendation needs prior confirmation", "[approval_gate]") {
    GIVEN("ransomware threat malware-001 and a backend that recommends deleting files") {
        GateFixture fixture;
        fixture.backend.Answer("malware-001", "Quarantine and delete the encrypted files immediately.");
        auto threat = MakeThreat("malware-001", "ransomware encrypting /home");

        WHEN("the decision is requested without confirmation") {
            auto record = fixture.gate.Decide(threat, false);

            THEN("the recommendation is flagged destructive and denied") {
                REQUIRE(record.destructive);
                REQUIRE_FALSE(record.approved);
                REQUIRE(record.threatId == "malware-001");
                REQUIRE(record.notes.has_value());
            }

            THEN("the denial is logged exactly once") {
                auto logged = fixture.auditLog.Records();
                REQUIRE(logged.size() == 1);
                REQUIRE(logged[0].threatId == "malware-001");
                REQUIRE(logged[0].destructive);
                REQUIRE_FALSE(logged[0].approved);
            }
        }

        WHEN("the decision is requested with confirmation") {
            auto record = fixture.gate.Decide(threat, true);

            THEN("the recommendation is approved and the approval is logged") {
                REQUIRE(record.destructive);
                REQUIRE(record.approved);
                REQUIRE(record.recommendation == "Quarantine and delete the encrypted files immediately.");

                auto logged = fixture.auditLog.Records();
                REQUIRE(logged.size() == 1);
                REQUIRE(logged[0].approved);
            }
        }
    }
}

SCENARIO("a non-destructive recommendation is approved automatically", "[approval_gate]") {
    GateFixture fixture;
    fixture.backend.Answer("pup-017", "  Monitor the host and update signatures.\n");

    auto record = fixture.gate.Decide(MakeThreat("pup-017", "adware"), false);

    REQUIRE_FALSE(record.destructive);
    REQUIRE(record.approved);
    REQUIRE_FALSE(record.notes.has_value());
    REQUIRE(record.recommendation == "Monitor the host and update signatures.");
    REQUIRE(fixture.auditLog.Records().size() == 1);
}

SCENARIO("repeated decisions over the same input agree", "[approval_gate]") {
    GateFixture fixture;
    fixture.backend.Answer("malware-001", "Kill the process and isolate the host.");
    auto threat = MakeThreat("malware-001", "ransomware encrypting /home");

    auto first = fixture.gate.Decide(threat, false);
    auto second = fixture.gate.Decide(threat, false);

    REQUIRE(first.destructive == second.destructive);
    REQUIRE(first.approved == second.approved);
    REQUIRE(first.recommendation == second.recommendation);
    REQUIRE(first.notes == second.notes);
    REQUIRE(fixture.auditLog.Records().size() == 2);

    auto prompts = fixture.backend.Prompts();
    REQUIRE(prompts.size() == 2);
    REQUIRE(prompts[0].userContent == prompts[1].userContent);
}

SCENARIO("generation failures are logged before they are reported", "[approval_gate]") {
    GateFixture fixture;

    GIVEN("a backend that times out") {
        fixture.backend.Fail("slow-1", RemediationResultCode::GENERATION_TIMEOUT);

        THEN("the gate throws a timeout and logs an unapproved record") {
            try {
                fixture.gate.Decide(MakeThreat("slow-1", "beacon"), false);
                FAIL("expected a timeout");
            } catch (const RemediationResultException& e) {
                REQUIRE(e.Code() == RemediationResultCode::GENERATION_TIMEOUT);
            }

            auto logged = fixture.auditLog.Records();
            REQUIRE(logged.size() == 1);
            REQUIRE_FALSE(logged[0].approved);
            REQUIRE_FALSE(logged[0].destructive);
            REQUIRE(logged[0].recommendation.empty());
            REQUIRE(logged[0].notes.value().find("timed out") != std::string::npos);
        }
    }

    GIVEN("a backend that returns only whitespace") {
        fixture.backend.Answer("blank-1", " \n\t ");

        THEN("the gate reports a generation error") {
            try {
                fixture.gate.Decide(MakeThreat("blank-1", "dropper"), false);
                FAIL("expected a generation error");
            } catch (const RemediationResultException& e) {
                REQUIRE(e.Code() == RemediationResultCode::GENERATION_FAILED);
            }
            REQUIRE(fixture.auditLog.Records().size() == 1);
        }
    }
}

SCENARIO("invalid threat data never reaches the backend", "[approval_gate]") {
    GateFixture fixture;
    ThreatRecord threat = MakeThreat("dup-1", "duplicate keys");
    threat.extra.emplace_back("engine", "edr");
    threat.extra.emplace_back("engine", "av");

    REQUIRE_THROWS_AS(fixture.gate.Decide(threat, false), RemediationResultException);
    REQUIRE(fixture.backend.Calls() == 0);

    auto logged = fixture.auditLog.Records();
    REQUIRE(logged.size() == 1);
    REQUIRE_FALSE(logged[0].approved);
}

SCENARIO("an audit failure prevents approval", "[approval_gate]") {
    GateFixture fixture;
    fixture.backend.Answer("pup-017", "Monitor the host.");
    fixture.auditLog.FailWrites();

    try {
        fixture.gate.Decide(MakeThreat("pup-017", "adware"), false);
        FAIL("expected an audit failure");
    } catch (const RemediationResultException& e) {
        REQUIRE(e.Code() == RemediationResultCode::AUDIT_WRITE_FAILED);
    }
}

SCENARIO("an audit failure takes precedence over a generation failure", "[approval_gate]") {
    GateFixture fixture;
    fixture.backend.Fail("slow-1", RemediationResultCode::GENERATION_TIMEOUT);
    fixture.auditLog.FailWrites();

    try {
        fixture.gate.Decide(MakeThreat("slow-1", "beacon"), false);
        FAIL("expected an audit failure");
    } catch (const RemediationResultException& e) {
        REQUIRE(e.Code() == RemediationResultCode::AUDIT_WRITE_FAILED);
    }
}
