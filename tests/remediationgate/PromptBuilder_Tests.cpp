#include "catch.hpp"

#include "PromptBuilder.hpp"
#include "RemediationResult.hpp"
#include "ThreatRecord.hpp"

#include <limits>

SCENARIO("the prompt embeds the complete threat record", "[prompt]") {
    ThreatRecord threat;
    threat.id = "malware-001";
    threat.path = "/home/user/invoice.exe";
    threat.description = "ransomware encrypting /home";
    threat.extra.emplace_back("engine", "edr");
    threat.extra.emplace_back("score", 97);
    threat.extra.emplace_back("signals", ExtraFields{{"persistence", true}});
    threat.extra.emplace_back("parent", nullptr);

    auto prompt = BuildPrompt(threat);

    REQUIRE(prompt.systemInstructions == "You are a cybersecurity assistant specialized in AV/EDR.");
    REQUIRE(prompt.userContent.rfind("Threat Data:\n", 0) == 0);
    REQUIRE(prompt.userContent.find("\"threat_id\": \"malware-001\"") != std::string::npos);
    REQUIRE(prompt.userContent.find("\"file_path\": \"/home/user/invoice.exe\"") != std::string::npos);
    REQUIRE(prompt.userContent.find("\"sha256\": null") != std::string::npos);
    REQUIRE(prompt.userContent.find("\"engine\": \"edr\"") != std::string::npos);
    REQUIRE(prompt.userContent.find("\"persistence\": true") != std::string::npos);
    REQUIRE(prompt.userContent.find("\"score\": 97,") != std::string::npos);
    REQUIRE(prompt.userContent.find("\"parent\": null") != std::string::npos);
    REQUIRE(prompt.userContent.find("single paragraph") != std::string::npos);
}

SCENARIO("the prompt is deterministic", "[prompt]") {
    ThreatRecord threat;
    threat.id = "pup-017";
    threat.extra.emplace_back("b", "second");
    threat.extra.emplace_back("a", "first");

    auto first = BuildPrompt(threat);
    auto second = BuildPrompt(threat);

    REQUIRE(first.userContent == second.userContent);
    REQUIRE(first.userContent.find("\"b\"") < first.userContent.find("\"a\""));
}

SCENARIO("unserializable threat data is rejected", "[prompt]") {
    ThreatRecord threat;
    threat.id = "nan-1";
    threat.extra.emplace_back("score", std::numeric_limits<double>::quiet_NaN());

    try {
        BuildPrompt(threat);
        FAIL("expected an input error");
    } catch (const RemediationResultException& e) {
        REQUIRE(e.Code() == RemediationResultCode::INPUT_INVALID);
    }
}

SCENARIO("a threat without an id is rejected", "[prompt]") {
    ThreatRecord threat;
    threat.description = "no id";

    REQUIRE_THROWS_AS(BuildPrompt(threat), RemediationResultException);
}
