#pragma once

#include <cstdint>
#include <string>
#include <vector>

struct RemediationGateConfig {
    RemediationGateConfig() = default;

    const uint32_t version = 1;
    std::string listenAddress = "127.0.0.1";
    uint16_t listenPort = 8088;
    bool bindToIp = false;

    std::string generationHost = "127.0.0.1";
    uint16_t generationPort = 11434;
    // "native" posts to /api/chat, "openai" to /v1/chat/completions.
    std::string generationApi = "native";
    std::string generationModel = "gpt-oss:20b";
    uint32_t generationTimeoutMs = 120000;
    bool generationHealthCheck = true;

    std::vector<std::string> destructiveTerms;
    uint32_t batchConcurrency = 4;

    // "file" is the default sink. "sqlite" and "mariadb" store the chain in decision_audit.
    std::string auditBackend = "file";
    std::string auditLogPath;
    std::string auditDatabasePath;
    std::string databaseHost = "127.0.0.1";
    uint16_t databasePort = 3306;
    std::string databaseUser;
    std::string databasePassword;
    std::string databaseSchema;

    std::string loggerConfig;

    // Command-line modes; serving HTTP when neither is set.
    std::string batchFile;
    bool verifyAudit = false;
};
