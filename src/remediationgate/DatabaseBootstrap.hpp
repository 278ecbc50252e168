#pragma once

#include <string>
#include <vector>

class IDatabaseConnection;

struct SchemaValidationResult {
    int currentVersion = 0;
    int requiredVersion = 0;
    bool baselineApplied = false;
    std::vector<std::string> pendingMigrations;
};

// Validates the decision_audit schema version. An empty sqlite database gets
// the baseline applied; other backends must be migrated by the operator.
SchemaValidationResult EnsureAuditSchemaOrThrow(IDatabaseConnection& db);
