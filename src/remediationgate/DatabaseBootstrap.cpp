#include "DatabaseBootstrap.hpp"

#include "Database.hpp"

#include <sstream>
#include <utility>

namespace {
constexpr int kRequiredSchemaVersion = 1;

// Mirrors extras/migrations/sqlite/V001__baseline.sql
const char* const kSqliteBaseline[] = {
    "CREATE TABLE schema_version (version INTEGER NOT NULL)",
    "CREATE TABLE decision_audit ("
    " entry_sequence INTEGER PRIMARY KEY,"
    " recorded_at TEXT NOT NULL,"
    " threat_id TEXT NOT NULL,"
    " recommendation TEXT NOT NULL,"
    " destructive INTEGER NOT NULL,"
    " approved INTEGER NOT NULL,"
    " notes TEXT NULL,"
    " previous_hash TEXT NOT NULL,"
    " record_hash TEXT NOT NULL)",
    "CREATE INDEX decision_audit_threat_id ON decision_audit (threat_id)",
    "INSERT INTO schema_version (version) VALUES (1)",
};

std::vector<std::pair<int, std::string>> MigrationCatalogForBackend(const std::string& backend) {
    if (backend == "mariadb") {
        return {{1, "extras/migrations/mariadb/V001__baseline.sql"}};
    }
    if (backend == "sqlite") {
        return {{1, "extras/migrations/sqlite/V001__baseline.sql"}};
    }

    throw DatabaseException(backend, 0, "unknown database backend for migration lookup");
}

bool TableExists(IDatabaseConnection& db, const std::string& tableName) {
    const char* sql = db.BackendName() == "sqlite"
        ? "SELECT 1 FROM sqlite_master WHERE type = 'table' AND name = @table_name"
        : "SELECT 1 FROM information_schema.tables WHERE table_schema = DATABASE() AND table_name = @table_name";

    StatementHandle stmt{db.Prepare(sql)};
    int tableNameIdx = stmt->BindParameterIndex("@table_name");
    stmt->BindText(tableNameIdx, tableName);
    return stmt->Step() == StatementStepResult::Row;
}

void ApplySqliteBaseline(IDatabaseConnection& db) {
    TransactionScope transaction{db.BeginTransaction()};
    for (const char* sql : kSqliteBaseline) {
        StatementHandle stmt{db.Prepare(sql)};
        stmt.ExpectDone("baseline migration");
    }
    transaction.Commit();
}

int ReadSchemaVersion(IDatabaseConnection& db) {
    StatementHandle stmt{db.Prepare("SELECT version FROM schema_version LIMIT 1")};
    if (stmt->Step() != StatementStepResult::Row) {
        throw DatabaseException(db.BackendName(), 0,
            "schema_version exists but has no rows. Apply baseline migration V001 before starting remediationgate");
    }

    return static_cast<int>(stmt->ColumnInt(0));
}

std::string Join(const std::vector<std::string>& items) {
    std::ostringstream out;
    for (size_t i = 0; i < items.size(); ++i) {
        if (i > 0) {
            out << ", ";
        }
        out << items[i];
    }
    return out.str();
}

} // namespace

SchemaValidationResult EnsureAuditSchemaOrThrow(IDatabaseConnection& db) {
    const auto migrations = MigrationCatalogForBackend(db.BackendName());
    const int latestKnownVersion = migrations.back().first;

    SchemaValidationResult result;

    if (!TableExists(db, "schema_version")) {
        if (db.BackendName() != "sqlite") {
            throw DatabaseException(db.BackendName(), 0,
                "schema_version table is missing. Apply baseline migration " + migrations.front().second
                    + " and retry");
        }

        LOG(INFO) << "Applying audit baseline schema to empty sqlite database";
        ApplySqliteBaseline(db);
        result.baselineApplied = true;
    }

    const int currentVersion = ReadSchemaVersion(db);

    if (currentVersion > latestKnownVersion) {
        throw DatabaseException(db.BackendName(), 0,
            "database schema version " + std::to_string(currentVersion)
                + " is newer than this binary supports (latest known migration: "
                + std::to_string(latestKnownVersion) + "). Deploy a newer remediationgate binary");
    }

    result.currentVersion = currentVersion;
    result.requiredVersion = kRequiredSchemaVersion;

    for (const auto& migration : migrations) {
        if (migration.first > currentVersion) {
            result.pendingMigrations.push_back(migration.second);
        }
    }

    if (currentVersion < kRequiredSchemaVersion) {
        throw DatabaseException(db.BackendName(), 0,
            "database schema version " + std::to_string(currentVersion) + " is below required "
                + std::to_string(kRequiredSchemaVersion) + ". Apply migrations: "
                + Join(result.pendingMigrations));
    }

    if (!TableExists(db, "decision_audit")) {
        throw DatabaseException(db.BackendName(), 0,
            "decision_audit table is missing although schema_version reports "
                + std::to_string(currentVersion));
    }

    return result;
}
