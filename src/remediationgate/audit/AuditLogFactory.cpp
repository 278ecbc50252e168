#include "audit/AuditLogFactory.hpp"

#include "audit/DatabaseAuditLog.hpp"
#include "audit/FileAuditLog.hpp"
#include "Database.hpp"
#if defined(REMEDIATIONGATE_WITH_MARIADB)
#include "DatabaseMariaDb.hpp"
#endif
#if defined(REMEDIATIONGATE_WITH_SQLITE)
#include "DatabaseSqlite.hpp"
#endif
#include "RemediationGateConfig.hpp"

#include "easylogging++.h"

#include <filesystem>
#include <sstream>
#include <vector>

namespace audit {

namespace {

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

std::unique_ptr<IDatabaseConnection> CreateDatabaseConnection(const RemediationGateConfig& config) {
    if (config.auditBackend == "mariadb") {
#if defined(REMEDIATIONGATE_WITH_MARIADB)
        std::vector<std::string> missing;
        if (config.databaseUser.empty()) {
            missing.emplace_back("database_user");
        }
        if (config.databaseSchema.empty()) {
            missing.emplace_back("database_schema");
        }

        if (!missing.empty()) {
            throw DatabaseException("database", 0,
                "audit_backend=mariadb requires " + Join(missing)
                + "; set these in remediationgate.cfg (or pass --database_user/--database_schema)");
        }

        return std::make_unique<MariaDbDatabaseConnection>(config.databaseHost, config.databasePort,
            config.databaseUser, config.databasePassword, config.databaseSchema);
#else
        throw DatabaseException("database", 0,
            "unsupported audit_backend 'mariadb'; this binary was built without MariaDB support");
#endif
    }

#if defined(REMEDIATIONGATE_WITH_SQLITE)
    if (config.auditDatabasePath.empty()) {
        throw DatabaseException("sqlite", 0, "audit_backend=sqlite requires audit_database_path");
    }

    const auto parent = std::filesystem::path{config.auditDatabasePath}.parent_path();
    if (!parent.empty()) {
        std::filesystem::create_directories(parent);
    }
    return std::make_unique<SqliteDatabaseConnection>(config.auditDatabasePath);
#else
    throw DatabaseException("database", 0,
        "unsupported audit_backend 'sqlite'; this binary was built without SQLite support");
#endif
}

} // namespace

std::unique_ptr<IAuditLog> CreateAuditLog(const RemediationGateConfig& config) {
    std::unique_ptr<IAuditLog> log;

    if (config.auditBackend == "file") {
        if (config.auditLogPath.empty()) {
            throw std::invalid_argument("audit_backend=file requires audit_log_path");
        }
        log = std::make_unique<FileAuditLog>(config.auditLogPath);
    } else if (config.auditBackend == "sqlite" || config.auditBackend == "mariadb") {
        log = std::make_unique<DatabaseAuditLog>(CreateDatabaseConnection(config));
    } else {
        throw std::invalid_argument(
            "unsupported audit_backend '" + config.auditBackend + "'; expected file, sqlite or mariadb");
    }

    LOG(INFO) << "Audit sink selected: " << log->SinkName();
    return log;
}

} // namespace audit
