#pragma once

#include "audit/AuditLog.hpp"

#include <memory>

struct RemediationGateConfig;

namespace audit {

// Builds the sink named by audit_backend: file, sqlite or mariadb.
std::unique_ptr<IAuditLog> CreateAuditLog(const RemediationGateConfig& config);

} // namespace audit
