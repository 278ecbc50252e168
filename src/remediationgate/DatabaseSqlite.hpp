#pragma once

#include "Database.hpp"

struct sqlite3;

class SqliteDatabaseConnection final : public IDatabaseConnection {
public:
    // ":memory:" opens a private in-process database.
    explicit SqliteDatabaseConnection(const std::string& path);
    ~SqliteDatabaseConnection() override;

    std::unique_ptr<IStatement> Prepare(const std::string& sql) override;
    std::unique_ptr<ITransaction> BeginTransaction() override;
    std::string BackendName() const override;

private:
    sqlite3* db_;
};
