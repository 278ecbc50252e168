#include "DatabaseMariaDb.hpp"

#include "SqlParameterAdapter.hpp"

#include <mysql/mysql.h>

#include <string>
#include <vector>

namespace {

DatabaseException MakeMariaDbError(MYSQL* handle, const std::string& context) {
    return DatabaseException("mariadb", static_cast<int>(mysql_errno(handle)), context + ": " + mysql_error(handle));
}

std::string EscapeString(MYSQL* handle, const std::string& input) {
    std::string out;
    out.resize(input.size() * 2 + 1);
    auto written = mysql_real_escape_string(handle, out.data(), input.c_str(), input.size());
    out.resize(written);
    return out;
}

class MariaDbStatement final : public IStatement {
public:
    MariaDbStatement(MYSQL* handle, const std::string& sql)
        : handle_{handle}
        , executed_{false}
        , rowIndex_{0} {
        normalizedSql_ = NormalizeNamedParameters(sql);
        boundValues_.resize(normalizedSql_.positionsByLogicalIndex.size());
    }

    ~MariaDbStatement() override {
        if (result_) {
            mysql_free_result(result_);
        }
    }

    int BindParameterIndex(const std::string& name) const override {
        auto iter = normalizedSql_.logicalIndexByName.find(name);
        if (iter == normalizedSql_.logicalIndexByName.end()) {
            throw DatabaseException("mariadb", 0, "missing parameter: " + name);
        }
        return iter->second;
    }

    void BindInt(int index, int64_t value) override {
        auto& slot = Slot(index);
        slot.type = BoundValue::Type::Int;
        slot.intValue = value;
    }

    void BindText(int index, const std::string& value) override {
        auto& slot = Slot(index);
        slot.type = BoundValue::Type::Text;
        slot.textValue = value;
    }

    void BindNull(int index) override { Slot(index).type = BoundValue::Type::Null; }

    StatementStepResult Step() override {
        if (!executed_) {
            Execute();
        }

        if (result_ && rowIndex_ < rowCount_) {
            currentRow_ = mysql_fetch_row(result_);
            currentLengths_ = mysql_fetch_lengths(result_);
            ++rowIndex_;
            return StatementStepResult::Row;
        }

        return StatementStepResult::Done;
    }

    bool ColumnIsNull(int index) const override { return !currentRow_ || !currentRow_[index]; }

    int64_t ColumnInt(int index) const override {
        auto text = ColumnText(index);
        return text.empty() ? 0 : std::stoll(text);
    }

    std::string ColumnText(int index) const override {
        if (!currentRow_ || !currentRow_[index]) {
            return "";
        }
        return std::string(currentRow_[index], currentLengths_[index]);
    }

private:
    struct BoundValue {
        enum class Type {
            Unbound,
            Null,
            Int,
            Text
        };

        Type type = Type::Unbound;
        int64_t intValue = 0;
        std::string textValue;
    };

    BoundValue& Slot(int index) {
        if (index < 0 || static_cast<size_t>(index) >= boundValues_.size()) {
            throw DatabaseException("mariadb", 0, "invalid bind index");
        }
        return boundValues_[static_cast<size_t>(index)];
    }

    std::string RenderValue(const BoundValue& value) const {
        switch (value.type) {
        case BoundValue::Type::Int:
            return std::to_string(value.intValue);
        case BoundValue::Type::Text:
            return "'" + EscapeString(handle_, value.textValue) + "'";
        case BoundValue::Type::Null:
            return "NULL";
        case BoundValue::Type::Unbound:
            break;
        }
        throw DatabaseException("mariadb", 0, "missing parameter value");
    }

    void Execute() {
        std::vector<std::string> rendered;
        rendered.reserve(boundValues_.size());
        for (const auto& value : boundValues_) {
            rendered.push_back(RenderValue(value));
        }

        std::string sql;
        sql.reserve(normalizedSql_.sql.size() + 64);
        size_t parameterIndex = 0;
        bool inLiteral = false;
        for (char c : normalizedSql_.sql) {
            if (c == '\'') {
                inLiteral = !inLiteral;
            }
            if (c == '?' && !inLiteral) {
                int logicalIndex = normalizedSql_.logicalIndexByPosition.at(parameterIndex++);
                sql += rendered[static_cast<size_t>(logicalIndex)];
            } else {
                sql.push_back(c);
            }
        }

        if (mysql_real_query(handle_, sql.c_str(), sql.size()) != 0) {
            throw MakeMariaDbError(handle_, "query failed");
        }

        result_ = mysql_store_result(handle_);
        if (!result_ && mysql_field_count(handle_) != 0) {
            throw MakeMariaDbError(handle_, "store result failed");
        }

        if (result_) {
            rowCount_ = mysql_num_rows(result_);
        }

        executed_ = true;
    }

    MYSQL* handle_;
    bool executed_;
    NormalizedSql normalizedSql_;
    std::vector<BoundValue> boundValues_;
    MYSQL_RES* result_ = nullptr;
    MYSQL_ROW currentRow_ = nullptr;
    unsigned long* currentLengths_ = nullptr;
    my_ulonglong rowIndex_;
    my_ulonglong rowCount_ = 0;
};

class MariaDbTransaction final : public ITransaction {
public:
    explicit MariaDbTransaction(MYSQL* handle)
        : handle_{handle}
        , done_{false} {
        Execute("START TRANSACTION");
    }

    ~MariaDbTransaction() override {
        if (!done_) {
            try {
                Rollback();
            } catch (const std::exception& e) {
                LOG(WARNING) << "mariadb rollback failed: " << e.what();
            } catch (...) {
                LOG(WARNING) << "mariadb rollback failed with an unknown exception";
            }
        }
    }

    void Commit() override {
        Execute("COMMIT");
        done_ = true;
    }

    void Rollback() override {
        done_ = true;
        Execute("ROLLBACK");
    }

private:
    void Execute(const char* sql) {
        if (mysql_query(handle_, sql) != 0) {
            throw MakeMariaDbError(handle_, "transaction failed");
        }
    }

    MYSQL* handle_;
    bool done_;
};

} // namespace

struct MariaDbDatabaseConnection::Impl {
    MYSQL* handle = nullptr;
};

MariaDbDatabaseConnection::MariaDbDatabaseConnection(const std::string& host, uint16_t port,
    const std::string& user, const std::string& password, const std::string& schema)
    : impl_{std::make_unique<Impl>()} {
    impl_->handle = mysql_init(nullptr);
    if (!impl_->handle) {
        throw DatabaseException("mariadb", 0, "init failed");
    }

    if (!mysql_real_connect(impl_->handle, host.c_str(), user.c_str(), password.c_str(),
            schema.empty() ? nullptr : schema.c_str(), port, nullptr, 0)) {
        auto error = MakeMariaDbError(impl_->handle, "connect failed");
        mysql_close(impl_->handle);
        impl_->handle = nullptr;
        throw error;
    }

    if (mysql_set_character_set(impl_->handle, "utf8mb4") != 0) {
        auto error = MakeMariaDbError(impl_->handle, "set charset failed");
        mysql_close(impl_->handle);
        impl_->handle = nullptr;
        throw error;
    }
}

MariaDbDatabaseConnection::~MariaDbDatabaseConnection() {
    if (impl_ && impl_->handle) {
        mysql_close(impl_->handle);
    }
}

std::unique_ptr<IStatement> MariaDbDatabaseConnection::Prepare(const std::string& sql) {
    return std::make_unique<MariaDbStatement>(impl_->handle, sql);
}

std::unique_ptr<ITransaction> MariaDbDatabaseConnection::BeginTransaction() {
    return std::make_unique<MariaDbTransaction>(impl_->handle);
}

std::string MariaDbDatabaseConnection::BackendName() const { return "mariadb"; }
