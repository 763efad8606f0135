#include <sqlite3.h>
#include "dbal/driver.hpp"
#include "dbal/lib.hpp"
#include "dbal/log.hpp"

namespace dbal {

namespace {

class SqliteResultSet final : public ResultSet {
public:
    explicit SqliteResultSet(sqlite3_stmt* stmt)
        : stmt_(stmt) { }
    ~SqliteResultSet() override {
        if (stmt_) sqlite3_finalize(stmt_);
    }

    std::optional<Row> fetch() override {
        if (!stmt_) return std::nullopt;
        int rc = sqlite3_step(stmt_);
        if (rc == SQLITE_DONE) {
            sqlite3_finalize(stmt_);
            stmt_ = nullptr;
            return std::nullopt;
        }
        if (rc != SQLITE_ROW) {
            DBAL_BACKEND("SQLite fetch failed: %s", sqlite3_errmsg(sqlite3_db_handle(stmt_)));
        }

        Row row;
        int n = sqlite3_column_count(stmt_);
        for (int i = 0; i < n; ++i) {
            std::string name = sqlite3_column_name(stmt_, i);
            switch (sqlite3_column_type(stmt_, i)) {
                case SQLITE_INTEGER: row[name] = static_cast<int64_t>(sqlite3_column_int64(stmt_, i)); break;
                case SQLITE_FLOAT:   row[name] = sqlite3_column_double(stmt_, i); break;
                case SQLITE_NULL:    row[name] = nullptr; break;
                default: {
                    // TEXT and BLOB
                    auto* data = static_cast<const char*>(sqlite3_column_blob(stmt_, i));
                    int len = sqlite3_column_bytes(stmt_, i);
                    row[name] = data ? std::string(data, len) : std::string();
                }
            }
        }
        return row;
    }

private:
    sqlite3_stmt* stmt_;
};

class SqliteDriver final : public Driver {
public:
    using Driver::Driver;
    ~SqliteDriver() override { disconnect(); }

    void connect() override {
        if (db_) return;
        const std::string& path = settings_.getPath().empty() ? settings_.getSchema() : settings_.getPath();
        if (sqlite3_open(path.c_str(), &db_) != SQLITE_OK) {
            std::string err = db_ ? sqlite3_errmsg(db_) : "out of memory";
            disconnect();
            DBAL_BACKEND("Failed to open SQLite DB %s: %s", path.c_str(), err.c_str());
        }
        DBAL_LOG_INFO("sqlite", "opened %s", path.c_str());
    }

    void disconnect() override {
        if (db_) {
            sqlite3_close(db_);
            db_ = nullptr;
        }
    }

    int64_t write(const std::string& sql) override {
        sqlite3_stmt* stmt = prepare(sql);
        int rc = sqlite3_step(stmt);
        sqlite3_finalize(stmt);
        if (rc != SQLITE_DONE && rc != SQLITE_ROW) {
            DBAL_BACKEND("SQLite exec failed: %s [%s]", sqlite3_errmsg(db_), sql.c_str());
        }
        return sqlite3_changes(db_);
    }

    std::unique_ptr<ResultSet> read(const std::string& sql) override {
        return std::make_unique<SqliteResultSet>(prepare(sql));
    }

    int64_t lastInsertId() override {
        if (!db_) DBAL_BACKEND("lastInsertId: not connected");
        return sqlite3_last_insert_rowid(db_);
    }

    PDialect dialect() const override { return dialect_; }

private:
    sqlite3_stmt* prepare(const std::string& sql) {
        connect();
        DBAL_LOG_SQL("sqlite", sql);
        sqlite3_stmt* stmt = nullptr;
        if (sqlite3_prepare_v2(db_, sql.c_str(), static_cast<int>(sql.size()) + 1, &stmt, nullptr) != SQLITE_OK) {
            DBAL_BACKEND("SQLite prepare failed: %s [%s]", sqlite3_errmsg(db_), sql.c_str());
        }
        return stmt;
    }

    sqlite3* db_ = nullptr;
    PDialect dialect_ = make_sqlite_dialect();
};

}

PDriver make_sqlite_driver(const Settings& settings) {
    return std::make_shared<SqliteDriver>(settings);
}

} // namespace dbal
