// driver_postgres.cpp
#include "dbal/driver.hpp"

#if HAVE_POSTGRESQL
#include <libpq-fe.h>
#include <cstdlib>
#include "dbal/lib.hpp"
#include "dbal/log.hpp"

namespace dbal {

namespace {

// Type OIDs from pg_type.h
constexpr Oid BOOLOID = 16;
constexpr Oid INT8OID = 20;
constexpr Oid INT2OID = 21;
constexpr Oid INT4OID = 23;
constexpr Oid FLOAT4OID = 700;
constexpr Oid FLOAT8OID = 701;
constexpr Oid NUMERICOID = 1700;

/*=============================  PgResultSet  =============================*/
class PgResultSet final : public ResultSet {
public:
    explicit PgResultSet(PGresult* res)
        : res_(res), rows_(PQntuples(res)) { }
    ~PgResultSet() override {
        if (res_) PQclear(res_);
    }

    std::optional<Row> fetch() override {
        if (row_ >= rows_) return std::nullopt;
        Row row;
        int n = PQnfields(res_);
        for (int i = 0; i < n; ++i) {
            std::string name = PQfname(res_, i);
            if (PQgetisnull(res_, row_, i)) { row[name] = nullptr; continue; }
            const char* text = PQgetvalue(res_, row_, i);
            switch (PQftype(res_, i)) {
                case INT2OID:
                case INT4OID:
                case INT8OID:    row[name] = static_cast<int64_t>(std::strtoll(text, nullptr, 10)); break;
                case FLOAT4OID:
                case FLOAT8OID:
                case NUMERICOID: row[name] = std::strtod(text, nullptr); break;
                case BOOLOID:    row[name] = (text[0] == 't'); break;
                default:         row[name] = std::string(text, PQgetlength(res_, row_, i));
            }
        }
        ++row_;
        return row;
    }

private:
    PGresult* res_;
    int rows_;
    int row_ = 0;
};

/*=============================  PgDriver  =============================*/
class PgDriver final : public Driver {
public:
    using Driver::Driver;
    ~PgDriver() override { disconnect(); }

    void connect() override {
        if (conn_) return;
        conn_ = PQconnectdb(settings_.conninfo().c_str());
        if (!conn_ || PQstatus(conn_) != CONNECTION_OK) {
            std::string err = conn_ ? PQerrorMessage(conn_) : "no connection";
            disconnect();
            DBAL_BACKEND("Postgres connect failed: %s", err.c_str());
        }
        DBAL_LOG_INFO("postgres", "connected to %s:%d/%s", settings_.getServer().c_str(), settings_.getPort(),
                      settings_.getSchema().c_str());
    }

    void disconnect() override {
        if (conn_) {
            PQfinish(conn_);
            conn_ = nullptr;
        }
    }

    int64_t write(const std::string& sql) override {
        PGresult* res = exec(sql);
        const char* t = PQcmdTuples(res);
        int64_t rows = (t && *t) ? std::atoll(t) : 0;
        PQclear(res);
        return rows;
    }

    std::unique_ptr<ResultSet> read(const std::string& sql) override {
        return std::make_unique<PgResultSet>(exec(sql));
    }

    int64_t lastInsertId() override {
        auto row = read("SELECT lastval() AS id")->fetch();
        if (!row) DBAL_BACKEND("lastval() returned no rows");
        return std::get<int64_t>(row->at("id"));
    }

    PDialect dialect() const override { return dialect_; }

private:
    PGresult* exec(const std::string& sql) {
        connect();
        DBAL_LOG_SQL("postgres", sql);
        PGresult* res = PQexec(conn_, sql.c_str());
        if (!res) DBAL_BACKEND("Postgres error executing: %s", sql.c_str());
        auto st = PQresultStatus(res);
        if (st != PGRES_COMMAND_OK && st != PGRES_TUPLES_OK) {
            std::string err = PQerrorMessage(conn_);
            PQclear(res);
            DBAL_BACKEND("Postgres error: %s [%s]", err.c_str(), sql.c_str());
        }
        return res;
    }

    PGconn* conn_ = nullptr;
    PDialect dialect_ = make_pg_dialect();
};

}

PDriver make_postgres_driver(const Settings& settings) {
    return std::make_shared<PgDriver>(settings);
}

} // namespace dbal
#endif
